#include "planner/data/CalendarDate.hpp"

namespace planner {
namespace data {

namespace {
constexpr auto IsoDateFormat = "yyyy-MM-dd";
constexpr auto CompactDateFormat = "yyyyMMdd";
} // namespace

QDate parseCalendarDate(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.length() == 8) {
        return QDate::fromString(trimmed, QLatin1String(CompactDateFormat));
    }
    if (trimmed.length() == 10) {
        return QDate::fromString(trimmed, QLatin1String(IsoDateFormat));
    }
    return {};
}

QString formatCalendarDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(IsoDateFormat));
}

} // namespace data
} // namespace planner
