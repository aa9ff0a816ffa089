#pragma once

#include <QDate>
#include <QString>

namespace planner {
namespace data {

// Accepts "yyyy-MM-dd" and the compact iCalendar form "yyyyMMdd".
QDate parseCalendarDate(const QString &value);
QString formatCalendarDate(const QDate &date);

} // namespace data
} // namespace planner
