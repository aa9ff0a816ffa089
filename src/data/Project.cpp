#include "planner/data/Project.hpp"

namespace planner {
namespace data {

int duration(const Project &project)
{
    return static_cast<int>(project.startDate.daysTo(project.endDate));
}

bool isSchedulable(const Project &project)
{
    return project.status == ProjectStatus::Active || project.status == ProjectStatus::Planning;
}

QString statusToString(ProjectStatus status)
{
    switch (status) {
    case ProjectStatus::Active:
        return QStringLiteral("active");
    case ProjectStatus::OnHold:
        return QStringLiteral("on-hold");
    case ProjectStatus::Completed:
        return QStringLiteral("completed");
    case ProjectStatus::Cancelled:
        return QStringLiteral("cancelled");
    case ProjectStatus::Planning:
    default:
        return QStringLiteral("planning");
    }
}

std::optional<ProjectStatus> statusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("planning")) {
        return ProjectStatus::Planning;
    }
    if (normalized == QLatin1String("active")) {
        return ProjectStatus::Active;
    }
    if (normalized == QLatin1String("on-hold")) {
        return ProjectStatus::OnHold;
    }
    if (normalized == QLatin1String("completed")) {
        return ProjectStatus::Completed;
    }
    if (normalized == QLatin1String("cancelled")) {
        return ProjectStatus::Cancelled;
    }
    return std::nullopt;
}

QString unitToString(DurationUnit unit)
{
    switch (unit) {
    case DurationUnit::Day:
        return QStringLiteral("day");
    case DurationUnit::Year:
        return QStringLiteral("year");
    case DurationUnit::Month:
    default:
        return QStringLiteral("month");
    }
}

std::optional<DurationUnit> unitFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("day")) {
        return DurationUnit::Day;
    }
    if (normalized == QLatin1String("month")) {
        return DurationUnit::Month;
    }
    if (normalized == QLatin1String("year")) {
        return DurationUnit::Year;
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner
