#include "planner/data/Task.hpp"

namespace planner {
namespace data {

int duration(const Task &task)
{
    return static_cast<int>(task.startDate.daysTo(task.endDate));
}

bool covers(const Task &task, const QDate &date)
{
    return task.startDate <= date && date <= task.endDate;
}

QString priorityToString(TaskPriority priority)
{
    switch (priority) {
    case TaskPriority::P0:
        return QStringLiteral("P0");
    case TaskPriority::P2:
        return QStringLiteral("P2");
    case TaskPriority::P1:
    default:
        return QStringLiteral("P1");
    }
}

std::optional<TaskPriority> priorityFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("P0")) {
        return TaskPriority::P0;
    }
    if (normalized == QLatin1String("P1")) {
        return TaskPriority::P1;
    }
    if (normalized == QLatin1String("P2")) {
        return TaskPriority::P2;
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner
