#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <optional>

namespace planner {
namespace data {

// Declared highest to lowest.
enum class TaskPriority
{
    P0,
    P1,
    P2,
};

struct Task
{
    QString id;
    QString name;
    QString projectId;
    QDate startDate;
    QDate endDate; // inclusive
    QString assignee;
    TaskPriority priority = TaskPriority::P1;
    QStringList predecessorIds;
};

int duration(const Task &task);
bool covers(const Task &task, const QDate &date);

QString priorityToString(TaskPriority priority);
std::optional<TaskPriority> priorityFromString(const QString &value);

} // namespace data
} // namespace planner
