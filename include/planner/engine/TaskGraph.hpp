#pragma once

#include <QDate>
#include <QHash>
#include <QStringList>
#include <vector>

#include "planner/data/Task.hpp"
#include "planner/engine/CriticalPathAnalyzer.hpp"

namespace planner {
namespace engine {

// Tasks in the given order, each released at its own start relative to origin.
std::vector<PathNode> taskPathNodes(const std::vector<data::Task> &tasks, const QDate &origin);

QDate earliestStart(const std::vector<data::Task> &tasks);
QDate latestEnd(const std::vector<data::Task> &tasks);

// Precedence links from Task::predecessorIds. Unknown predecessors are dropped.
class TaskGraph
{
public:
    explicit TaskGraph(std::vector<data::Task> tasks);

    static std::vector<PathEdge> linksFromTasks(const std::vector<data::Task> &tasks);

    const std::vector<data::Task> &tasks() const;
    const std::vector<PathEdge> &links() const;

    // True when a link from -> to would close a cycle.
    bool wouldCreateCycle(const QString &fromId, const QString &toId) const;
    QStringList allPredecessors(const QString &id) const;
    QStringList allSuccessors(const QString &id) const;

    CriticalPathResult criticalPath() const;

    // Pushes each task to the earliest start its predecessors allow. Durations are kept and
    // no task moves earlier than its current start.
    std::vector<data::Task> alignedToDependencies() const;

private:
    QStringList collect(const QString &id, const QHash<QString, QStringList> &adjacency) const;

    std::vector<data::Task> m_tasks;
    std::vector<PathEdge> m_links;
    QHash<QString, QStringList> m_successors;
    QHash<QString, QStringList> m_predecessors;
};

} // namespace engine
} // namespace planner
