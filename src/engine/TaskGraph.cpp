#include "planner/engine/TaskGraph.hpp"

#include <QQueue>
#include <QSet>
#include <algorithm>

namespace planner {
namespace engine {

std::vector<PathNode> taskPathNodes(const std::vector<data::Task> &tasks, const QDate &origin)
{
    std::vector<PathNode> nodes;
    nodes.reserve(tasks.size());
    for (const data::Task &task : tasks) {
        nodes.push_back(PathNode{ task.id, data::duration(task), static_cast<int>(origin.daysTo(task.startDate)) });
    }
    return nodes;
}

QDate earliestStart(const std::vector<data::Task> &tasks)
{
    QDate result;
    for (const data::Task &task : tasks) {
        if (!result.isValid() || task.startDate < result) {
            result = task.startDate;
        }
    }
    return result;
}

QDate latestEnd(const std::vector<data::Task> &tasks)
{
    QDate result;
    for (const data::Task &task : tasks) {
        if (!result.isValid() || task.endDate > result) {
            result = task.endDate;
        }
    }
    return result;
}

TaskGraph::TaskGraph(std::vector<data::Task> tasks)
    : m_tasks(std::move(tasks))
    , m_links(linksFromTasks(m_tasks))
{
    for (const PathEdge &link : m_links) {
        m_successors[link.from] << link.to;
        m_predecessors[link.to] << link.from;
    }
}

std::vector<PathEdge> TaskGraph::linksFromTasks(const std::vector<data::Task> &tasks)
{
    QSet<QString> known;
    for (const data::Task &task : tasks) {
        known.insert(task.id);
    }

    std::vector<PathEdge> links;
    for (const data::Task &task : tasks) {
        for (const QString &predecessor : task.predecessorIds) {
            if (known.contains(predecessor)) {
                links.push_back(PathEdge{ predecessor, task.id });
            }
        }
    }
    return links;
}

const std::vector<data::Task> &TaskGraph::tasks() const
{
    return m_tasks;
}

const std::vector<PathEdge> &TaskGraph::links() const
{
    return m_links;
}

bool TaskGraph::wouldCreateCycle(const QString &fromId, const QString &toId) const
{
    if (fromId == toId) {
        return true;
    }
    return allSuccessors(toId).contains(fromId);
}

QStringList TaskGraph::allPredecessors(const QString &id) const
{
    return collect(id, m_predecessors);
}

QStringList TaskGraph::allSuccessors(const QString &id) const
{
    return collect(id, m_successors);
}

QStringList TaskGraph::collect(const QString &id, const QHash<QString, QStringList> &adjacency) const
{
    QStringList result;
    QSet<QString> seen{ id };
    QQueue<QString> pending;
    pending.enqueue(id);
    while (!pending.isEmpty()) {
        const QString current = pending.dequeue();
        for (const QString &next : adjacency.value(current)) {
            if (seen.contains(next)) {
                continue;
            }
            seen.insert(next);
            result << next;
            pending.enqueue(next);
        }
    }
    return result;
}

CriticalPathResult TaskGraph::criticalPath() const
{
    std::vector<data::Task> ordered = m_tasks;
    std::stable_sort(ordered.begin(), ordered.end(), [](const data::Task &lhs, const data::Task &rhs) {
        return lhs.startDate < rhs.startDate;
    });
    return computeCriticalPath(taskPathNodes(ordered, earliestStart(ordered)), m_links);
}

std::vector<data::Task> TaskGraph::alignedToDependencies() const
{
    const QDate origin = earliestStart(m_tasks);
    const CriticalPathResult analysis = computeCriticalPath(taskPathNodes(m_tasks, origin), m_links);

    std::vector<data::Task> aligned = m_tasks;
    for (data::Task &task : aligned) {
        const auto finish = analysis.accumulated.constFind(task.id);
        if (finish == analysis.accumulated.constEnd()) {
            continue;
        }
        const int length = data::duration(task);
        task.startDate = origin.addDays(*finish - length);
        task.endDate = task.startDate.addDays(length);
    }
    return aligned;
}

} // namespace engine
} // namespace planner
