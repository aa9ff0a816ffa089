#include "planner/engine/CriticalPathAnalyzer.hpp"

#include <QQueue>
#include <algorithm>

#include "planner/core/Logging.hpp"

namespace planner {
namespace engine {

namespace {
constexpr std::size_t NoNode = static_cast<std::size_t>(-1);
} // namespace

bool CriticalPathResult::isEmpty() const
{
    return path.isEmpty();
}

bool CriticalPathResult::onPath(const QString &id) const
{
    return path.contains(id);
}

int CriticalPathResult::totalDuration() const
{
    if (path.isEmpty()) {
        return 0;
    }
    return accumulated.value(path.last());
}

CriticalPathResult computeCriticalPath(const std::vector<PathNode> &nodes, const std::vector<PathEdge> &edges)
{
    CriticalPathResult result;
    if (nodes.empty()) {
        return result;
    }

    // First occurrence wins when an id is listed twice.
    const std::size_t count = nodes.size();
    QHash<QString, std::size_t> indexOf;
    std::vector<bool> distinct(count, false);
    for (std::size_t i = 0; i < count; ++i) {
        if (!indexOf.contains(nodes[i].id)) {
            indexOf.insert(nodes[i].id, i);
            distinct[i] = true;
        }
    }

    std::vector<std::vector<std::size_t>> successors(count);
    std::vector<int> inDegree(count, 0);
    for (const PathEdge &edge : edges) {
        const auto from = indexOf.constFind(edge.from);
        const auto to = indexOf.constFind(edge.to);
        if (from == indexOf.constEnd() || to == indexOf.constEnd()) {
            qCDebug(lcPlannerEngine) << "ignoring edge with unknown endpoint" << edge.from << "->" << edge.to;
            continue;
        }
        successors[*from].push_back(*to);
        ++inDegree[*to];
    }

    std::vector<int> start(count);
    std::vector<std::size_t> predecessor(count, NoNode);
    QQueue<std::size_t> ready;
    for (std::size_t i = 0; i < count; ++i) {
        start[i] = nodes[i].releaseOffset;
        if (distinct[i] && inDegree[i] == 0) {
            ready.enqueue(i);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(count);
    while (!ready.isEmpty()) {
        const std::size_t current = ready.dequeue();
        order.push_back(current);
        const int finish = start[current] + nodes[current].duration;
        for (std::size_t next : successors[current]) {
            if (finish > start[next]) {
                start[next] = finish;
                predecessor[next] = current;
            }
            if (--inDegree[next] == 0) {
                ready.enqueue(next);
            }
        }
    }

    std::vector<bool> resolved(count, false);
    std::size_t terminal = NoNode;
    int terminalFinish = 0;
    for (std::size_t index : order) {
        resolved[index] = true;
        const int finish = start[index] + nodes[index].duration;
        result.topologicalOrder << nodes[index].id;
        result.accumulated.insert(nodes[index].id, finish);
        if (predecessor[index] != NoNode) {
            result.predecessor.insert(nodes[index].id, nodes[predecessor[index]].id);
        }
        if (terminal == NoNode || finish > terminalFinish) {
            terminal = index;
            terminalFinish = finish;
        }
    }

    for (std::size_t i = 0; i < count; ++i) {
        if (distinct[i] && !resolved[i]) {
            result.unresolved << nodes[i].id;
        }
    }
    if (!result.unresolved.isEmpty()) {
        qCDebug(lcPlannerEngine) << "cycle detected, excluded from critical path:" << result.unresolved;
    }

    if (terminal == NoNode) {
        return result;
    }

    // Backward pass. Successors stuck on a cycle are unresolved and do not constrain.
    std::vector<int> latestFinish(count, terminalFinish);
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const std::size_t index = *it;
        int latest = terminalFinish;
        for (std::size_t next : successors[index]) {
            if (resolved[next]) {
                latest = std::min(latest, latestFinish[next] - nodes[next].duration);
            }
        }
        latestFinish[index] = latest;
        result.slack.insert(nodes[index].id, latest - (start[index] + nodes[index].duration));
    }

    for (std::size_t index = terminal; index != NoNode; index = predecessor[index]) {
        result.path.prepend(nodes[index].id);
    }
    return result;
}

CriticalPathResult projectCriticalPath(const std::vector<data::Project> &projects,
                                       const std::vector<data::DependencyEdge> &edges)
{
    std::vector<PathNode> nodes;
    nodes.reserve(projects.size());
    for (const data::Project &project : projects) {
        nodes.push_back(PathNode{ project.id, data::duration(project), 0 });
    }

    std::vector<PathEdge> links;
    links.reserve(edges.size());
    for (const data::DependencyEdge &edge : edges) {
        links.push_back(PathEdge{ edge.sourceId, edge.targetId });
    }
    return computeCriticalPath(nodes, links);
}

} // namespace engine
} // namespace planner
