#include "planner/engine/DependencyStatistics.hpp"

#include <QHash>
#include <QStringList>

namespace planner {
namespace engine {

namespace {
std::optional<ProjectDegree> highest(const QStringList &order, const QHash<QString, int> &counts,
                                     const QHash<QString, QString> &names)
{
    std::optional<ProjectDegree> best;
    for (const QString &id : order) {
        const int count = counts.value(id);
        if (count > 0 && (!best || count > best->count)) {
            best = ProjectDegree{ id, names.value(id), count };
        }
    }
    return best;
}
} // namespace

DependencyStats aggregateDependencyStats(const std::vector<data::Project> &projects,
                                         const std::vector<data::DependencyEdge> &edges)
{
    QStringList order;
    QHash<QString, QString> names;
    for (const data::Project &project : projects) {
        if (!names.contains(project.id)) {
            order << project.id;
            names.insert(project.id, project.name);
        }
    }

    auto remember = [&](const QString &id) {
        if (!names.contains(id)) {
            order << id;
            names.insert(id, QString());
        }
    };

    DependencyStats stats;
    QHash<QString, int> incoming;
    QHash<QString, int> outgoing;
    for (const data::DependencyEdge &edge : edges) {
        remember(edge.sourceId);
        remember(edge.targetId);
        ++outgoing[edge.sourceId];
        ++incoming[edge.targetId];
        if (edge.critical) {
            ++stats.criticalDependencies;
        }
    }

    stats.totalDependencies = static_cast<int>(edges.size());
    stats.mostDependent = highest(order, incoming, names);
    stats.mostBlocking = highest(order, outgoing, names);
    return stats;
}

} // namespace engine
} // namespace planner
