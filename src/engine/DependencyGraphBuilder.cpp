#include "planner/engine/DependencyGraphBuilder.hpp"

#include <QFuture>
#include <QList>
#include <QSet>
#include <QtConcurrent/QtConcurrentMap>
#include <cstdlib>
#include <functional>

#include "planner/core/Logging.hpp"

namespace planner {
namespace engine {

DependencyGraphBuilder::DependencyGraphBuilder(int proximityWindowDays, int parallelThreshold)
    : m_proximityWindowDays(proximityWindowDays)
    , m_parallelThreshold(parallelThreshold)
{
}

std::vector<data::DependencyEdge> DependencyGraphBuilder::build(const std::vector<data::Project> &projects,
                                                                const QDateTime &createdAt) const
{
    std::vector<const data::Project *> candidates;
    for (const data::Project &project : projects) {
        if (data::isSchedulable(project)) {
            candidates.push_back(&project);
        }
    }

    std::vector<data::DependencyEdge> edges;
    if (candidates.size() < 2) {
        return edges;
    }

    const int rowCount = static_cast<int>(candidates.size()) - 1;
    if (m_parallelThreshold > 0 && static_cast<int>(candidates.size()) >= m_parallelThreshold) {
        QList<int> rows;
        rows.reserve(rowCount);
        for (int row = 0; row < rowCount; ++row) {
            rows << row;
        }
        const std::function<std::vector<data::DependencyEdge>(int)> scan = [&](int row) {
            return scanRow(candidates, row, createdAt);
        };
        QFuture<std::vector<data::DependencyEdge>> future = QtConcurrent::mapped(rows, scan);
        future.waitForFinished();
        // results() is ordered by row, so the output matches the sequential scan.
        const QList<std::vector<data::DependencyEdge>> perRow = future.results();
        for (const auto &rowEdges : perRow) {
            edges.insert(edges.end(), rowEdges.begin(), rowEdges.end());
        }
        qCDebug(lcPlannerEngine) << "scanned" << candidates.size() << "projects in parallel";
    } else {
        for (int row = 0; row < rowCount; ++row) {
            const auto rowEdges = scanRow(candidates, row, createdAt);
            edges.insert(edges.end(), rowEdges.begin(), rowEdges.end());
        }
    }

    qCDebug(lcPlannerEngine) << "inferred" << edges.size() << "dependencies among" << candidates.size() << "projects";
    return edges;
}

std::vector<data::DependencyEdge> DependencyGraphBuilder::scanRow(const std::vector<const data::Project *> &candidates,
                                                                  int row, const QDateTime &createdAt) const
{
    std::vector<data::DependencyEdge> edges;
    const data::Project &first = *candidates[static_cast<std::size_t>(row)];
    for (std::size_t column = static_cast<std::size_t>(row) + 1; column < candidates.size(); ++column) {
        const data::Project &second = *candidates[column];
        const QStringList shared = sharedResources(first, second);
        const auto timing = classifyTiming(first, second, m_proximityWindowDays);
        if (shared.isEmpty() && !timing) {
            continue;
        }

        data::DependencyEdge edge;
        edge.id = QStringLiteral("dep-%1-%2").arg(first.id, second.id);
        edge.sourceId = first.id;
        edge.sourceName = first.name;
        edge.targetId = second.id;
        edge.targetName = second.name;
        edge.type = timing.value_or(data::DependencyType::FinishToStart);
        if (timing == data::DependencyType::FinishToStart) {
            edge.lagDays = static_cast<int>(first.endDate.daysTo(second.startDate));
        }
        edge.description = shared.isEmpty() ? QStringLiteral("Temporal dependency")
                                            : QStringLiteral("Shared resources: %1").arg(shared.join(QStringLiteral(", ")));
        edge.status = data::DependencyStatus::Active;
        edge.createdAt = createdAt;
        edges.push_back(edge);
    }
    return edges;
}

std::optional<data::DependencyType> DependencyGraphBuilder::classifyTiming(const data::Project &first,
                                                                           const data::Project &second, int windowDays)
{
    if (second.startDate > first.endDate && first.endDate.daysTo(second.startDate) < windowDays) {
        return data::DependencyType::FinishToStart;
    }
    if (std::abs(first.startDate.daysTo(second.startDate)) < windowDays) {
        return data::DependencyType::StartToStart;
    }
    if (std::abs(first.endDate.daysTo(second.endDate)) < windowDays) {
        return data::DependencyType::FinishToFinish;
    }
    return std::nullopt;
}

QStringList DependencyGraphBuilder::sharedResources(const data::Project &first, const data::Project &second)
{
    QSet<QString> other;
    for (const data::ResourceRequirement &requirement : second.resourceRequirements) {
        other.insert(requirement.resourceId);
    }

    QStringList shared;
    for (const data::ResourceRequirement &requirement : first.resourceRequirements) {
        if (other.contains(requirement.resourceId) && !shared.contains(requirement.resourceId)) {
            shared << requirement.resourceId;
        }
    }
    return shared;
}

void DependencyGraphBuilder::annotateCriticalEdges(std::vector<data::DependencyEdge> &edges,
                                                   const QStringList &criticalPath)
{
    const QSet<QString> onPath(criticalPath.cbegin(), criticalPath.cend());
    for (data::DependencyEdge &edge : edges) {
        edge.critical = onPath.contains(edge.sourceId) && onPath.contains(edge.targetId);
    }
}

} // namespace engine
} // namespace planner
