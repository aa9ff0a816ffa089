#pragma once

#include <QDateTime>
#include <QStringList>
#include <optional>
#include <vector>

#include "planner/data/DependencyEdge.hpp"
#include "planner/data/Project.hpp"

namespace planner {
namespace engine {

// Infers project dependencies from shared resources and date proximity. Each pair of
// active or planning projects yields at most one edge, from the one listed first.
class DependencyGraphBuilder
{
public:
    explicit DependencyGraphBuilder(int proximityWindowDays = 7, int parallelThreshold = 64);

    std::vector<data::DependencyEdge> build(const std::vector<data::Project> &projects,
                                            const QDateTime &createdAt = QDateTime::currentDateTimeUtc()) const;

    // Distances count when strictly below windowDays.
    static std::optional<data::DependencyType> classifyTiming(const data::Project &first,
                                                              const data::Project &second, int windowDays);
    static QStringList sharedResources(const data::Project &first, const data::Project &second);

    // Flags edges whose endpoints both lie on the given project critical path.
    static void annotateCriticalEdges(std::vector<data::DependencyEdge> &edges, const QStringList &criticalPath);

private:
    std::vector<data::DependencyEdge> scanRow(const std::vector<const data::Project *> &candidates, int row,
                                              const QDateTime &createdAt) const;

    int m_proximityWindowDays;
    int m_parallelThreshold; // 0 disables the parallel scan
};

} // namespace engine
} // namespace planner
