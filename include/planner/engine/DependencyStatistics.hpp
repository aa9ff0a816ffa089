#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "planner/data/DependencyEdge.hpp"
#include "planner/data/Project.hpp"

namespace planner {
namespace engine {

struct ProjectDegree
{
    QString id;
    QString name;
    int count = 0;
};

struct DependencyStats
{
    int totalDependencies = 0;
    int criticalDependencies = 0;
    std::optional<ProjectDegree> mostDependent; // highest in-degree
    std::optional<ProjectDegree> mostBlocking;  // highest out-degree
};

// Ties keep the project listed first; projects only known from edges come last.
DependencyStats aggregateDependencyStats(const std::vector<data::Project> &projects,
                                         const std::vector<data::DependencyEdge> &edges);

} // namespace engine
} // namespace planner
