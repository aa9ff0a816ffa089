#pragma once

#include <QDate>
#include <QString>
#include <vector>

#include "planner/data/Project.hpp"
#include "planner/data/ResourcePoolItem.hpp"

namespace planner {
namespace engine {

struct ResourceAllocation
{
    QString projectId;
    QString projectName;
    int count = 0;
};

struct ResourceConflict
{
    QString resourceId;
    QString resourceName;
    QString period; // yyyy-MM
    int capacity = 0;
    int allocated = 0;
    int overallocation = 0;
    std::vector<ResourceAllocation> conflictingProjects;
};

// A requirement counts for a month when the first of that month lies in both the project
// span and the requirement window. Completed and cancelled projects are skipped.
std::vector<ResourceConflict> detectResourceConflicts(const std::vector<data::Project> &projects,
                                                      const std::vector<data::ResourcePoolItem> &resources,
                                                      const QDate &fromMonth, const QDate &toMonth);

} // namespace engine
} // namespace planner
