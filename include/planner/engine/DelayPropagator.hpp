#pragma once

#include <QDate>
#include <QString>
#include <atomic>
#include <vector>

#include "planner/data/DependencyEdge.hpp"
#include "planner/data/Project.hpp"

namespace planner {
namespace engine {

struct ImpactEntry
{
    QString projectId;
    QString projectName;
    QDate originalEndDate;
    QDate newEndDate;
    int delayDays = 0;
};

// Pushes every project downstream of projectId back by the same delayDays. Each project
// is reported once; the origin and unknown origins yield nothing.
std::vector<ImpactEntry> propagateDelay(const QString &projectId, int delayDays,
                                        const std::vector<data::Project> &projects,
                                        const std::vector<data::DependencyEdge> &edges,
                                        const std::atomic_bool *cancelled = nullptr);

} // namespace engine
} // namespace planner
