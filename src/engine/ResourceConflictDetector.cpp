#include "planner/engine/ResourceConflictDetector.hpp"

namespace planner {
namespace engine {

namespace {
QDate requirementEnd(const data::Project &project, const data::ResourceRequirement &requirement)
{
    if (requirement.duration <= 0) {
        return project.endDate;
    }
    switch (requirement.unit) {
    case data::DurationUnit::Day:
        return project.startDate.addDays(requirement.duration);
    case data::DurationUnit::Year:
        return project.startDate.addYears(requirement.duration);
    case data::DurationUnit::Month:
    default:
        return project.startDate.addMonths(requirement.duration);
    }
}

bool consumesResources(const data::Project &project)
{
    return project.status != data::ProjectStatus::Completed && project.status != data::ProjectStatus::Cancelled;
}
} // namespace

std::vector<ResourceConflict> detectResourceConflicts(const std::vector<data::Project> &projects,
                                                      const std::vector<data::ResourcePoolItem> &resources,
                                                      const QDate &fromMonth, const QDate &toMonth)
{
    std::vector<ResourceConflict> conflicts;
    if (!fromMonth.isValid() || !toMonth.isValid()) {
        return conflicts;
    }
    const QDate first(fromMonth.year(), fromMonth.month(), 1);
    const QDate last(toMonth.year(), toMonth.month(), 1);

    for (const data::ResourcePoolItem &resource : resources) {
        for (QDate month = first; month <= last; month = month.addMonths(1)) {
            ResourceConflict conflict;
            for (const data::Project &project : projects) {
                if (!consumesResources(project) || month < project.startDate || month > project.endDate) {
                    continue;
                }
                for (const data::ResourceRequirement &requirement : project.resourceRequirements) {
                    if (requirement.resourceId != resource.id || month > requirementEnd(project, requirement)) {
                        continue;
                    }
                    conflict.conflictingProjects.push_back(ResourceAllocation{ project.id, project.name, requirement.count });
                    conflict.allocated += requirement.count;
                }
            }

            if (conflict.allocated > resource.totalQuantity) {
                conflict.resourceId = resource.id;
                conflict.resourceName = resource.name;
                conflict.period = month.toString(QStringLiteral("yyyy-MM"));
                conflict.capacity = resource.totalQuantity;
                conflict.overallocation = conflict.allocated - resource.totalQuantity;
                conflicts.push_back(conflict);
            }
        }
    }
    return conflicts;
}

} // namespace engine
} // namespace planner
