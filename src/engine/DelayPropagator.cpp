#include "planner/engine/DelayPropagator.hpp"

#include <QHash>
#include <QQueue>
#include <QSet>
#include <QStringList>

#include "planner/core/Logging.hpp"

namespace planner {
namespace engine {

std::vector<ImpactEntry> propagateDelay(const QString &projectId, int delayDays,
                                        const std::vector<data::Project> &projects,
                                        const std::vector<data::DependencyEdge> &edges,
                                        const std::atomic_bool *cancelled)
{
    QHash<QString, const data::Project *> byId;
    for (const data::Project &project : projects) {
        if (!byId.contains(project.id)) {
            byId.insert(project.id, &project);
        }
    }

    QHash<QString, QStringList> dependents;
    for (const data::DependencyEdge &edge : edges) {
        dependents[edge.sourceId] << edge.targetId;
    }

    struct Pending
    {
        QString projectId;
        int delay;
    };

    std::vector<ImpactEntry> impacted;
    QQueue<Pending> queue;
    queue.enqueue(Pending{ projectId, delayDays });
    QSet<QString> visited;

    while (!queue.isEmpty()) {
        if (cancelled && cancelled->load()) {
            qCDebug(lcPlannerEngine) << "delay propagation from" << projectId << "cancelled";
            break;
        }

        const Pending current = queue.dequeue();
        if (visited.contains(current.projectId)) {
            continue;
        }
        visited.insert(current.projectId);

        const data::Project *project = byId.value(current.projectId, nullptr);
        if (!project) {
            continue;
        }

        if (current.projectId != projectId) {
            ImpactEntry entry;
            entry.projectId = project->id;
            entry.projectName = project->name;
            entry.originalEndDate = project->endDate;
            entry.newEndDate = project->endDate.addDays(current.delay);
            entry.delayDays = current.delay;
            impacted.push_back(entry);
        }

        for (const QString &next : dependents.value(current.projectId)) {
            queue.enqueue(Pending{ next, current.delay });
        }
    }

    return impacted;
}

} // namespace engine
} // namespace planner
