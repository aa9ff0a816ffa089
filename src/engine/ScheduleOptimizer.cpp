#include "planner/engine/ScheduleOptimizer.hpp"

#include <QHash>
#include <QSet>
#include <algorithm>

#include "planner/core/Logging.hpp"
#include "planner/engine/TaskGraph.hpp"

namespace planner {
namespace engine {

namespace {
// Lower priorities give way first.
int yieldRank(data::TaskPriority priority)
{
    switch (priority) {
    case data::TaskPriority::P2:
        return 0;
    case data::TaskPriority::P1:
        return 1;
    case data::TaskPriority::P0:
    default:
        return 2;
    }
}

// Sum over days and pooled resources of the active tasks above capacity.
int overloadUnitDays(const std::vector<data::Task> &tasks, const std::vector<data::ResourcePoolItem> &pool)
{
    const QDate first = earliestStart(tasks);
    const QDate last = latestEnd(tasks);
    if (!first.isValid() || !last.isValid()) {
        return 0;
    }

    int total = 0;
    for (QDate date = first; date <= last; date = date.addDays(1)) {
        for (const data::ResourcePoolItem &resource : pool) {
            int active = 0;
            for (const data::Task &task : tasks) {
                if (task.assignee == resource.id && data::covers(task, date)) {
                    ++active;
                }
            }
            total += std::max(0, active - resource.totalQuantity);
        }
    }
    return total;
}

QString changeReason(Strategy strategy)
{
    if (strategy == Strategy::Smoothing) {
        return QStringLiteral("Resource smoothing: moved within available float");
    }
    return QStringLiteral("Resource leveling: moved to resolve an over-allocation");
}
} // namespace

QString strategyToString(Strategy strategy)
{
    return strategy == Strategy::Leveling ? QStringLiteral("leveling") : QStringLiteral("smoothing");
}

std::optional<Strategy> strategyFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("smoothing")) {
        return Strategy::Smoothing;
    }
    if (normalized == QLatin1String("leveling")) {
        return Strategy::Leveling;
    }
    return std::nullopt;
}

ScheduleOptimizer::ScheduleOptimizer(int simulationPaddingDays)
    : m_simulationPaddingDays(std::max(0, simulationPaddingDays))
{
}

void ScheduleOptimizer::setCancellationFlag(const std::atomic_bool *cancelled)
{
    m_cancelled = cancelled;
}

OptimizationResult ScheduleOptimizer::optimize(const OptimizationRequest &request) const
{
    OptimizationResult result;
    result.tasks = request.tasks;
    if (result.tasks.empty()) {
        return result;
    }

    std::vector<data::Task> &working = result.tasks;
    std::stable_sort(working.begin(), working.end(), [](const data::Task &lhs, const data::Task &rhs) {
        return lhs.startDate < rhs.startDate;
    });

    const bool smoothing = request.strategy == Strategy::Smoothing;
    const QDate projectStart = earliestStart(working);
    const QDate originalEnd = latestEnd(working);
    const int originalDuration = static_cast<int>(projectStart.daysTo(originalEnd));

    result.criticalPath = computeCriticalPath(taskPathNodes(working, projectStart), request.links);
    const QSet<QString> critical(result.criticalPath.path.cbegin(), result.criticalPath.path.cend());
    QHash<QString, int> remainingSlack = result.criticalPath.slack;

    QSet<QString> allIds;
    for (const data::Task &task : working) {
        allIds.insert(task.id);
    }

    QDate trackedEnd = originalEnd;
    QSet<QString> visited;
    int peakOverload = 0;
    const qint64 maxDays = 2 * static_cast<qint64>(originalDuration) + m_simulationPaddingDays;

    for (qint64 day = 0; day < maxDays; ++day) {
        const QDate date = projectStart.addDays(day);
        if (smoothing && date > trackedEnd) {
            break;
        }
        if (visited.size() == allIds.size() && date > trackedEnd) {
            break;
        }
        if (m_cancelled && m_cancelled->load()) {
            qCDebug(lcPlannerEngine) << "optimization of" << request.project.id << "cancelled at" << date;
            result.cancelled = true;
            break;
        }

        for (const data::Task &task : working) {
            if (data::covers(task, date)) {
                visited.insert(task.id);
            }
        }

        for (const data::ResourcePoolItem &resource : request.resourcePool) {
            std::vector<std::size_t> active;
            for (std::size_t i = 0; i < working.size(); ++i) {
                if (working[i].assignee == resource.id && data::covers(working[i], date)) {
                    active.push_back(i);
                }
            }

            const int overload = static_cast<int>(active.size()) - resource.totalQuantity;
            if (overload <= 0) {
                continue;
            }
            peakOverload = std::max(peakOverload, overload);

            std::stable_sort(active.begin(), active.end(), [&](std::size_t lhs, std::size_t rhs) {
                const bool lhsCritical = critical.contains(working[lhs].id);
                const bool rhsCritical = critical.contains(working[rhs].id);
                if (lhsCritical != rhsCritical) {
                    return !lhsCritical;
                }
                return yieldRank(working[lhs].priority) < yieldRank(working[rhs].priority);
            });

            int resolved = 0;
            for (std::size_t index : active) {
                if (resolved >= overload) {
                    break;
                }
                data::Task &task = working[index];
                if (smoothing) {
                    // Each shift spends a day of the task's own float and may not cross the
                    // project end. Links are not re-checked, so a predecessor may slide past
                    // the start of its successor.
                    int &slack = remainingSlack[task.id];
                    if (slack <= 0 || task.endDate.addDays(1) > trackedEnd) {
                        continue;
                    }
                    --slack;
                    task.startDate = task.startDate.addDays(1);
                    task.endDate = task.endDate.addDays(1);
                } else {
                    // One-day shifts repeat until the task no longer occupies the overloaded day.
                    while (data::covers(task, date)) {
                        task.startDate = task.startDate.addDays(1);
                        task.endDate = task.endDate.addDays(1);
                    }
                    if (task.endDate > trackedEnd) {
                        trackedEnd = task.endDate;
                    }
                }
                ++resolved;
            }
        }
    }

    QHash<QString, const data::Task *> originals;
    for (const data::Task &task : request.tasks) {
        if (!originals.contains(task.id)) {
            originals.insert(task.id, &task);
        }
    }
    for (const data::Task &task : working) {
        const data::Task *original = originals.value(task.id, nullptr);
        if (!original || original->startDate == task.startDate) {
            continue;
        }
        ScheduleChange change;
        change.taskId = task.id;
        change.taskName = task.name;
        change.originalStart = original->startDate;
        change.newStart = task.startDate;
        change.delayDays = static_cast<int>(original->startDate.daysTo(task.startDate));
        change.reason = changeReason(request.strategy);
        result.changes.push_back(change);
    }

    result.metrics.originalDuration = originalDuration;
    result.metrics.newDuration = static_cast<int>(projectStart.daysTo(trackedEnd));
    result.metrics.conflictsResolved =
        std::max(0, overloadUnitDays(request.tasks, request.resourcePool) - overloadUnitDays(working, request.resourcePool));
    result.metrics.resourcePeakReduced = peakOverload;

    qCDebug(lcPlannerEngine).nospace() << "optimized " << request.project.id << " (" << strategyToString(request.strategy)
                                       << "): " << result.metrics.conflictsResolved << " conflicts resolved, " << result.changes.size()
                                       << " tasks moved";
    return result;
}

} // namespace engine
} // namespace planner
