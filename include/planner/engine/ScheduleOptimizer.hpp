#pragma once

#include <QDate>
#include <QString>
#include <atomic>
#include <optional>
#include <vector>

#include "planner/data/Project.hpp"
#include "planner/data/ResourcePoolItem.hpp"
#include "planner/data/Task.hpp"
#include "planner/engine/CriticalPathAnalyzer.hpp"

namespace planner {
namespace engine {

enum class Strategy
{
    Smoothing, // only consumes float, never moves the project end
    Leveling,  // may extend the project to clear every overload
};

QString strategyToString(Strategy strategy);
std::optional<Strategy> strategyFromString(const QString &value);

struct OptimizationRequest
{
    data::Project project;
    std::vector<data::Task> tasks;
    // Precedence links between tasks. When empty, tasks are analyzed in start date order
    // without links, each released at its own start date.
    std::vector<PathEdge> links;
    std::vector<data::ResourcePoolItem> resourcePool;
    Strategy strategy = Strategy::Smoothing;
};

struct ScheduleChange
{
    QString taskId;
    QString taskName;
    QDate originalStart;
    QDate newStart;
    int delayDays = 0;
    QString reason;
};

struct OptimizationMetrics
{
    int originalDuration = 0;
    int newDuration = 0;
    int conflictsResolved = 0;
    int resourcePeakReduced = 0;
};

struct OptimizationResult
{
    std::vector<data::Task> tasks;
    std::vector<ScheduleChange> changes;
    OptimizationMetrics metrics;
    CriticalPathResult criticalPath; // of the input schedule
    bool cancelled = false;
};

// Greedy day-by-day resolution of resource overloads. Non-critical tasks yield first,
// then lower priorities. Slack comes from the input schedule and is never recomputed.
class ScheduleOptimizer
{
public:
    explicit ScheduleOptimizer(int simulationPaddingDays = 365);

    // Checked once per simulated day. The flag must outlive optimize().
    void setCancellationFlag(const std::atomic_bool *cancelled);

    OptimizationResult optimize(const OptimizationRequest &request) const;

private:
    int m_simulationPaddingDays;
    const std::atomic_bool *m_cancelled = nullptr;
};

} // namespace engine
} // namespace planner
