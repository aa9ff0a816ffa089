#pragma once

#include <QDate>
#include <QString>
#include <memory>
#include <optional>
#include <vector>

#include "planner/core/EngineSettings.hpp"
#include "planner/data/DependencyEdge.hpp"
#include "planner/data/PortfolioReader.hpp"
#include "planner/engine/DelayPropagator.hpp"
#include "planner/engine/DependencyStatistics.hpp"
#include "planner/engine/ResourceConflictDetector.hpp"
#include "planner/engine/ScheduleOptimizer.hpp"

namespace planner {
namespace data {
class TaskRepository;
}

namespace core {

class PlanHistory;

class AppContext
{
public:
    explicit AppContext(EngineSettings settings = EngineSettings());
    ~AppContext();

    bool loadPortfolio(const QString &filePath, QString *errorMessage = nullptr);
    void setPortfolio(data::Portfolio portfolio);

    const EngineSettings &settings() const;
    const std::vector<data::Project> &projects() const;
    const std::vector<data::ResourcePoolItem> &resourcePool() const;
    std::optional<data::Project> findProject(const QString &id) const;

    data::TaskRepository &taskRepository();
    PlanHistory &planHistory();

    std::optional<engine::OptimizationResult> optimizeProject(const QString &projectId,
                                                              engine::Strategy strategy) const;
    // Inferred edges with the critical flag set from the portfolio critical path.
    std::vector<data::DependencyEdge> dependencies() const;
    engine::CriticalPathResult portfolioCriticalPath(const std::vector<data::DependencyEdge> &edges) const;
    std::vector<engine::ImpactEntry> simulateDelay(const QString &projectId, int delayDays) const;
    engine::DependencyStats dependencyStats(const std::vector<data::DependencyEdge> &edges) const;
    std::vector<engine::ResourceConflict> resourceConflicts(const QDate &fromMonth, const QDate &toMonth) const;

private:
    EngineSettings m_settings;
    std::vector<data::Project> m_projects;
    std::vector<data::ResourcePoolItem> m_resources;
    std::unique_ptr<data::TaskRepository> m_taskRepository;
    std::unique_ptr<PlanHistory> m_planHistory;
};

} // namespace core
} // namespace planner
