#include "planner/core/AppContext.hpp"

#include "planner/core/Logging.hpp"
#include "planner/core/PlanHistory.hpp"
#include "planner/data/InMemoryTaskRepository.hpp"
#include "planner/engine/CriticalPathAnalyzer.hpp"
#include "planner/engine/DependencyGraphBuilder.hpp"
#include "planner/engine/TaskGraph.hpp"

namespace planner {
namespace core {

AppContext::AppContext(EngineSettings settings)
    : m_settings(settings)
    , m_taskRepository(std::make_unique<data::InMemoryTaskRepository>())
    , m_planHistory(std::make_unique<PlanHistory>(*m_taskRepository))
{
}

AppContext::~AppContext() = default;

bool AppContext::loadPortfolio(const QString &filePath, QString *errorMessage)
{
    data::PortfolioReader reader(filePath);
    auto portfolio = reader.read(errorMessage);
    if (!portfolio) {
        return false;
    }
    setPortfolio(std::move(*portfolio));
    return true;
}

void AppContext::setPortfolio(data::Portfolio portfolio)
{
    m_projects = std::move(portfolio.projects);
    m_resources = std::move(portfolio.resources);
    // The history refers to the repository, so both are replaced together.
    m_planHistory.reset();
    m_taskRepository = std::make_unique<data::InMemoryTaskRepository>(portfolio.tasks);
    m_planHistory = std::make_unique<PlanHistory>(*m_taskRepository);
}

const EngineSettings &AppContext::settings() const
{
    return m_settings;
}

const std::vector<data::Project> &AppContext::projects() const
{
    return m_projects;
}

const std::vector<data::ResourcePoolItem> &AppContext::resourcePool() const
{
    return m_resources;
}

std::optional<data::Project> AppContext::findProject(const QString &id) const
{
    for (const data::Project &project : m_projects) {
        if (project.id == id) {
            return project;
        }
    }
    return std::nullopt;
}

data::TaskRepository &AppContext::taskRepository()
{
    return *m_taskRepository;
}

PlanHistory &AppContext::planHistory()
{
    return *m_planHistory;
}

std::optional<engine::OptimizationResult> AppContext::optimizeProject(const QString &projectId,
                                                                      engine::Strategy strategy) const
{
    const auto project = findProject(projectId);
    if (!project) {
        qCWarning(lcPlannerCore) << "unknown project" << projectId;
        return std::nullopt;
    }

    engine::OptimizationRequest request;
    request.project = *project;
    request.tasks = m_taskRepository->fetchTasks(projectId);
    request.links = engine::TaskGraph::linksFromTasks(request.tasks);
    request.resourcePool = m_resources;
    request.strategy = strategy;

    engine::ScheduleOptimizer optimizer(m_settings.simulationPaddingDays);
    return optimizer.optimize(request);
}

std::vector<data::DependencyEdge> AppContext::dependencies() const
{
    engine::DependencyGraphBuilder builder(m_settings.proximityWindowDays, m_settings.parallelThreshold);
    std::vector<data::DependencyEdge> edges = builder.build(m_projects);
    engine::DependencyGraphBuilder::annotateCriticalEdges(edges, portfolioCriticalPath(edges).path);
    return edges;
}

engine::CriticalPathResult AppContext::portfolioCriticalPath(const std::vector<data::DependencyEdge> &edges) const
{
    return engine::projectCriticalPath(m_projects, edges);
}

std::vector<engine::ImpactEntry> AppContext::simulateDelay(const QString &projectId, int delayDays) const
{
    return engine::propagateDelay(projectId, delayDays, m_projects, dependencies());
}

engine::DependencyStats AppContext::dependencyStats(const std::vector<data::DependencyEdge> &edges) const
{
    return engine::aggregateDependencyStats(m_projects, edges);
}

std::vector<engine::ResourceConflict> AppContext::resourceConflicts(const QDate &fromMonth, const QDate &toMonth) const
{
    return engine::detectResourceConflicts(m_projects, m_resources, fromMonth, toMonth);
}

} // namespace core
} // namespace planner
