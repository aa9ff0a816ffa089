#include "planner/core/PlanHistory.hpp"

#include <QHash>

#include "planner/core/Logging.hpp"
#include "planner/data/TaskRepository.hpp"
#include "planner/engine/ScheduleOptimizer.hpp"

namespace planner {
namespace core {

PlanHistory::PlanHistory(data::TaskRepository &repository, std::size_t limit)
    : m_repository(repository)
    , m_limit(limit)
{
    m_entries.reserve(limit);
}

PlanHistory::~PlanHistory() = default;

bool PlanHistory::apply(const engine::OptimizationResult &result, const QString &label)
{
    QHash<QString, const data::Task *> adjusted;
    for (const data::Task &task : result.tasks) {
        adjusted.insert(task.id, &task);
    }

    Entry entry;
    entry.label = label;
    for (const engine::ScheduleChange &change : result.changes) {
        const auto stored = m_repository.findById(change.taskId);
        const data::Task *updated = adjusted.value(change.taskId, nullptr);
        if (!stored || !updated) {
            qCWarning(lcPlannerCore) << "skipping change for unknown task" << change.taskId;
            continue;
        }
        entry.before.push_back(*stored);
        entry.after.push_back(*updated);
    }
    if (entry.after.empty() || m_limit == 0) {
        return false;
    }
    if (!write(entry.after)) {
        if (!write(entry.before)) {
            qCWarning(lcPlannerCore) << "could not roll back plan" << label;
        }
        return false;
    }

    // Drop redoable plans past the current index.
    if (m_index < m_entries.size()) {
        m_entries.erase(m_entries.begin() + static_cast<long>(m_index), m_entries.end());
    }
    if (m_entries.size() == m_limit) {
        m_entries.erase(m_entries.begin());
        if (m_index > 0) {
            --m_index;
        }
    }
    m_entries.push_back(std::move(entry));
    m_index = m_entries.size();
    return true;
}

bool PlanHistory::canUndo() const
{
    return m_index > 0;
}

bool PlanHistory::canRedo() const
{
    return m_index < m_entries.size();
}

bool PlanHistory::undo()
{
    if (!canUndo()) {
        return false;
    }
    if (!write(m_entries[m_index - 1].before)) {
        return false;
    }
    --m_index;
    return true;
}

bool PlanHistory::redo()
{
    if (!canRedo()) {
        return false;
    }
    if (!write(m_entries[m_index].after)) {
        return false;
    }
    ++m_index;
    return true;
}

void PlanHistory::clear()
{
    m_entries.clear();
    m_index = 0;
}

std::size_t PlanHistory::count() const
{
    return m_entries.size();
}

QString PlanHistory::undoLabel() const
{
    if (!canUndo()) {
        return {};
    }
    return m_entries[m_index - 1].label;
}

bool PlanHistory::write(const std::vector<data::Task> &tasks)
{
    bool ok = true;
    for (const data::Task &task : tasks) {
        if (!m_repository.updateTask(task)) {
            qCWarning(lcPlannerCore) << "task" << task.id << "disappeared from the repository";
            ok = false;
        }
    }
    return ok;
}

} // namespace core
} // namespace planner
