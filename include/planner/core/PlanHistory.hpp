#pragma once

#include <QString>
#include <cstddef>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {
class TaskRepository;
}

namespace engine {
struct OptimizationResult;
}

namespace core {

// Writes optimization results into a task repository and keeps them undoable.
class PlanHistory
{
public:
    explicit PlanHistory(data::TaskRepository &repository, std::size_t limit = 20);
    ~PlanHistory();

    // Returns false when the result moves no task that the repository knows.
    bool apply(const engine::OptimizationResult &result, const QString &label = QString());
    bool canUndo() const;
    bool canRedo() const;
    bool undo();
    bool redo();
    void clear();
    std::size_t count() const;
    QString undoLabel() const;

private:
    struct Entry
    {
        QString label;
        std::vector<data::Task> before;
        std::vector<data::Task> after;
    };

    bool write(const std::vector<data::Task> &tasks);

    data::TaskRepository &m_repository;
    std::vector<Entry> m_entries;
    std::size_t m_index = 0;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace planner
