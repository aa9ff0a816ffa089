#pragma once

#include <QHash>

#include "planner/data/TaskRepository.hpp"

namespace planner {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    explicit InMemoryTaskRepository(const std::vector<Task> &tasks);
    ~InMemoryTaskRepository() override;

    std::vector<Task> fetchTasks() const override;
    std::vector<Task> fetchTasks(const QString &projectId) const override;
    std::optional<Task> findById(const QString &id) const override;
    bool addTask(const Task &task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(const QString &id) override;

private:
    QHash<QString, Task> m_items;
};

} // namespace data
} // namespace planner
