#pragma once

#include <optional>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::vector<Task> fetchTasks(const QString &projectId) const = 0;
    virtual std::optional<Task> findById(const QString &id) const = 0;
    virtual bool addTask(const Task &task) = 0;
    virtual bool updateTask(const Task &task) = 0;
    virtual bool removeTask(const QString &id) = 0;
};

} // namespace data
} // namespace planner
