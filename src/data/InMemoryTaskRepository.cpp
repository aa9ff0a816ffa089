#include "planner/data/InMemoryTaskRepository.hpp"

#include <algorithm>

#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

namespace {
void sortBySchedule(std::vector<Task> &tasks)
{
    std::sort(tasks.begin(), tasks.end(), [](const Task &lhs, const Task &rhs) {
        if (lhs.startDate == rhs.startDate) {
            return lhs.id < rhs.id;
        }
        return lhs.startDate < rhs.startDate;
    });
}
} // namespace

InMemoryTaskRepository::InMemoryTaskRepository() = default;

InMemoryTaskRepository::InMemoryTaskRepository(const std::vector<Task> &tasks)
{
    for (const Task &task : tasks) {
        if (!addTask(task)) {
            qCWarning(lcPlannerData) << "skipping task without id or with duplicate id" << task.id;
        }
    }
}

InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<Task> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        tasks.push_back(item);
    }
    sortBySchedule(tasks);
    return tasks;
}

std::vector<Task> InMemoryTaskRepository::fetchTasks(const QString &projectId) const
{
    std::vector<Task> tasks;
    for (const auto &item : m_items) {
        if (item.projectId == projectId) {
            tasks.push_back(item);
        }
    }
    sortBySchedule(tasks);
    return tasks;
}

std::optional<Task> InMemoryTaskRepository::findById(const QString &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

bool InMemoryTaskRepository::addTask(const Task &task)
{
    if (task.id.isEmpty() || m_items.contains(task.id)) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

bool InMemoryTaskRepository::updateTask(const Task &task)
{
    if (!m_items.contains(task.id)) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

bool InMemoryTaskRepository::removeTask(const QString &id)
{
    return m_items.remove(id) > 0;
}

} // namespace data
} // namespace planner
