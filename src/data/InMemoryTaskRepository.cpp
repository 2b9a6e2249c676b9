#include "taskmgr/data/InMemoryTaskRepository.hpp"

#include "taskmgr/core/Logging.hpp"

namespace taskmgr {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<TaskItem> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<TaskItem> tasks;
    tasks.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        tasks.push_back(item);
    }
    return tasks;
}

std::optional<TaskItem> InMemoryTaskRepository::findById(qint64 id) const
{
    const auto it = m_items.constFind(id);
    if (it != m_items.constEnd()) {
        return it.value();
    }
    return std::nullopt;
}

TaskItem InMemoryTaskRepository::addTask(TaskItem task)
{
    m_items.insert(task.id, task);
    qCDebug(logData) << "stored task" << task.id << task.name;
    return task;
}

bool InMemoryTaskRepository::updateTask(const TaskItem &task)
{
    auto it = m_items.find(task.id);
    if (it == m_items.end()) {
        return false;
    }
    it.value() = task;
    return true;
}

bool InMemoryTaskRepository::removeTask(qint64 id)
{
    return m_items.remove(id) > 0;
}

} // namespace data
} // namespace taskmgr
