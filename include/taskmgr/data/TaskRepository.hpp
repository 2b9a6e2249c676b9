#pragma once

#include <optional>
#include <vector>

#include "taskmgr/data/Task.hpp"

namespace taskmgr {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<TaskItem> fetchTasks() const = 0;
    virtual std::optional<TaskItem> findById(qint64 id) const = 0;
    virtual TaskItem addTask(TaskItem task) = 0;
    virtual bool updateTask(const TaskItem &task) = 0;
    virtual bool removeTask(qint64 id) = 0;
};

} // namespace data
} // namespace taskmgr
