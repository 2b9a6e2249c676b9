#pragma once

#include <QMap>

#include "taskmgr/data/TaskRepository.hpp"

namespace taskmgr {
namespace data {

// Keeps tasks keyed by id. The store hands out ids in increasing order, so
// iteration order is insertion order.
class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<TaskItem> fetchTasks() const override;
    std::optional<TaskItem> findById(qint64 id) const override;
    TaskItem addTask(TaskItem task) override;
    bool updateTask(const TaskItem &task) override;
    bool removeTask(qint64 id) override;

private:
    QMap<qint64, TaskItem> m_items;
};

} // namespace data
} // namespace taskmgr
