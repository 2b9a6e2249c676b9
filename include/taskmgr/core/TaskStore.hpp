#pragma once

#include <QDateTime>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "taskmgr/core/TaskQuery.hpp"
#include "taskmgr/data/Task.hpp"

namespace taskmgr {
namespace data {
class TaskRepository;
}

namespace core {

// Sole owner of the task collection. Applies the identity and ownership
// rules: ids and creation times are assigned here and never change, and the
// done flag moves only through complete(). Ids of removed tasks are not
// handed out again.
class TaskStore
{
public:
    using Clock = std::function<QDateTime()>;

    explicit TaskStore(std::unique_ptr<data::TaskRepository> repository,
                       data::Priority defaultPriority = data::Priority::Medium,
                       Clock clock = Clock());
    ~TaskStore();

    TaskStore(const TaskStore &) = delete;
    TaskStore &operator=(const TaskStore &) = delete;

    qint64 add(const data::TaskDraft &draft);
    void modify(qint64 id, data::TaskField field, const data::FieldValue &value);
    void complete(qint64 id);
    void remove(qint64 id);
    // Removes every task the filter accepts and returns how many went.
    int removeMatching(const TaskFilter &filter);

    std::vector<data::TaskItem> tasks() const;
    std::optional<data::TaskItem> find(qint64 id) const;

    data::Priority defaultPriority() const;

    static bool isProtected(data::TaskField field);

private:
    data::TaskItem require(qint64 id) const;

    std::unique_ptr<data::TaskRepository> m_repository;
    data::Priority m_defaultPriority;
    Clock m_clock;
    qint64 m_nextId = 0;
};

} // namespace core
} // namespace taskmgr
