#include "taskmgr/core/TaskStore.hpp"

#include "taskmgr/core/CommandError.hpp"
#include "taskmgr/core/Logging.hpp"
#include "taskmgr/data/TaskRepository.hpp"

namespace taskmgr {
namespace core {

namespace {
QDateTime currentSecond()
{
    const QDateTime now = QDateTime::currentDateTime();
    return now.addMSecs(-now.time().msec());
}

template <typename T>
const T &expect(const data::FieldValue &value, data::TaskField field)
{
    if (const auto *typed = std::get_if<T>(&value)) {
        return *typed;
    }
    throw CommandError(ErrorKind::InvalidArgumentType,
                       QStringLiteral("value does not fit field %1").arg(data::toString(field)));
}
} // namespace

TaskStore::TaskStore(std::unique_ptr<data::TaskRepository> repository, data::Priority defaultPriority, Clock clock)
    : m_repository(std::move(repository))
    , m_defaultPriority(defaultPriority)
    , m_clock(clock ? std::move(clock) : Clock(&currentSecond))
{
}

TaskStore::~TaskStore() = default;

qint64 TaskStore::add(const data::TaskDraft &draft)
{
    data::TaskItem task;
    task.id = m_nextId++;
    task.name = draft.name;
    task.type = draft.type.value_or(QString());
    task.description = draft.description.value_or(QString());
    task.due = draft.due.value_or(QDate());
    task.priority = draft.priority.value_or(m_defaultPriority);
    task.repeat = draft.repeat.value_or(data::Repeat::None);
    task.done = false;
    task.createdAt = m_clock();

    const auto stored = m_repository->addTask(std::move(task));
    qCDebug(logCore) << "added task" << stored.id;
    return stored.id;
}

void TaskStore::modify(qint64 id, data::TaskField field, const data::FieldValue &value)
{
    data::TaskItem task = require(id);
    if (isProtected(field)) {
        throw CommandError(ErrorKind::InvalidArgument,
                           QStringLiteral("field %1 cannot be modified").arg(data::toString(field)));
    }

    switch (field) {
    case data::TaskField::Name:
        task.name = expect<QString>(value, field);
        break;
    case data::TaskField::Type:
        task.type = expect<QString>(value, field);
        break;
    case data::TaskField::Description:
        task.description = expect<QString>(value, field);
        break;
    case data::TaskField::Due:
        task.due = expect<QDate>(value, field);
        break;
    case data::TaskField::Repeat:
        task.repeat = expect<data::Repeat>(value, field);
        break;
    case data::TaskField::Priority:
        task.priority = expect<data::Priority>(value, field);
        break;
    case data::TaskField::Done:
    case data::TaskField::CreatedAt:
    case data::TaskField::Id:
        break;
    }

    if (!m_repository->updateTask(task)) {
        throw CommandError(ErrorKind::TaskNotFound, QStringLiteral("task %1 vanished during update").arg(id));
    }
    qCDebug(logCore) << "modified task" << id << data::toString(field);
}

void TaskStore::complete(qint64 id)
{
    data::TaskItem task = require(id);
    if (task.done) {
        qCDebug(logCore) << "task" << id << "already completed";
        return;
    }
    task.done = true;
    if (!m_repository->updateTask(task)) {
        throw CommandError(ErrorKind::TaskNotFound, QStringLiteral("task %1 vanished during update").arg(id));
    }
    qCDebug(logCore) << "completed task" << id;
}

void TaskStore::remove(qint64 id)
{
    if (!m_repository->removeTask(id)) {
        throw CommandError(ErrorKind::TaskNotFound, QStringLiteral("no task with id %1").arg(id));
    }
    qCDebug(logCore) << "removed task" << id;
}

int TaskStore::removeMatching(const TaskFilter &filter)
{
    const auto matches = filterTasks(m_repository->fetchTasks(), filter);
    if (matches.empty()) {
        throw CommandError(ErrorKind::TaskNotFound,
                           QStringLiteral("no task with %1 '%2'").arg(data::toString(filter.field), filter.value));
    }
    int removed = 0;
    for (const auto &task : matches) {
        if (m_repository->removeTask(task.id)) {
            ++removed;
        }
    }
    qCDebug(logCore) << "removed" << removed << "tasks by" << data::toString(filter.field);
    return removed;
}

std::vector<data::TaskItem> TaskStore::tasks() const
{
    return m_repository->fetchTasks();
}

std::optional<data::TaskItem> TaskStore::find(qint64 id) const
{
    return m_repository->findById(id);
}

data::Priority TaskStore::defaultPriority() const
{
    return m_defaultPriority;
}

bool TaskStore::isProtected(data::TaskField field)
{
    return field == data::TaskField::Id || field == data::TaskField::CreatedAt || field == data::TaskField::Done;
}

data::TaskItem TaskStore::require(qint64 id) const
{
    auto task = m_repository->findById(id);
    if (!task.has_value()) {
        throw CommandError(ErrorKind::TaskNotFound, QStringLiteral("no task with id %1").arg(id));
    }
    return std::move(task.value());
}

} // namespace core
} // namespace taskmgr
