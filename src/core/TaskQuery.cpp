#include "taskmgr/core/TaskQuery.hpp"

#include <algorithm>
#include <iterator>

namespace taskmgr {
namespace core {

namespace {
template <typename T>
int threeWay(const T &lhs, const T &rhs)
{
    if (lhs < rhs) {
        return -1;
    }
    if (rhs < lhs) {
        return 1;
    }
    return 0;
}

// Undated tasks sort after dated ones.
int compareDue(const QDate &lhs, const QDate &rhs)
{
    if (lhs.isValid() != rhs.isValid()) {
        return lhs.isValid() ? -1 : 1;
    }
    return threeWay(lhs, rhs);
}

int compareText(const QString &lhs, const QString &rhs)
{
    return QString::compare(lhs, rhs, Qt::CaseInsensitive);
}
} // namespace

bool TaskFilter::accepts(const data::TaskItem &task) const
{
    if (field == data::TaskField::Due) {
        const auto date = data::parseDueDate(value);
        if (date.has_value()) {
            return task.due == date.value();
        }
    }
    return data::fieldText(task, field).compare(value, Qt::CaseInsensitive) == 0;
}

int compareTasks(const data::TaskItem &lhs, const data::TaskItem &rhs, data::TaskField key)
{
    switch (key) {
    case data::TaskField::Name:
        return compareText(lhs.name, rhs.name);
    case data::TaskField::Type:
        return compareText(lhs.type, rhs.type);
    case data::TaskField::Description:
        return compareText(lhs.description, rhs.description);
    case data::TaskField::Due:
        return compareDue(lhs.due, rhs.due);
    case data::TaskField::Repeat:
        return threeWay(data::rank(lhs.repeat), data::rank(rhs.repeat));
    case data::TaskField::Priority:
        return threeWay(data::rank(lhs.priority), data::rank(rhs.priority));
    case data::TaskField::Done:
        return threeWay(lhs.done, rhs.done);
    case data::TaskField::CreatedAt:
        return threeWay(lhs.createdAt, rhs.createdAt);
    case data::TaskField::Id:
        return threeWay(lhs.id, rhs.id);
    }
    return 0;
}

std::vector<data::TaskItem> filterTasks(const std::vector<data::TaskItem> &tasks, const TaskFilter &filter)
{
    std::vector<data::TaskItem> matching;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(matching),
                 [&filter](const data::TaskItem &task) { return filter.accepts(task); });
    return matching;
}

void sortTasks(std::vector<data::TaskItem> &tasks, const SortSpec &spec)
{
    const bool descending = spec.direction == SortDirection::Descending;
    std::stable_sort(tasks.begin(), tasks.end(), [&spec, descending](const auto &lhs, const auto &rhs) {
        const int order = compareTasks(lhs, rhs, spec.key);
        return descending ? order > 0 : order < 0;
    });
}

std::optional<SortDirection> sortDirectionFromString(const QString &text)
{
    if (text == QLatin1String("asc")) {
        return SortDirection::Ascending;
    }
    if (text == QLatin1String("desc")) {
        return SortDirection::Descending;
    }
    return std::nullopt;
}

} // namespace core
} // namespace taskmgr
