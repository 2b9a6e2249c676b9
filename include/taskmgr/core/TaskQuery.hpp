#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "taskmgr/data/Task.hpp"

namespace taskmgr {
namespace core {

enum class SortDirection
{
    Ascending,
    Descending,
};

struct SortSpec
{
    data::TaskField key = data::TaskField::Name;
    SortDirection direction = SortDirection::Ascending;
};

struct TaskFilter
{
    data::TaskField field = data::TaskField::Name;
    QString value;

    // Case-insensitive match on the field's text form. Due dates also match
    // when value names the same day in a different spelling (5-1-2025).
    bool accepts(const data::TaskItem &task) const;
};

// Three-way comparison on a single key: negative, zero or positive.
int compareTasks(const data::TaskItem &lhs, const data::TaskItem &rhs, data::TaskField key);

std::vector<data::TaskItem> filterTasks(const std::vector<data::TaskItem> &tasks, const TaskFilter &filter);

// Stable in both directions: tasks with equal keys keep their relative order.
void sortTasks(std::vector<data::TaskItem> &tasks, const SortSpec &spec);

std::optional<SortDirection> sortDirectionFromString(const QString &text);

} // namespace core
} // namespace taskmgr
