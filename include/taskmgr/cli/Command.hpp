#pragma once

#include <variant>

#include "taskmgr/core/TaskQuery.hpp"
#include "taskmgr/data/Task.hpp"

namespace taskmgr {
namespace cli {

struct HelpCommand
{
};

struct PrintCommand
{
    core::SortSpec sort;
};

struct AddCommand
{
    data::TaskDraft draft;
};

struct ListCommand
{
    core::TaskFilter filter;
    core::SortSpec sort;
};

struct ModifyCommand
{
    qint64 id = -1;
    data::TaskField field = data::TaskField::Name;
    data::FieldValue value;
};

struct DoneCommand
{
    qint64 id = -1;
};

struct DeleteCommand
{
    qint64 id = -1;
};

struct DeleteMatchingCommand
{
    core::TaskFilter filter;
};

using Command = std::variant<HelpCommand,
                             PrintCommand,
                             AddCommand,
                             ListCommand,
                             ModifyCommand,
                             DoneCommand,
                             DeleteCommand,
                             DeleteMatchingCommand>;

} // namespace cli
} // namespace taskmgr
