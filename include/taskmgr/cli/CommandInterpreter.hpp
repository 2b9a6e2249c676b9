#pragma once

#include <QString>
#include <QStringList>
#include <optional>

#include "taskmgr/cli/Command.hpp"
#include "taskmgr/core/CommandError.hpp"

namespace taskmgr {
namespace core {
class TaskStore;
}

namespace cli {

struct CommandOutcome
{
    std::optional<core::ErrorKind> error;
    // Status line first, then any listing or help body.
    QStringList lines;

    bool succeeded() const { return !error.has_value(); }
};

// Runs one command line through tokenizer, parser, validator and the task
// store. A failing line leaves the store untouched.
class CommandInterpreter
{
public:
    explicit CommandInterpreter(core::TaskStore &store);

    CommandOutcome execute(const QString &line);

private:
    QStringList apply(const Command &command);

    QStringList run(const HelpCommand &command);
    QStringList run(const PrintCommand &command);
    QStringList run(const AddCommand &command);
    QStringList run(const ListCommand &command);
    QStringList run(const ModifyCommand &command);
    QStringList run(const DoneCommand &command);
    QStringList run(const DeleteCommand &command);
    QStringList run(const DeleteMatchingCommand &command);

    core::TaskStore &m_store;
};

} // namespace cli
} // namespace taskmgr
