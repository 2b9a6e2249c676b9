#include "taskmgr/cli/CommandInterpreter.hpp"

#include "taskmgr/cli/CommandParser.hpp"
#include "taskmgr/cli/CommandValidator.hpp"
#include "taskmgr/cli/Reporter.hpp"
#include "taskmgr/cli/Tokenizer.hpp"
#include "taskmgr/core/Logging.hpp"
#include "taskmgr/core/TaskStore.hpp"

namespace taskmgr {
namespace cli {

CommandInterpreter::CommandInterpreter(core::TaskStore &store)
    : m_store(store)
{
}

CommandOutcome CommandInterpreter::execute(const QString &line)
{
    CommandOutcome outcome;
    try {
        const auto parsed = parseCommand(Tokenizer::tokenize(line));
        const auto body = apply(validateCommand(parsed));
        outcome.lines << Reporter::success(line) << body;
        qCDebug(logCli) << schemaFor(parsed.kind).name << "ok";
    } catch (const core::CommandError &error) {
        qCDebug(logCli) << core::errorKindName(error.kind()) << error.detail();
        outcome.error = error.kind();
        outcome.lines = QStringList{ Reporter::failure(error.kind(), line) };
    }
    return outcome;
}

QStringList CommandInterpreter::apply(const Command &command)
{
    return std::visit([this](const auto &typed) { return run(typed); }, command);
}

QStringList CommandInterpreter::run(const HelpCommand &)
{
    return Reporter::helpText();
}

QStringList CommandInterpreter::run(const PrintCommand &command)
{
    auto tasks = m_store.tasks();
    core::sortTasks(tasks, command.sort);
    return Reporter::taskTable(tasks);
}

QStringList CommandInterpreter::run(const AddCommand &command)
{
    m_store.add(command.draft);
    return {};
}

QStringList CommandInterpreter::run(const ListCommand &command)
{
    auto tasks = core::filterTasks(m_store.tasks(), command.filter);
    core::sortTasks(tasks, command.sort);
    return Reporter::taskTable(tasks);
}

QStringList CommandInterpreter::run(const ModifyCommand &command)
{
    m_store.modify(command.id, command.field, command.value);
    return {};
}

QStringList CommandInterpreter::run(const DoneCommand &command)
{
    m_store.complete(command.id);
    return {};
}

QStringList CommandInterpreter::run(const DeleteCommand &command)
{
    m_store.remove(command.id);
    return {};
}

QStringList CommandInterpreter::run(const DeleteMatchingCommand &command)
{
    m_store.removeMatching(command.filter);
    return {};
}

} // namespace cli
} // namespace taskmgr
