#include "taskmgr/cli/CommandValidator.hpp"

#include "taskmgr/cli/CommandParser.hpp"
#include "taskmgr/core/CommandError.hpp"

namespace taskmgr {
namespace cli {

using core::CommandError;
using core::ErrorKind;

namespace {
const QString NoneLiteral = QStringLiteral("NONE");

QDate validateDue(const QString &text)
{
    if (text == NoneLiteral) {
        return QDate();
    }
    const auto date = data::parseDueDate(text);
    if (!date.has_value()) {
        throw CommandError(ErrorKind::InvalidDateFormat, QStringLiteral("'%1' is not DD-MM-YYYY").arg(text));
    }
    return date.value();
}

data::Repeat validateRepeat(const QString &text)
{
    const auto repeat = data::repeatFromString(text);
    if (!repeat.has_value()) {
        throw CommandError(ErrorKind::InvalidRepeat, QStringLiteral("unknown repeat '%1'").arg(text));
    }
    return repeat.value();
}

data::Priority validatePriority(const QString &text)
{
    const auto priority = data::priorityFromString(text);
    if (!priority.has_value()) {
        throw CommandError(ErrorKind::InvalidPriority, QStringLiteral("unknown priority '%1'").arg(text));
    }
    return priority.value();
}

bool validateDoneStatus(const QString &text)
{
    if (text == QLatin1String("True")) {
        return true;
    }
    if (text == QLatin1String("False")) {
        return false;
    }
    throw CommandError(ErrorKind::InvalidDoneStatus, QStringLiteral("'%1' is not True or False").arg(text));
}

data::TaskField validateProperty(const QString &text)
{
    const auto field = data::taskFieldFromString(text);
    if (!field.has_value()) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("unknown property '%1'").arg(text));
    }
    return field.value();
}

core::SortSpec validateSort(const ParsedCommand &parsed)
{
    core::SortSpec sort;
    if (const auto sortBy = parsed.value(QStringLiteral("sort_by"))) {
        sort.key = validateProperty(sortBy->text);
    }
    if (const auto direction = parsed.value(QStringLiteral("direction"))) {
        const auto parsedDirection = core::sortDirectionFromString(direction->text);
        if (!parsedDirection.has_value()) {
            throw CommandError(ErrorKind::InvalidArgument,
                               QStringLiteral("unknown direction '%1'").arg(direction->text));
        }
        sort.direction = parsedDirection.value();
    }
    return sort;
}

AddCommand validateAdd(const ParsedCommand &parsed)
{
    AddCommand command;
    command.draft.name = parsed.value(QStringLiteral("name"))->text;
    if (const auto type = parsed.value(QStringLiteral("type"))) {
        command.draft.type = type->text;
    }
    if (const auto description = parsed.value(QStringLiteral("desc"))) {
        command.draft.description = description->text;
    }
    if (const auto due = parsed.value(QStringLiteral("due"))) {
        command.draft.due = validateDue(due->text);
    }
    if (const auto repeat = parsed.value(QStringLiteral("rep"))) {
        command.draft.repeat = validateRepeat(repeat->text);
    }
    if (const auto priority = parsed.value(QStringLiteral("prio"))) {
        command.draft.priority = validatePriority(priority->text);
    }
    return command;
}

ListCommand validateList(const ParsedCommand &parsed)
{
    ListCommand command;
    command.filter.field = validateProperty(parsed.value(QStringLiteral("property"))->text);
    command.filter.value = parsed.value(QStringLiteral("val"))->text;
    command.sort = validateSort(parsed);
    return command;
}

ModifyCommand validateModify(const ParsedCommand &parsed)
{
    ModifyCommand command;
    command.id = parsed.value(QStringLiteral("id"))->integer;
    command.field = validateProperty(parsed.value(QStringLiteral("property"))->text);
    command.value = validateFieldValue(command.field, *parsed.value(QStringLiteral("new_val")));
    return command;
}

Command validateDelete(const ParsedCommand &parsed)
{
    const QString propertyKey = QStringLiteral("property");
    const QString valueKey = QStringLiteral("val");
    if (const auto id = parsed.value(QStringLiteral("id"))) {
        if (parsed.has(propertyKey) || parsed.has(valueKey)) {
            throw CommandError(ErrorKind::TooManyArguments, QStringLiteral("delete takes id or property/val, not both"));
        }
        return DeleteCommand{ id->integer };
    }
    if (!parsed.has(propertyKey) || !parsed.has(valueKey)) {
        throw CommandError(ErrorKind::MissingArguments, QStringLiteral("delete needs id or property and val"));
    }
    DeleteMatchingCommand command;
    command.filter.field = validateProperty(parsed.value(propertyKey)->text);
    command.filter.value = parsed.value(valueKey)->text;
    return command;
}
} // namespace

data::FieldValue validateFieldValue(data::TaskField field, const ArgumentValue &value)
{
    switch (field) {
    case data::TaskField::Name:
    case data::TaskField::Type:
    case data::TaskField::Description:
        if (value.tag == ValueTag::Integer || value.text.isEmpty()) {
            throw CommandError(ErrorKind::InvalidArgumentType,
                               QStringLiteral("%1 expects text, got '%2'").arg(data::toString(field), value.text));
        }
        return value.text;
    case data::TaskField::CreatedAt:
        return value.text;
    case data::TaskField::Due:
        return validateDue(value.text);
    case data::TaskField::Repeat:
        return validateRepeat(value.text);
    case data::TaskField::Priority:
        return validatePriority(value.text);
    case data::TaskField::Done:
        return validateDoneStatus(value.text);
    case data::TaskField::Id: {
        bool ok = false;
        const qint64 id = value.text.toLongLong(&ok);
        if (!ok) {
            throw CommandError(ErrorKind::InvalidArgumentType,
                               QStringLiteral("id expects an integer, got '%1'").arg(value.text));
        }
        return id;
    }
    }
    return value.text;
}

Command validateCommand(const ParsedCommand &parsed)
{
    switch (parsed.kind) {
    case CommandKind::Help:
        return HelpCommand{};
    case CommandKind::Print:
        return PrintCommand{ validateSort(parsed) };
    case CommandKind::Add:
        return validateAdd(parsed);
    case CommandKind::List:
        return validateList(parsed);
    case CommandKind::Modify:
        return validateModify(parsed);
    case CommandKind::Done:
        return DoneCommand{ parsed.value(QStringLiteral("id"))->integer };
    case CommandKind::Delete:
        return validateDelete(parsed);
    }
    return HelpCommand{};
}

} // namespace cli
} // namespace taskmgr
