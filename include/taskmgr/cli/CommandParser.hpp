#pragma once

#include <QHash>
#include <QString>
#include <optional>

#include "taskmgr/cli/CommandSchema.hpp"

namespace taskmgr {
namespace cli {

struct TokenizedLine;

enum class ValueTag
{
    Text,
    Integer,
};

struct ArgumentValue
{
    ValueTag tag = ValueTag::Text;
    QString text;
    qint64 integer = 0;
};

struct ParsedCommand
{
    CommandKind kind = CommandKind::Help;
    QHash<QString, ArgumentValue> arguments;

    bool has(const QString &key) const;
    std::optional<ArgumentValue> value(const QString &key) const;
};

// Checks a tokenized line against the command schema table: command name,
// unknown or repeated keys, missing keys, and the coarse value shape.
// Throws core::CommandError on the first violation.
ParsedCommand parseCommand(const TokenizedLine &line);

} // namespace cli
} // namespace taskmgr
