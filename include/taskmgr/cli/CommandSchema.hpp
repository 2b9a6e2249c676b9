#pragma once

#include <QString>
#include <vector>

namespace taskmgr {
namespace cli {

enum class CommandKind
{
    Help,
    Print,
    Add,
    List,
    Modify,
    Done,
    Delete,
};

// Coarse shape a value must have before semantic validation.
enum class ValueShape
{
    Text,    // free-form string; an unquoted numeral or an empty value is rejected
    Integer, // decimal integer, quoted or not
    Any,
};

struct ArgumentSpec
{
    const char *key;
    ValueShape shape;
    bool required;
};

struct CommandSchema
{
    CommandKind kind;
    const char *name;
    std::vector<ArgumentSpec> arguments;

    const ArgumentSpec *argument(const QString &key) const;
};

const std::vector<CommandSchema> &commandSchemas();
const CommandSchema *findSchema(const QString &commandName);
const CommandSchema &schemaFor(CommandKind kind);

} // namespace cli
} // namespace taskmgr
