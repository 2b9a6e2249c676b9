#include "taskmgr/cli/CommandSchema.hpp"

namespace taskmgr {
namespace cli {

const ArgumentSpec *CommandSchema::argument(const QString &key) const
{
    for (const auto &spec : arguments) {
        if (key == QLatin1String(spec.key)) {
            return &spec;
        }
    }
    return nullptr;
}

const std::vector<CommandSchema> &commandSchemas()
{
    static const std::vector<CommandSchema> schemas = {
        { CommandKind::Help, "help", {} },
        { CommandKind::Print,
          "print",
          {
              { "sort_by", ValueShape::Text, false },
              { "direction", ValueShape::Text, false },
          } },
        { CommandKind::Add,
          "add",
          {
              { "name", ValueShape::Text, true },
              { "type", ValueShape::Text, false },
              { "desc", ValueShape::Text, false },
              { "due", ValueShape::Any, false },
              { "rep", ValueShape::Any, false },
              { "prio", ValueShape::Any, false },
          } },
        { CommandKind::List,
          "list",
          {
              { "property", ValueShape::Text, true },
              { "val", ValueShape::Any, true },
              { "sort_by", ValueShape::Text, false },
              { "direction", ValueShape::Text, false },
          } },
        { CommandKind::Modify,
          "mod",
          {
              { "id", ValueShape::Integer, true },
              { "property", ValueShape::Text, true },
              { "new_val", ValueShape::Any, true },
          } },
        { CommandKind::Done,
          "done",
          {
              { "id", ValueShape::Integer, true },
          } },
        // Either id alone or property with val; the validator enforces which.
        { CommandKind::Delete,
          "delete",
          {
              { "id", ValueShape::Integer, false },
              { "property", ValueShape::Text, false },
              { "val", ValueShape::Any, false },
          } },
    };
    return schemas;
}

const CommandSchema *findSchema(const QString &commandName)
{
    for (const auto &schema : commandSchemas()) {
        if (commandName == QLatin1String(schema.name)) {
            return &schema;
        }
    }
    return nullptr;
}

const CommandSchema &schemaFor(CommandKind kind)
{
    const auto &schemas = commandSchemas();
    return schemas.at(static_cast<size_t>(kind));
}

} // namespace cli
} // namespace taskmgr
