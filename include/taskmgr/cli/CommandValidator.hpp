#pragma once

#include "taskmgr/cli/Command.hpp"

namespace taskmgr {
namespace cli {

struct ArgumentValue;
struct ParsedCommand;

// Turns a parsed command into a typed one. Stops at the first invalid field
// and throws core::CommandError with the matching kind.
Command validateCommand(const ParsedCommand &parsed);

// Validates a replacement value for `field` as given to mod.
data::FieldValue validateFieldValue(data::TaskField field, const ArgumentValue &value);

} // namespace cli
} // namespace taskmgr
