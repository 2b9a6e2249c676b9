#pragma once

#include <QString>
#include <stdexcept>

namespace taskmgr {
namespace core {

enum class ErrorKind
{
    InvalidArgument,
    MissingArguments,
    TooManyArguments,
    InvalidArgumentType,
    InvalidDateFormat,
    InvalidRepeat,
    InvalidPriority,
    InvalidDoneStatus,
    TaskNotFound,
    TooLongLine,
};

// Name printed in "Error <kind>: ..." lines.
const char *errorKindName(ErrorKind kind);

// Raised anywhere in the command pipeline. The detail text is for logs only;
// users only ever see the kind.
class CommandError : public std::runtime_error
{
public:
    CommandError(ErrorKind kind, const QString &detail);

    ErrorKind kind() const noexcept;
    QString detail() const;

private:
    ErrorKind m_kind;
};

} // namespace core
} // namespace taskmgr
