#include "taskmgr/core/CommandError.hpp"

namespace taskmgr {
namespace core {

const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::MissingArguments:
        return "MissingArguments";
    case ErrorKind::TooManyArguments:
        return "TooManyArguments";
    case ErrorKind::InvalidArgumentType:
        return "InvalidArgumentType";
    case ErrorKind::InvalidDateFormat:
        return "InvalidDateFormat";
    case ErrorKind::InvalidRepeat:
        return "InvalidRepeat";
    case ErrorKind::InvalidPriority:
        return "InvalidPriority";
    case ErrorKind::InvalidDoneStatus:
        return "InvalidDoneStatus";
    case ErrorKind::TaskNotFound:
        return "TaskNotFound";
    case ErrorKind::TooLongLine:
        return "TooLongLine";
    }
    return "InvalidArgument";
}

CommandError::CommandError(ErrorKind kind, const QString &detail)
    : std::runtime_error(detail.toStdString())
    , m_kind(kind)
{
}

ErrorKind CommandError::kind() const noexcept
{
    return m_kind;
}

QString CommandError::detail() const
{
    return QString::fromStdString(what());
}

} // namespace core
} // namespace taskmgr
