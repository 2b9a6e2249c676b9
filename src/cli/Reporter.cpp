#include "taskmgr/cli/Reporter.hpp"

namespace taskmgr {
namespace cli {

namespace {
const QString ColumnSeparator = QStringLiteral(" | ");

const data::TaskField Columns[] = {
    data::TaskField::Name,
    data::TaskField::Type,
    data::TaskField::Description,
    data::TaskField::Due,
    data::TaskField::Repeat,
    data::TaskField::Priority,
    data::TaskField::Done,
    data::TaskField::CreatedAt,
    data::TaskField::Id,
};
} // namespace

QString Reporter::success(const QString &commandText)
{
    return QStringLiteral("Command success: %1").arg(commandText);
}

QString Reporter::failure(core::ErrorKind kind, const QString &commandText)
{
    return QStringLiteral("Error %1: %2").arg(QLatin1String(core::errorKindName(kind)), commandText);
}

QStringList Reporter::taskTable(const std::vector<data::TaskItem> &tasks)
{
    QStringList lines;
    lines.reserve(static_cast<int>(tasks.size()) + 1);
    lines << QStringLiteral("Name | Type | Desc | Due | Rep | Prio | Done | Ctime | Id");
    for (const auto &task : tasks) {
        lines << taskRow(task);
    }
    return lines;
}

QString Reporter::taskRow(const data::TaskItem &task)
{
    QStringList cells;
    for (const auto field : Columns) {
        cells << data::fieldText(task, field);
    }
    return cells.join(ColumnSeparator);
}

QStringList Reporter::helpText()
{
    return {
        QStringLiteral("help"),
        QStringLiteral("print [sort_by=<property>] [direction=<asc|desc>]"),
        QStringLiteral("add name=<name> [type=<type>] [desc=<desc>] [due=<DD-MM-YYYY>] "
                       "[rep=<NONE|DAILY|WEEKLY|MONTHLY>] [prio=<LOW|MEDIUM|HIGH>]"),
        QStringLiteral("list property=<property> val=<value> [sort_by=<property>] [direction=<asc|desc>]"),
        QStringLiteral("mod id=<id> property=<property> new_val=<value>"),
        QStringLiteral("done id=<id>"),
        QStringLiteral("delete id=<id> | delete property=<property> val=<value>"),
        QStringLiteral("properties: name type desc due rep prio done ctime id"),
    };
}

} // namespace cli
} // namespace taskmgr
