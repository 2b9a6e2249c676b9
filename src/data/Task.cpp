#include "taskmgr/data/Task.hpp"

#include <QRegularExpression>

namespace taskmgr {
namespace data {

namespace {
const QString NoneText = QStringLiteral("NONE");
} // namespace

std::optional<Priority> priorityFromString(const QString &text)
{
    if (text == QLatin1String("LOW")) {
        return Priority::Low;
    }
    if (text == QLatin1String("MEDIUM")) {
        return Priority::Medium;
    }
    if (text == QLatin1String("HIGH")) {
        return Priority::High;
    }
    return std::nullopt;
}

QString toString(Priority priority)
{
    switch (priority) {
    case Priority::Low:
        return QStringLiteral("LOW");
    case Priority::Medium:
        return QStringLiteral("MEDIUM");
    case Priority::High:
        return QStringLiteral("HIGH");
    }
    return {};
}

int rank(Priority priority)
{
    return static_cast<int>(priority);
}

std::optional<Repeat> repeatFromString(const QString &text)
{
    if (text == QLatin1String("NONE")) {
        return Repeat::None;
    }
    if (text == QLatin1String("DAILY")) {
        return Repeat::Daily;
    }
    if (text == QLatin1String("WEEKLY")) {
        return Repeat::Weekly;
    }
    if (text == QLatin1String("MONTHLY")) {
        return Repeat::Monthly;
    }
    return std::nullopt;
}

QString toString(Repeat repeat)
{
    switch (repeat) {
    case Repeat::None:
        return QStringLiteral("NONE");
    case Repeat::Daily:
        return QStringLiteral("DAILY");
    case Repeat::Weekly:
        return QStringLiteral("WEEKLY");
    case Repeat::Monthly:
        return QStringLiteral("MONTHLY");
    }
    return {};
}

int rank(Repeat repeat)
{
    return static_cast<int>(repeat);
}

std::optional<TaskField> taskFieldFromString(const QString &text)
{
    static const struct
    {
        const char *name;
        TaskField field;
    } fields[] = {
        { "name", TaskField::Name },
        { "type", TaskField::Type },
        { "desc", TaskField::Description },
        { "due", TaskField::Due },
        { "rep", TaskField::Repeat },
        { "prio", TaskField::Priority },
        { "done", TaskField::Done },
        { "ctime", TaskField::CreatedAt },
        { "id", TaskField::Id },
    };
    for (const auto &entry : fields) {
        if (text == QLatin1String(entry.name)) {
            return entry.field;
        }
    }
    return std::nullopt;
}

QString toString(TaskField field)
{
    switch (field) {
    case TaskField::Name:
        return QStringLiteral("name");
    case TaskField::Type:
        return QStringLiteral("type");
    case TaskField::Description:
        return QStringLiteral("desc");
    case TaskField::Due:
        return QStringLiteral("due");
    case TaskField::Repeat:
        return QStringLiteral("rep");
    case TaskField::Priority:
        return QStringLiteral("prio");
    case TaskField::Done:
        return QStringLiteral("done");
    case TaskField::CreatedAt:
        return QStringLiteral("ctime");
    case TaskField::Id:
        return QStringLiteral("id");
    }
    return {};
}

std::optional<QDate> parseDueDate(const QString &text)
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d{1,2})-(\\d{1,2})-(\\d{4})$"));
    const auto match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int day = match.captured(1).toInt();
    const int month = match.captured(2).toInt();
    const int year = match.captured(3).toInt();
    if (!QDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return QDate(year, month, day);
}

QString formatDueDate(const QDate &date)
{
    if (!date.isValid()) {
        return NoneText;
    }
    return date.toString(QString::fromLatin1(DueDateFormat));
}

QString fieldText(const TaskItem &task, TaskField field)
{
    switch (field) {
    case TaskField::Name:
        return task.name;
    case TaskField::Type:
        return task.type.isEmpty() ? NoneText : task.type;
    case TaskField::Description:
        return task.description;
    case TaskField::Due:
        return formatDueDate(task.due);
    case TaskField::Repeat:
        return toString(task.repeat);
    case TaskField::Priority:
        return toString(task.priority);
    case TaskField::Done:
        return task.done ? QStringLiteral("True") : QStringLiteral("False");
    case TaskField::CreatedAt:
        return task.createdAt.toString(QString::fromLatin1(CreatedAtFormat));
    case TaskField::Id:
        return QString::number(task.id);
    }
    return {};
}

} // namespace data
} // namespace taskmgr
