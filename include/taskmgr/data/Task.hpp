#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QtGlobal>
#include <optional>
#include <variant>

namespace taskmgr {
namespace data {

enum class Priority
{
    Low,
    Medium,
    High,
};

enum class Repeat
{
    None,
    Daily,
    Weekly,
    Monthly,
};

enum class TaskField
{
    Name,
    Type,
    Description,
    Due,
    Repeat,
    Priority,
    Done,
    CreatedAt,
    Id,
};

struct TaskItem
{
    qint64 id = -1;
    QString name;
    QString type;
    QString description;
    QDate due;
    Priority priority = Priority::Medium;
    Repeat repeat = Repeat::None;
    bool done = false;
    QDateTime createdAt;
};

// Fields supplied by an add command. Absent members take the store defaults.
struct TaskDraft
{
    QString name;
    std::optional<QString> type;
    std::optional<QString> description;
    std::optional<QDate> due;
    std::optional<Priority> priority;
    std::optional<Repeat> repeat;
};

// A validated replacement value for a single field. A null QDate clears the due date.
using FieldValue = std::variant<QString, qint64, QDate, bool, Priority, Repeat>;

constexpr auto DueDateFormat = "dd-MM-yyyy";
constexpr auto CreatedAtFormat = "d-M-yyyy hh:mm:ss";

std::optional<Priority> priorityFromString(const QString &text);
QString toString(Priority priority);
int rank(Priority priority);

std::optional<Repeat> repeatFromString(const QString &text);
QString toString(Repeat repeat);
int rank(Repeat repeat);

std::optional<TaskField> taskFieldFromString(const QString &text);
QString toString(TaskField field);

// Parses DD-MM-YYYY (one- or two-digit day and month). Returns nullopt unless
// the text is well formed and names a real calendar day.
std::optional<QDate> parseDueDate(const QString &text);
QString formatDueDate(const QDate &date);

// Text form of a field as printed in listings and matched by filters.
QString fieldText(const TaskItem &task, TaskField field);

} // namespace data
} // namespace taskmgr
