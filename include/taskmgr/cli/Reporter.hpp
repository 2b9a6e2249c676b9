#pragma once

#include <QString>
#include <QStringList>
#include <vector>

#include "taskmgr/core/CommandError.hpp"
#include "taskmgr/data/Task.hpp"

namespace taskmgr {
namespace cli {

class Reporter
{
public:
    static QString success(const QString &commandText);
    static QString failure(core::ErrorKind kind, const QString &commandText);

    // Header followed by one row per task, columns separated by " | ".
    static QStringList taskTable(const std::vector<data::TaskItem> &tasks);
    static QString taskRow(const data::TaskItem &task);

    static QStringList helpText();
};

} // namespace cli
} // namespace taskmgr
