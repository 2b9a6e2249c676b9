#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(logCore)
Q_DECLARE_LOGGING_CATEGORY(logData)
Q_DECLARE_LOGGING_CATEGORY(logCli)

namespace taskmgr {
namespace core {

// Installs the message handler. Records always go to stderr; when filePath is
// set they are appended to that file as well. Debug records are suppressed
// unless verbose is set.
void initLogging(const QString &filePath = QString(), bool verbose = false);

// Restores the default handler and closes the log file.
void shutdownLogging();

} // namespace core
} // namespace taskmgr
