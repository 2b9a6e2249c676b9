#include "taskmgr/core/Logging.hpp"

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(logCore, "taskmgr.core")
Q_LOGGING_CATEGORY(logData, "taskmgr.data")
Q_LOGGING_CATEGORY(logCli, "taskmgr.cli")

namespace taskmgr {
namespace core {

namespace {
std::unique_ptr<QFile> g_logFile;
QMutex g_logMutex;

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    const QString line = qFormatLogMessage(type, context, message) + QLatin1Char('\n');

    fprintf(stderr, "%s", line.toLocal8Bit().constData());

    QMutexLocker lock(&g_logMutex);
    if (g_logFile && g_logFile->isOpen()) {
        QTextStream stream(g_logFile.get());
        stream << line;
        stream.flush();
    }
}
} // namespace

void initLogging(const QString &filePath, bool verbose)
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}"));

    QLoggingCategory::setFilterRules(verbose ? QStringLiteral("taskmgr.*.debug=true")
                                             : QStringLiteral("taskmgr.*.debug=false"));

    if (!filePath.isEmpty()) {
        auto file = std::make_unique<QFile>(filePath);
        if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            QMutexLocker lock(&g_logMutex);
            g_logFile = std::move(file);
        } else {
            qCWarning(logCore) << "Failed to open log file:" << filePath << file->errorString();
        }
    }

    qInstallMessageHandler(messageHandler);

    qCDebug(logCore) << "Logging initialized" << (g_logFile ? QStringLiteral("-> %1").arg(filePath)
                                                            : QStringLiteral("(stderr only)"));
}

void shutdownLogging()
{
    qInstallMessageHandler(nullptr);
    QMutexLocker lock(&g_logMutex);
    g_logFile.reset();
}

} // namespace core
} // namespace taskmgr
