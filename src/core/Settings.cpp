#include "taskmgr/core/Settings.hpp"

#include <QSettings>

#include "taskmgr/core/Logging.hpp"

namespace taskmgr {
namespace core {

Settings loadSettings(const QSettings &store)
{
    Settings settings;
    const QString priority = store.value(QLatin1String(DefaultPriorityKey)).toString();
    if (!priority.isEmpty() && !applyDefaultPriority(settings, priority)) {
        qCWarning(logCore) << "Ignoring unknown default priority" << priority << "in" << store.fileName();
    }
    settings.logFilePath = store.value(QLatin1String(LogFileKey), settings.logFilePath).toString();
    settings.verbose = store.value(QLatin1String(VerboseKey), settings.verbose).toBool();
    return settings;
}

bool applyDefaultPriority(Settings &settings, const QString &literal)
{
    const auto priority = data::priorityFromString(literal.trimmed().toUpper());
    if (!priority.has_value()) {
        return false;
    }
    settings.defaultPriority = priority.value();
    return true;
}

} // namespace core
} // namespace taskmgr
