#pragma once

#include <QString>

#include "taskmgr/data/Task.hpp"

class QSettings;

namespace taskmgr {
namespace core {

struct Settings
{
    data::Priority defaultPriority = data::Priority::Medium;
    QString logFilePath;
    bool verbose = false;
};

constexpr auto DefaultPriorityKey = "defaults/priority";
constexpr auto LogFileKey = "logging/file";
constexpr auto VerboseKey = "logging/verbose";

// Reads stored preferences. Missing keys keep the built-in defaults; an
// unknown priority literal is logged and ignored.
Settings loadSettings(const QSettings &store);

// Applies a priority literal given on the command line. Returns false and
// leaves settings untouched if the literal is not LOW, MEDIUM or HIGH.
bool applyDefaultPriority(Settings &settings, const QString &literal);

} // namespace core
} // namespace taskmgr
