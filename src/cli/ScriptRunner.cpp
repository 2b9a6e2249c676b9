#include "taskmgr/cli/ScriptRunner.hpp"

#include <QString>
#include <QTextStream>

#include "taskmgr/cli/CommandInterpreter.hpp"
#include "taskmgr/core/Logging.hpp"

namespace taskmgr {
namespace cli {

ScriptRunner::ScriptRunner(CommandInterpreter &interpreter)
    : m_interpreter(interpreter)
{
}

RunSummary ScriptRunner::run(QTextStream &input, QTextStream &output)
{
    RunSummary summary;
    QString line;
    while (input.readLineInto(&line)) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (isSkippable(line)) {
            ++summary.skipped;
            continue;
        }

        const auto outcome = m_interpreter.execute(line);
        ++summary.processed;
        if (!outcome.succeeded()) {
            ++summary.failed;
        }
        for (const auto &text : outcome.lines) {
            output << text << '\n';
        }
        output.flush();
    }

    qCInfo(logCli) << "processed" << summary.processed << "commands," << summary.failed << "failed,"
                   << summary.skipped << "lines skipped";
    return summary;
}

bool ScriptRunner::isSkippable(const QString &line)
{
    const QString trimmed = line.trimmed();
    return trimmed.isEmpty() || trimmed.startsWith(QLatin1Char('#'));
}

} // namespace cli
} // namespace taskmgr
