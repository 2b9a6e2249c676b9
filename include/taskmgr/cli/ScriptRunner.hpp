#pragma once

class QTextStream;
class QString;

namespace taskmgr {
namespace cli {

class CommandInterpreter;

struct RunSummary
{
    int processed = 0;
    int failed = 0;
    int skipped = 0;
};

// Feeds a command script to the interpreter one line at a time, in order.
// Blank lines and lines starting with '#' are skipped without output.
class ScriptRunner
{
public:
    explicit ScriptRunner(CommandInterpreter &interpreter);

    RunSummary run(QTextStream &input, QTextStream &output);

    static bool isSkippable(const QString &line);

private:
    CommandInterpreter &m_interpreter;
};

} // namespace cli
} // namespace taskmgr
