#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "taskmgr/cli/CommandInterpreter.hpp"
#include "taskmgr/cli/ScriptRunner.hpp"
#include "taskmgr/core/AppContext.hpp"
#include "taskmgr/core/Logging.hpp"
#include "taskmgr/core/Settings.hpp"

using namespace taskmgr;

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("taskmgr"));
    QCoreApplication::setApplicationName(QStringLiteral("taskmgr"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskmgrVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Command-driven task manager"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption priorityOption(QStringLiteral("default-priority"),
                                            QStringLiteral("Priority of tasks added without prio (LOW, MEDIUM, HIGH)."),
                                            QStringLiteral("priority"));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"),
                                           QStringLiteral("Append diagnostics to <file>."),
                                           QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringList{ QStringLiteral("v"), QStringLiteral("verbose") },
                                           QStringLiteral("Enable debug diagnostics."));
    parser.addOption(priorityOption);
    parser.addOption(logFileOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("input"), QStringLiteral("Command script, or - for standard input."));
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        fprintf(stderr, "%s\n", qPrintable(parser.helpText()));
        return 2;
    }

    QSettings store;
    core::Settings settings = core::loadSettings(store);
    if (parser.isSet(priorityOption) && !core::applyDefaultPriority(settings, parser.value(priorityOption))) {
        fprintf(stderr, "Unknown priority: %s\n", qPrintable(parser.value(priorityOption)));
        return 2;
    }
    if (parser.isSet(logFileOption)) {
        settings.logFilePath = parser.value(logFileOption);
    }
    if (parser.isSet(verboseOption)) {
        settings.verbose = true;
    }

    core::initLogging(settings.logFilePath, settings.verbose);

    const QString inputPath = positional.front();
    QFile inputFile;
    bool opened = false;
    if (inputPath == QLatin1String("-")) {
        opened = inputFile.open(stdin, QIODevice::ReadOnly | QIODevice::Text);
    } else {
        inputFile.setFileName(inputPath);
        opened = inputFile.open(QIODevice::ReadOnly | QIODevice::Text);
    }
    if (!opened) {
        qCCritical(logCore) << "Cannot read input" << inputPath << inputFile.errorString();
        core::shutdownLogging();
        return 2;
    }

    core::AppContext context(settings);
    cli::CommandInterpreter interpreter(context.taskStore());
    cli::ScriptRunner runner(interpreter);

    QTextStream input(&inputFile);
    input.setCodec("UTF-8");
    QFile outputFile;
    if (!outputFile.open(stdout, QIODevice::WriteOnly | QIODevice::Text)) {
        qCCritical(logCore) << "Cannot write to standard output";
        core::shutdownLogging();
        return 2;
    }
    QTextStream output(&outputFile);
    output.setCodec("UTF-8");

    runner.run(input, output);

    core::shutdownLogging();
    return 0;
}
