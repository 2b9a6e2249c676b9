#include "taskmgr/cli/CommandParser.hpp"

#include <QRegularExpression>

#include "taskmgr/cli/Tokenizer.hpp"
#include "taskmgr/core/CommandError.hpp"

namespace taskmgr {
namespace cli {

using core::CommandError;
using core::ErrorKind;

namespace {
bool isNumeral(const QString &text)
{
    static const QRegularExpression digits(QStringLiteral("^\\d+$"));
    return digits.match(text).hasMatch();
}

ArgumentValue classify(const Token &token, const ArgumentSpec &spec)
{
    ArgumentValue value;
    value.text = token.value;

    switch (spec.shape) {
    case ValueShape::Integer: {
        bool ok = false;
        const qint64 number = token.value.trimmed().toLongLong(&ok);
        if (!ok) {
            throw CommandError(ErrorKind::InvalidArgumentType,
                               QStringLiteral("%1 expects an integer, got '%2'").arg(token.key, token.value));
        }
        value.tag = ValueTag::Integer;
        value.integer = number;
        return value;
    }
    case ValueShape::Text:
        if (token.value.isEmpty() || (!token.quoted && isNumeral(token.value))) {
            throw CommandError(ErrorKind::InvalidArgumentType,
                               QStringLiteral("%1 expects text, got '%2'").arg(token.key, token.value));
        }
        return value;
    case ValueShape::Any:
        if (!token.quoted && isNumeral(token.value)) {
            value.tag = ValueTag::Integer;
            value.integer = token.value.toLongLong();
        }
        return value;
    }
    return value;
}
} // namespace

bool ParsedCommand::has(const QString &key) const
{
    return arguments.contains(key);
}

std::optional<ArgumentValue> ParsedCommand::value(const QString &key) const
{
    const auto it = arguments.constFind(key);
    if (it == arguments.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

ParsedCommand parseCommand(const TokenizedLine &line)
{
    const CommandSchema *schema = findSchema(line.command);
    if (!schema) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("unknown command %1").arg(line.command));
    }

    QHash<QString, const Token *> seen;
    for (const auto &token : line.tokens) {
        if (!schema->argument(token.key)) {
            throw CommandError(ErrorKind::TooManyArguments,
                               QStringLiteral("%1 does not take %2").arg(line.command, token.key));
        }
        if (seen.contains(token.key)) {
            throw CommandError(ErrorKind::TooManyArguments, QStringLiteral("%1 given twice").arg(token.key));
        }
        seen.insert(token.key, &token);
    }

    for (const auto &spec : schema->arguments) {
        if (spec.required && !seen.contains(QLatin1String(spec.key))) {
            throw CommandError(ErrorKind::MissingArguments,
                               QStringLiteral("%1 requires %2").arg(line.command, QLatin1String(spec.key)));
        }
    }

    ParsedCommand parsed;
    parsed.kind = schema->kind;
    for (const auto &token : line.tokens) {
        parsed.arguments.insert(token.key, classify(token, *schema->argument(token.key)));
    }
    return parsed;
}

} // namespace cli
} // namespace taskmgr
