#include "taskmgr/cli/Tokenizer.hpp"

#include "taskmgr/core/CommandError.hpp"

namespace taskmgr {
namespace cli {

using core::CommandError;
using core::ErrorKind;

namespace {
bool isWordChar(QChar c)
{
    return c.isLetterOrNumber() || c == QLatin1Char('_');
}

bool isQuote(QChar c)
{
    return c == QLatin1Char('"') || c == QLatin1Char('\'');
}

// Surrogate pairs count as one character.
int characterCount(const QString &line)
{
    int count = 0;
    for (int i = 0; i < line.size(); ++i) {
        if (line.at(i).isHighSurrogate() && i + 1 < line.size() && line.at(i + 1).isLowSurrogate()) {
            ++i;
        }
        ++count;
    }
    return count;
}
} // namespace

void Tokenizer::Cursor::skipSpaces()
{
    while (!atEnd() && current().isSpace()) {
        advance();
    }
}

QString Tokenizer::Cursor::readWord()
{
    const int start = m_index;
    while (!atEnd() && isWordChar(current())) {
        advance();
    }
    return m_line.mid(start, m_index - start);
}

TokenizedLine Tokenizer::tokenize(const QString &line)
{
    const int length = characterCount(line);
    if (length > MaxLineLength) {
        throw CommandError(ErrorKind::TooLongLine, QStringLiteral("line has %1 characters").arg(length));
    }

    Cursor cursor(line);
    cursor.skipSpaces();

    TokenizedLine result;
    result.command = cursor.readWord();
    if (result.command.isEmpty()) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("missing command word"));
    }
    if (!cursor.atEnd() && !cursor.current().isSpace()) {
        throw CommandError(ErrorKind::InvalidArgument,
                           QStringLiteral("unexpected '%1' after command").arg(cursor.current()));
    }

    for (;;) {
        cursor.skipSpaces();
        if (cursor.atEnd()) {
            break;
        }
        result.tokens.push_back(readToken(cursor));
    }
    return result;
}

Token Tokenizer::readToken(Cursor &cursor)
{
    const int start = cursor.position();
    Token token;
    token.key = cursor.readWord();
    if (token.key.isEmpty()) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("stray text at column %1").arg(start));
    }

    cursor.skipSpaces();
    if (cursor.atEnd() || cursor.current() != QLatin1Char('=')) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("argument %1 has no value").arg(token.key));
    }
    cursor.advance();
    cursor.skipSpaces();
    if (cursor.atEnd()) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("argument %1 has no value").arg(token.key));
    }

    if (isQuote(cursor.current())) {
        token.value = readQuoted(cursor);
        token.quoted = true;
    } else {
        token.value = readBare(cursor);
    }
    return token;
}

QString Tokenizer::readQuoted(Cursor &cursor)
{
    const QChar quote = cursor.current();
    cursor.advance();
    QString value;
    while (!cursor.atEnd() && cursor.current() != quote) {
        value.append(cursor.current());
        cursor.advance();
    }
    if (cursor.atEnd()) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("unterminated quote"));
    }
    cursor.advance();
    if (!cursor.atEnd() && !cursor.current().isSpace()) {
        throw CommandError(ErrorKind::InvalidArgument, QStringLiteral("text directly after closing quote"));
    }
    return value;
}

QString Tokenizer::readBare(Cursor &cursor)
{
    QString value;
    while (!cursor.atEnd() && !cursor.current().isSpace()) {
        value.append(cursor.current());
        cursor.advance();
    }
    return value;
}

} // namespace cli
} // namespace taskmgr
