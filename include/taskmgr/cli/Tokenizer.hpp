#pragma once

#include <QString>
#include <vector>

namespace taskmgr {
namespace cli {

struct Token
{
    QString key;
    QString value;
    bool quoted = false;
};

struct TokenizedLine
{
    QString command;
    std::vector<Token> tokens;
};

// Splits `<command> key=value key="quoted value" ...` into its parts.
// Throws core::CommandError (TooLongLine, InvalidArgument) on malformed input.
class Tokenizer
{
public:
    // Measured in Unicode characters, not UTF-16 code units.
    static constexpr int MaxLineLength = 1024;

    static TokenizedLine tokenize(const QString &line);

private:
    class Cursor
    {
    public:
        explicit Cursor(const QString &line)
            : m_line(line)
        {
        }

        bool atEnd() const { return m_index >= m_line.size(); }
        QChar current() const { return m_line.at(m_index); }
        void advance() { ++m_index; }
        int position() const { return m_index; }

        void skipSpaces();
        QString readWord();

    private:
        const QString &m_line;
        int m_index = 0;
    };

    static Token readToken(Cursor &cursor);
    static QString readQuoted(Cursor &cursor);
    static QString readBare(Cursor &cursor);
};

} // namespace cli
} // namespace taskmgr
