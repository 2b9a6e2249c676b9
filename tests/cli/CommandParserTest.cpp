#include <QtTest/QtTest>

#include "taskmgr/cli/CommandParser.hpp"
#include "taskmgr/cli/Tokenizer.hpp"
#include "taskmgr/core/CommandError.hpp"

using namespace taskmgr;

Q_DECLARE_METATYPE(taskmgr::core::ErrorKind)

namespace {
cli::ParsedCommand parse(const QString &line)
{
    return cli::parseCommand(cli::Tokenizer::tokenize(line));
}
} // namespace

class CommandParserTest : public QObject
{
    Q_OBJECT

private slots:
    void everyCommandHasASchema();
    void parsesAdd();
    void tagsIntegers();
    void acceptsQuotedNumeralAsText();
    void rejects_data();
    void rejects();
};

void CommandParserTest::everyCommandHasASchema()
{
    for (const char *name : { "help", "print", "add", "list", "mod", "done", "delete" }) {
        const auto *schema = cli::findSchema(QLatin1String(name));
        QVERIFY2(schema != nullptr, name);
        QVERIFY(&cli::schemaFor(schema->kind) == schema);
    }
    QVERIFY(cli::findSchema("remove") == nullptr);
    QVERIFY(cli::findSchema("ADD") == nullptr);
}

void CommandParserTest::parsesAdd()
{
    const auto parsed = parse(R"(add name="VV Specification" due=31-10-2025 prio=HIGH)");
    QVERIFY(parsed.kind == cli::CommandKind::Add);
    QCOMPARE(parsed.arguments.size(), 3);
    QCOMPARE(parsed.value("name")->text, QStringLiteral("VV Specification"));
    QCOMPARE(parsed.value("due")->text, QStringLiteral("31-10-2025"));
    QVERIFY(!parsed.has("type"));
}

void CommandParserTest::tagsIntegers()
{
    const auto parsed = parse(R"(mod id="3" property=desc new_val=42)");
    QVERIFY(parsed.kind == cli::CommandKind::Modify);
    QVERIFY(parsed.value("id")->tag == cli::ValueTag::Integer);
    QCOMPARE(parsed.value("id")->integer, qint64(3));
    QVERIFY(parsed.value("new_val")->tag == cli::ValueTag::Integer);
    QVERIFY(parsed.value("property")->tag == cli::ValueTag::Text);
}

void CommandParserTest::acceptsQuotedNumeralAsText()
{
    const auto parsed = parse(R"(add name="2025")");
    QVERIFY(parsed.value("name")->tag == cli::ValueTag::Text);
    QCOMPARE(parsed.value("name")->text, QStringLiteral("2025"));
}

void CommandParserTest::rejects_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<core::ErrorKind>("kind");

    QTest::newRow("unknown command") << "remove id=0" << core::ErrorKind::InvalidArgument;
    QTest::newRow("help with args") << "help topic=add" << core::ErrorKind::TooManyArguments;
    QTest::newRow("unknown key") << R"(add name="x" owner="me")" << core::ErrorKind::TooManyArguments;
    QTest::newRow("duplicate key") << R"(add name="x" name="y")" << core::ErrorKind::TooManyArguments;
    QTest::newRow("unknown before missing") << R"(add type="x" color=red)" << core::ErrorKind::TooManyArguments;
    QTest::newRow("add without name") << R"(add type="x")" << core::ErrorKind::MissingArguments;
    QTest::newRow("list without val") << R"(list property="type")" << core::ErrorKind::MissingArguments;
    QTest::newRow("mod without new_val") << "mod id=0 property=name" << core::ErrorKind::MissingArguments;
    QTest::newRow("done without id") << "done" << core::ErrorKind::MissingArguments;
    QTest::newRow("bare numeral name") << "add name=123" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("empty name") << R"(add name="")" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("numeral property") << "list property=5 val=x" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("text id") << "done id=abc" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("delete text id") << "delete id=abc" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("delete unknown key") << "delete id=0 name=x" << core::ErrorKind::TooManyArguments;
    QTest::newRow("quoted text id") << R"(mod id="first" property=name new_val=x)"
                                    << core::ErrorKind::InvalidArgumentType;
}

void CommandParserTest::rejects()
{
    QFETCH(QString, line);
    QFETCH(core::ErrorKind, kind);

    try {
        parse(line);
        QFAIL("expected CommandError");
    } catch (const core::CommandError &error) {
        QCOMPARE(QString::fromLatin1(core::errorKindName(error.kind())),
                 QString::fromLatin1(core::errorKindName(kind)));
    }
}

QTEST_GUILESS_MAIN(CommandParserTest)
#include "CommandParserTest.moc"
