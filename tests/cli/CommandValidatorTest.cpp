#include <QtTest/QtTest>

#include "taskmgr/cli/CommandParser.hpp"
#include "taskmgr/cli/CommandValidator.hpp"
#include "taskmgr/cli/Tokenizer.hpp"
#include "taskmgr/core/CommandError.hpp"

using namespace taskmgr;

Q_DECLARE_METATYPE(taskmgr::core::ErrorKind)

namespace {
cli::Command validate(const QString &line)
{
    return cli::validateCommand(cli::parseCommand(cli::Tokenizer::tokenize(line)));
}
} // namespace

class CommandValidatorTest : public QObject
{
    Q_OBJECT

private slots:
    void addProducesTypedDraft();
    void addLeavesDefaultsOpen();
    void addDueNoneClears();
    void listWithSortOptions();
    void printDefaultsToNameAscending();
    void modDoneValueIsBoolean();
    void deleteSelectsByIdOrFilter();
    void rejects_data();
    void rejects();
};

void CommandValidatorTest::addProducesTypedDraft()
{
    const auto command = validate(R"(add name="Essay" type="School" desc="Draft" due=5-10-2025 rep=WEEKLY prio=HIGH)");
    const auto *add = std::get_if<cli::AddCommand>(&command);
    QVERIFY(add != nullptr);
    QCOMPARE(add->draft.name, QStringLiteral("Essay"));
    QCOMPARE(add->draft.type.value(), QStringLiteral("School"));
    QCOMPARE(add->draft.description.value(), QStringLiteral("Draft"));
    QCOMPARE(add->draft.due.value(), QDate(2025, 10, 5));
    QVERIFY(add->draft.repeat == data::Repeat::Weekly);
    QVERIFY(add->draft.priority == data::Priority::High);
}

void CommandValidatorTest::addLeavesDefaultsOpen()
{
    const auto command = validate(R"(add name="Plain")");
    const auto &add = std::get<cli::AddCommand>(command);
    QVERIFY(!add.draft.priority.has_value());
    QVERIFY(!add.draft.repeat.has_value());
    QVERIFY(!add.draft.due.has_value());
}

void CommandValidatorTest::addDueNoneClears()
{
    const auto command = validate(R"(add name="Later" due=NONE)");
    const auto &add = std::get<cli::AddCommand>(command);
    QVERIFY(add.draft.due.has_value());
    QVERIFY(!add.draft.due->isValid());
}

void CommandValidatorTest::listWithSortOptions()
{
    const auto command = validate(R"(list property="type" val="SCHOOL" sort_by=due direction=desc)");
    const auto &list = std::get<cli::ListCommand>(command);
    QVERIFY(list.filter.field == data::TaskField::Type);
    QCOMPARE(list.filter.value, QStringLiteral("SCHOOL"));
    QVERIFY(list.sort.key == data::TaskField::Due);
    QVERIFY(list.sort.direction == core::SortDirection::Descending);
}

void CommandValidatorTest::printDefaultsToNameAscending()
{
    const auto command = validate("print");
    const auto &print = std::get<cli::PrintCommand>(command);
    QVERIFY(print.sort.key == data::TaskField::Name);
    QVERIFY(print.sort.direction == core::SortDirection::Ascending);
}

void CommandValidatorTest::modDoneValueIsBoolean()
{
    const auto command = validate(R"(mod id=0 property="done" new_val="True")");
    const auto &mod = std::get<cli::ModifyCommand>(command);
    QVERIFY(mod.field == data::TaskField::Done);
    QVERIFY(std::get<bool>(mod.value));
}

void CommandValidatorTest::deleteSelectsByIdOrFilter()
{
    const auto byId = validate("delete id=4");
    QCOMPARE(std::get<cli::DeleteCommand>(byId).id, qint64(4));

    const auto byFilter = validate(R"(delete property="prio" val="high")");
    const auto &matching = std::get<cli::DeleteMatchingCommand>(byFilter);
    QVERIFY(matching.filter.field == data::TaskField::Priority);
    QCOMPARE(matching.filter.value, QStringLiteral("high"));
}

void CommandValidatorTest::rejects_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<core::ErrorKind>("kind");

    QTest::newRow("slashed date") << R"(add name="X" due="2025/10/31")" << core::ErrorKind::InvalidDateFormat;
    QTest::newRow("impossible date") << R"(add name="X" due=31-02-2025)" << core::ErrorKind::InvalidDateFormat;
    QTest::newRow("yearly") << R"(add name="X" rep="YEARLY")" << core::ErrorKind::InvalidRepeat;
    QTest::newRow("lowercase repeat") << R"(add name="X" rep=daily)" << core::ErrorKind::InvalidRepeat;
    QTest::newRow("urgent") << R"(add name="X" prio="URGENT")" << core::ErrorKind::InvalidPriority;
    QTest::newRow("first failure wins") << R"(add name="X" rep=YEARLY prio=URGENT)" << core::ErrorKind::InvalidRepeat;
    QTest::newRow("mod due") << R"(mod id=0 property="due" new_val="2025/10/31")" << core::ErrorKind::InvalidDateFormat;
    QTest::newRow("mod prio") << R"(mod id=0 property="prio" new_val="low")" << core::ErrorKind::InvalidPriority;
    QTest::newRow("mod done") << R"(mod id=0 property="done" new_val="yes")" << core::ErrorKind::InvalidDoneStatus;
    QTest::newRow("mod done lowercase") << R"(mod id=0 property="done" new_val="true")"
                                        << core::ErrorKind::InvalidDoneStatus;
    QTest::newRow("mod numeral name") << "mod id=0 property=name new_val=7" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("mod numeral type") << "mod id=0 property=type new_val=2025" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("mod empty desc") << R"(mod id=0 property=desc new_val="")" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("mod id text") << "mod id=0 property=id new_val=abc" << core::ErrorKind::InvalidArgumentType;
    QTest::newRow("mod unknown property") << R"(mod id=0 property="unknown" new_val="v")"
                                          << core::ErrorKind::InvalidArgument;
    QTest::newRow("list unknown property") << R"(list property="owner" val="x")" << core::ErrorKind::InvalidArgument;
    QTest::newRow("bad sort key") << "print sort_by=colour" << core::ErrorKind::InvalidArgument;
    QTest::newRow("bad direction") << "print direction=up" << core::ErrorKind::InvalidArgument;
    QTest::newRow("delete id and filter") << R"(delete id=0 property="type" val="X")"
                                          << core::ErrorKind::TooManyArguments;
    QTest::newRow("delete id and val") << "delete id=0 val=X" << core::ErrorKind::TooManyArguments;
    QTest::newRow("delete without val") << R"(delete property="type")" << core::ErrorKind::MissingArguments;
    QTest::newRow("delete nothing") << "delete" << core::ErrorKind::MissingArguments;
    QTest::newRow("delete unknown property") << R"(delete property="owner" val="x")"
                                             << core::ErrorKind::InvalidArgument;
}

void CommandValidatorTest::rejects()
{
    QFETCH(QString, line);
    QFETCH(core::ErrorKind, kind);

    try {
        validate(line);
        QFAIL("expected CommandError");
    } catch (const core::CommandError &error) {
        QCOMPARE(QString::fromLatin1(core::errorKindName(error.kind())),
                 QString::fromLatin1(core::errorKindName(kind)));
    }
}

QTEST_GUILESS_MAIN(CommandValidatorTest)
#include "CommandValidatorTest.moc"
