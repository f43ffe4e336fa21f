#include <QtTest/QtTest>

#include <limits>

#include "agenda/core/RecurrenceExpander.hpp"
#include "agenda/core/RecurrenceRule.hpp"

using namespace agenda;
using data::localInstant;

namespace {
data::Entry timedEntry(qint64 start, qint64 duration, const QString &rule)
{
    data::Entry entry;
    entry.start = data::TemporalValue{ data::Precision::DateTime, start };
    entry.end = data::TemporalValue{ data::Precision::DateTime, start + duration };
    if (!rule.isEmpty()) {
        entry.recurrenceRule = rule;
    }
    entry.summary = QStringLiteral("Standup");
    entry.sourcePath = QStringLiteral("/cal/standup.ics");
    return entry;
}

const qint64 JanuaryStart = localInstant(2024, 1, 1);
const qint64 JanuaryEnd = localInstant(2024, 1, 31, 23, 59, 59);
} // namespace

class RecurrenceExpanderTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesRule();
    void singleEntryIgnoresWindow();
    void dailyCount();
    void weeklyUntil();
    void unboundedRuleHitsCap();
    void unknownFrequencyStopsAfterFirst();
    void countIncludesSkippedCandidates();
    void overlappingOccurrenceIsKept();
    void monthlyFollowsCalendarNormalization();
    void exceptionReplacesOccurrence();
    void unmatchedExceptionIsIgnored();
    void occurrencesAreIndependentCopies();
    void limitStopsEarly();
    void candidatesBeforeWindowAreBounded();
    void reachesWindowWithinCandidateCap();
    void hugeIntervalEndsExpansion_data();
    void hugeIntervalEndsExpansion();
};

void RecurrenceExpanderTest::parsesRule()
{
    const auto rule = core::RecurrenceRule::parse(QStringLiteral("FREQ=WEEKLY;INTERVAL=2;UNTIL=20240201;BYDAY=MO;COUNT=4"));
    QCOMPARE(rule.frequency, data::Frequency::Weekly);
    QCOMPARE(rule.interval, 2);
    QVERIFY(rule.until.has_value());
    QCOMPARE(*rule.until, localInstant(2024, 2, 1));
    QVERIFY(rule.count.has_value());
    QCOMPARE(*rule.count, 4);

    const auto defaults = core::RecurrenceRule::parse(QStringLiteral("FREQ=DAILY"));
    QCOMPARE(defaults.interval, 1);
    QVERIFY(!defaults.until.has_value());
    QVERIFY(!defaults.count.has_value());
}

void RecurrenceExpanderTest::singleEntryIgnoresWindow()
{
    const data::Entry entry = timedEntry(localInstant(2020, 6, 1, 9, 0), 3600, QString());
    const core::RecurrenceExpander expander;
    const auto occurrences = expander.expand(entry, {}, JanuaryStart, JanuaryEnd);

    QCOMPARE(occurrences.size(), static_cast<size_t>(1));
    QCOMPARE(occurrences[0].entry.start, entry.start);
    QCOMPARE(*occurrences[0].entry.end, *entry.end);
    QCOMPARE(occurrences[0].entry.summary, entry.summary);
    QCOMPARE(occurrences[0].entry.sourcePath, entry.sourcePath);
    QVERIFY(!occurrences[0].fromException);
}

void RecurrenceExpanderTest::dailyCount()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1), 0, QStringLiteral("FREQ=DAILY;INTERVAL=1;COUNT=5"));
    const auto occurrences = core::RecurrenceExpander().expand(entry, {}, JanuaryStart, JanuaryEnd);

    QCOMPARE(occurrences.size(), static_cast<size_t>(5));
    for (int day = 0; day < 5; ++day) {
        QCOMPARE(occurrences[static_cast<size_t>(day)].start().instant, localInstant(2024, 1, 1 + day));
    }
}

void RecurrenceExpanderTest::weeklyUntil()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1, 10, 0), 1800, QStringLiteral("FREQ=WEEKLY;UNTIL=20240201"));
    const auto occurrences =
        core::RecurrenceExpander().expand(entry, {}, JanuaryStart, localInstant(2030, 1, 1));

    QCOMPARE(occurrences.size(), static_cast<size_t>(5));
    QCOMPARE(occurrences.back().start().instant, localInstant(2024, 1, 29, 10, 0));
    for (const auto &occurrence : occurrences) {
        QVERIFY(occurrence.start().instant <= localInstant(2024, 2, 1));
    }
}

void RecurrenceExpanderTest::unboundedRuleHitsCap()
{
    const data::Entry entry = timedEntry(localInstant(2000, 1, 1, 8, 0), 60, QStringLiteral("FREQ=DAILY;UNTIL=99991231"));
    const auto occurrences =
        core::RecurrenceExpander().expand(entry, {}, localInstant(2000, 1, 1), localInstant(2100, 1, 1));

    QCOMPARE(occurrences.size(), static_cast<size_t>(core::RecurrenceExpander::MaxOccurrences));
    for (size_t i = 1; i < occurrences.size(); ++i) {
        QVERIFY(occurrences[i - 1].start().instant < occurrences[i].start().instant);
    }
}

void RecurrenceExpanderTest::unknownFrequencyStopsAfterFirst()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 5, 8, 0), 60, QStringLiteral("INTERVAL=2"));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("does not advance")));
    const auto occurrences = core::RecurrenceExpander().expand(entry, {}, JanuaryStart, JanuaryEnd);

    QCOMPARE(occurrences.size(), static_cast<size_t>(1));
    QCOMPARE(occurrences[0].start().instant, localInstant(2024, 1, 5, 8, 0));
}

void RecurrenceExpanderTest::countIncludesSkippedCandidates()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1, 9, 0), 3600, QStringLiteral("FREQ=DAILY;COUNT=5"));
    const auto occurrences = core::RecurrenceExpander().expand(entry, {}, localInstant(2024, 1, 3), JanuaryEnd);

    QCOMPARE(occurrences.size(), static_cast<size_t>(3));
    QCOMPARE(occurrences.front().start().instant, localInstant(2024, 1, 3, 9, 0));
    QCOMPARE(occurrences.back().start().instant, localInstant(2024, 1, 5, 9, 0));
}

void RecurrenceExpanderTest::overlappingOccurrenceIsKept()
{
    // Two day event starting before the window but still running inside it.
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1, 12, 0), 2 * 86400, QStringLiteral("FREQ=WEEKLY;COUNT=2"));
    const auto occurrences = core::RecurrenceExpander().expand(entry, {}, localInstant(2024, 1, 2), JanuaryEnd);

    QCOMPARE(occurrences.size(), static_cast<size_t>(2));
    QCOMPARE(occurrences[0].start().instant, localInstant(2024, 1, 1, 12, 0));
    QCOMPARE(occurrences[1].start().instant, localInstant(2024, 1, 8, 12, 0));
}

void RecurrenceExpanderTest::monthlyFollowsCalendarNormalization()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 31), 0, QStringLiteral("FREQ=MONTHLY;COUNT=3"));
    const auto occurrences = core::RecurrenceExpander().expand(entry, {}, JanuaryStart, localInstant(2024, 12, 31));

    QCOMPARE(occurrences.size(), static_cast<size_t>(3));
    QCOMPARE(occurrences[0].start().instant, localInstant(2024, 1, 31));
    QCOMPARE(occurrences[1].start().instant, localInstant(2024, 3, 2));
    QCOMPARE(occurrences[2].start().instant, localInstant(2024, 4, 2));
}

void RecurrenceExpanderTest::exceptionReplacesOccurrence()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1, 9, 0), 900, QStringLiteral("FREQ=DAILY;COUNT=3"));

    data::Entry moved = timedEntry(localInstant(2024, 1, 2, 14, 0), 1800, QString());
    moved.summary = QStringLiteral("Standup (moved)");
    moved.recurrenceId = data::TemporalValue{ data::Precision::DateTime, localInstant(2024, 1, 2, 9, 0) };

    const auto occurrences = core::RecurrenceExpander().expand(entry, { moved }, JanuaryStart, JanuaryEnd);
    QCOMPARE(occurrences.size(), static_cast<size_t>(3));
    QCOMPARE(occurrences[0].entry.summary, QStringLiteral("Standup"));
    QVERIFY(occurrences[1].fromException);
    QCOMPARE(occurrences[1].entry.summary, QStringLiteral("Standup (moved)"));
    QCOMPARE(occurrences[1].start().instant, localInstant(2024, 1, 2, 14, 0));
    QCOMPARE(occurrences[1].end()->instant, localInstant(2024, 1, 2, 14, 30));
    QCOMPARE(occurrences[2].start().instant, localInstant(2024, 1, 3, 9, 0));
}

void RecurrenceExpanderTest::unmatchedExceptionIsIgnored()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1, 9, 0), 900, QStringLiteral("FREQ=DAILY;COUNT=3"));

    // Date precision id never equals the 09:00 instants the rule generates.
    data::Entry orphan = timedEntry(localInstant(2024, 1, 2, 14, 0), 1800, QString());
    orphan.summary = QStringLiteral("Orphan");
    orphan.recurrenceId = data::TemporalValue{ data::Precision::Date, localInstant(2024, 1, 2) };

    const auto occurrences = core::RecurrenceExpander().expand(entry, { orphan }, JanuaryStart, JanuaryEnd);
    QCOMPARE(occurrences.size(), static_cast<size_t>(3));
    for (const auto &occurrence : occurrences) {
        QVERIFY(!occurrence.fromException);
        QCOMPARE(occurrence.entry.summary, QStringLiteral("Standup"));
    }
}

void RecurrenceExpanderTest::occurrencesAreIndependentCopies()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1, 9, 0), 3600, QStringLiteral("FREQ=DAILY;COUNT=2"));
    auto occurrences = core::RecurrenceExpander().expand(entry, {}, JanuaryStart, JanuaryEnd);
    QCOMPARE(occurrences.size(), static_cast<size_t>(2));

    QCOMPARE(occurrences[1].end()->instant, localInstant(2024, 1, 2, 10, 0));
    occurrences[0].entry.summary = QStringLiteral("changed");
    occurrences[0].entry.end->instant = 0;

    QCOMPARE(occurrences[1].entry.summary, QStringLiteral("Standup"));
    QCOMPARE(occurrences[1].end()->instant, localInstant(2024, 1, 2, 10, 0));
    QCOMPARE(entry.start.instant, localInstant(2024, 1, 1, 9, 0));
    QCOMPARE(entry.end->instant, localInstant(2024, 1, 1, 10, 0));
}

void RecurrenceExpanderTest::limitStopsEarly()
{
    const data::Entry entry = timedEntry(localInstant(2024, 1, 1, 9, 0), 0, QStringLiteral("FREQ=DAILY"));
    QCOMPARE(core::RecurrenceExpander(10).expand(entry, {}, JanuaryStart, JanuaryEnd).size(), static_cast<size_t>(10));
    QCOMPARE(core::RecurrenceExpander().expand(entry, {}, JanuaryStart, JanuaryEnd, 4).size(), static_cast<size_t>(4));
    QCOMPARE(core::RecurrenceExpander(5000).maxOccurrences(), core::RecurrenceExpander::MaxOccurrences);
}

void RecurrenceExpanderTest::candidatesBeforeWindowAreBounded()
{
    const data::Entry entry = timedEntry(localInstant(1900, 1, 1, 8, 0), 3600, QStringLiteral("FREQ=DAILY"));
    const core::RecurrenceExpander expander(core::RecurrenceExpander::MaxOccurrences, 500);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("stopped after 500 candidates")));
    int candidates = 0;
    const auto occurrences =
        expander.expand(entry, {}, localInstant(2020, 1, 1), localInstant(2020, 12, 31), expander.maxCandidates(), &candidates);

    QVERIFY(occurrences.empty());
    QCOMPARE(candidates, 500);
    QCOMPARE(core::RecurrenceExpander().maxCandidates(), core::RecurrenceExpander::MaxCandidates);
}

void RecurrenceExpanderTest::reachesWindowWithinCandidateCap()
{
    const data::Entry entry = timedEntry(localInstant(2023, 12, 1, 8, 0), 3600, QStringLiteral("FREQ=DAILY"));
    const core::RecurrenceExpander expander(core::RecurrenceExpander::MaxOccurrences, 500);

    int candidates = 0;
    const auto occurrences = expander.expand(entry, {}, JanuaryStart, JanuaryEnd, expander.maxCandidates(), &candidates);

    QCOMPARE(occurrences.size(), static_cast<size_t>(31));
    QCOMPARE(candidates, 62);
}

void RecurrenceExpanderTest::hugeIntervalEndsExpansion_data()
{
    QTest::addColumn<QString>("rule");
    QTest::newRow("daily") << QStringLiteral("FREQ=DAILY;INTERVAL=2147483647;COUNT=3");
    QTest::newRow("weekly") << QStringLiteral("FREQ=WEEKLY;INTERVAL=2147483647;COUNT=3");
    QTest::newRow("weekly 4e8") << QStringLiteral("FREQ=WEEKLY;INTERVAL=400000000;COUNT=3");
    QTest::newRow("monthly") << QStringLiteral("FREQ=MONTHLY;INTERVAL=2147483647;COUNT=3");
    QTest::newRow("yearly") << QStringLiteral("FREQ=YEARLY;INTERVAL=2147483647;COUNT=3");
}

void RecurrenceExpanderTest::hugeIntervalEndsExpansion()
{
    QFETCH(QString, rule);
    const data::Entry entry = timedEntry(localInstant(2024, 1, 10, 9, 0), 3600, rule);
    const auto occurrences =
        core::RecurrenceExpander().expand(entry, {}, JanuaryStart, std::numeric_limits<qint64>::max() - 1);

    QCOMPARE(occurrences.size(), static_cast<size_t>(1));
    QCOMPARE(occurrences.front().start().instant, localInstant(2024, 1, 10, 9, 0));
}

QTEST_GUILESS_MAIN(RecurrenceExpanderTest)
#include "RecurrenceExpanderTest.moc"
