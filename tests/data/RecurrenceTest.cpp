#include <QtTest/QtTest>

#include "agenda/core/ZonedClock.hpp"
#include "agenda/data/Recurrence.hpp"

using namespace agenda;
using namespace agenda::data;

class RecurrenceTest : public QObject
{
    Q_OBJECT

private slots:
    void dailyCountGivesFixedDeltas_data();
    void dailyCountGivesFixedDeltas();
    void weeklyIntervalDeltas_data();
    void weeklyIntervalDeltas();
    void capLimitsUnterminatedRule();
    void countAboveCapIsClamped();
    void untilIsInclusive();
    void monthlyStopsOnMissingDay();
    void monthlyCarriesYear();
    void yearlyLeapDayStops();
    void dailyPreservesWallClockAcrossDst();
    void dailyShiftsForwardThroughGap();
    void repeatedWallClockTakesEarliest();
    void fixedOffsetAnchorStepsInItsOwnCalendar();
    void hugeIntervalStopsEarly();
    void rejectsInvalidRules();
    void settingTerminatorClearsOther();
    void rendersRRule();
    void parsesRRule();
    void rejectsMalformedRRule_data();
    void rejectsMalformedRRule();
};

namespace {
QDateTime utc(int year, int month, int day, int hour = 9, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}
} // namespace

void RecurrenceTest::dailyCountGivesFixedDeltas_data()
{
    QTest::addColumn<int>("count");
    for (const int count : {1, 2, 7, 31, 99}) {
        QTest::newRow(qPrintable(QStringLiteral("count-%1").arg(count))) << count;
    }
}

void RecurrenceTest::dailyCountGivesFixedDeltas()
{
    QFETCH(int, count);
    RecurrenceRule rule = RecurrenceRule::daily();
    rule.setCount(count);

    const auto occurrences = generateOccurrences(rule, utc(2025, 1, 1), 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(count));
    QCOMPARE(occurrences->front(), utc(2025, 1, 1));
    for (size_t i = 1; i < occurrences->size(); ++i) {
        QCOMPARE((*occurrences)[i - 1].secsTo((*occurrences)[i]), qint64(24 * 3600));
    }
}

void RecurrenceTest::weeklyIntervalDeltas_data()
{
    QTest::addColumn<int>("interval");
    for (const int interval : {1, 2, 3, 13, 51}) {
        QTest::newRow(qPrintable(QStringLiteral("interval-%1").arg(interval))) << interval;
    }
}

void RecurrenceTest::weeklyIntervalDeltas()
{
    QFETCH(int, interval);
    RecurrenceRule rule = RecurrenceRule::weekly();
    rule.setInterval(interval);
    rule.setCount(5);

    const auto occurrences = generateOccurrences(rule, utc(2025, 1, 6), 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(5));
    for (size_t i = 1; i < occurrences->size(); ++i) {
        QCOMPARE((*occurrences)[i - 1].daysTo((*occurrences)[i]), qint64(7 * interval));
        QCOMPARE((*occurrences)[i].time(), QTime(9, 0));
    }
}

void RecurrenceTest::capLimitsUnterminatedRule()
{
    const auto occurrences = generateOccurrences(RecurrenceRule::daily(), utc(2025, 1, 1), 10);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(10));

    const auto none = generateOccurrences(RecurrenceRule::daily(), utc(2025, 1, 1), 0);
    QVERIFY(none.isOk());
    QVERIFY(none->empty());

    const auto negative = generateOccurrences(RecurrenceRule::daily(), utc(2025, 1, 1), -1);
    QVERIFY(!negative.isOk());
    QVERIFY(negative.error().code == core::ErrorCode::Recurrence);
}

void RecurrenceTest::countAboveCapIsClamped()
{
    RecurrenceRule rule = RecurrenceRule::daily();
    rule.setCount(50);
    const auto occurrences = generateOccurrences(rule, utc(2025, 1, 1), 20);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(20));
}

void RecurrenceTest::untilIsInclusive()
{
    RecurrenceRule rule = RecurrenceRule::daily();
    rule.setUntil(utc(2025, 1, 5));

    const auto occurrences = generateOccurrences(rule, utc(2025, 1, 1), 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(5));
    QCOMPARE(occurrences->back(), utc(2025, 1, 5));

    rule.setUntil(utc(2025, 1, 5, 8, 59));
    const auto shorter = generateOccurrences(rule, utc(2025, 1, 1), 1000);
    QVERIFY(shorter.isOk());
    QCOMPARE(shorter->size(), static_cast<size_t>(4));
}

void RecurrenceTest::monthlyStopsOnMissingDay()
{
    RecurrenceRule rule = RecurrenceRule::monthly();
    rule.setCount(12);

    // January 31st has no counterpart in February.
    const auto occurrences = generateOccurrences(rule, utc(2025, 1, 31), 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(1));
    QCOMPARE(occurrences->front(), utc(2025, 1, 31));

    const auto fifteenth = generateOccurrences(rule, utc(2025, 1, 15), 1000);
    QVERIFY(fifteenth.isOk());
    QCOMPARE(fifteenth->size(), static_cast<size_t>(12));
    QCOMPARE(fifteenth->back(), utc(2025, 12, 15));
}

void RecurrenceTest::monthlyCarriesYear()
{
    RecurrenceRule rule = RecurrenceRule::monthly();
    rule.setInterval(5);
    rule.setCount(3);

    const auto occurrences = generateOccurrences(rule, utc(2025, 10, 10), 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(3));
    QCOMPARE((*occurrences)[1], utc(2026, 3, 10));
    QCOMPARE((*occurrences)[2], utc(2026, 8, 10));
}

void RecurrenceTest::yearlyLeapDayStops()
{
    RecurrenceRule rule = RecurrenceRule::yearly();
    rule.setCount(5);
    const auto occurrences = generateOccurrences(rule, utc(2024, 2, 29), 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(1));

    rule.setInterval(4);
    const auto everyFourYears = generateOccurrences(rule, utc(2024, 2, 29), 1000);
    QVERIFY(everyFourYears.isOk());
    QCOMPARE(everyFourYears->size(), static_cast<size_t>(5));
    QCOMPARE(everyFourYears->back(), utc(2040, 2, 29));
}

void RecurrenceTest::dailyPreservesWallClockAcrossDst()
{
    const QTimeZone vienna("Europe/Vienna");
    const auto anchor = core::clock::resolve(QStringLiteral("2025-03-29 09:00:00"), vienna);
    QVERIFY(anchor.isOk());

    RecurrenceRule rule = RecurrenceRule::daily();
    rule.setCount(3);
    const auto occurrences = generateOccurrences(rule, *anchor, 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(3));
    for (const QDateTime &occurrence : *occurrences) {
        QCOMPARE(occurrence.toTimeZone(vienna).time(), QTime(9, 0));
    }
    // Clocks go forward on the night of 2025-03-30.
    QCOMPARE((*occurrences)[0].secsTo((*occurrences)[1]), qint64(23 * 3600));
    QCOMPARE((*occurrences)[1].secsTo((*occurrences)[2]), qint64(24 * 3600));
}

void RecurrenceTest::dailyShiftsForwardThroughGap()
{
    const QTimeZone newYork("America/New_York");
    const auto anchor = core::clock::resolve(QStringLiteral("2025-03-07 02:30:00"), newYork);
    QVERIFY(anchor.isOk());

    RecurrenceRule rule = RecurrenceRule::daily();
    rule.setCount(4);
    const auto occurrences = generateOccurrences(rule, *anchor, 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(4));

    // 02:30 does not exist on 2025-03-09; that occurrence lands at 03:30 EDT.
    QCOMPARE((*occurrences)[2].toUTC(), utc(2025, 3, 9, 7, 30));
    QCOMPARE((*occurrences)[2].toTimeZone(newYork).time(), QTime(3, 30));
    QCOMPARE((*occurrences)[3].toUTC(), utc(2025, 3, 10, 6, 30));
    QCOMPARE((*occurrences)[3].toTimeZone(newYork).time(), QTime(2, 30));
    for (size_t i = 1; i < occurrences->size(); ++i) {
        QVERIFY((*occurrences)[i - 1] < (*occurrences)[i]);
    }
}

void RecurrenceTest::repeatedWallClockTakesEarliest()
{
    const QTimeZone newYork("America/New_York");

    // 01:30 happens twice on 2025-11-02; the EDT reading comes first.
    const auto dailyAnchor = core::clock::resolve(QStringLiteral("2025-10-31 01:30:00"), newYork);
    QVERIFY(dailyAnchor.isOk());
    RecurrenceRule daily = RecurrenceRule::daily();
    daily.setCount(4);
    const auto days = generateOccurrences(daily, *dailyAnchor, 1000);
    QVERIFY(days.isOk());
    QCOMPARE(days->size(), static_cast<size_t>(4));
    QCOMPARE((*days)[2].toUTC(), utc(2025, 11, 2, 5, 30));
    QCOMPARE((*days)[1].secsTo((*days)[2]), qint64(24 * 3600));
    QCOMPARE((*days)[2].secsTo((*days)[3]), qint64(25 * 3600));

    const auto monthlyAnchor = core::clock::resolve(QStringLiteral("2025-10-02 01:30:00"), newYork);
    QVERIFY(monthlyAnchor.isOk());
    RecurrenceRule monthly = RecurrenceRule::monthly();
    monthly.setCount(2);
    const auto months = generateOccurrences(monthly, *monthlyAnchor, 1000);
    QVERIFY(months.isOk());
    QCOMPARE(months->size(), static_cast<size_t>(2));
    QCOMPARE(months->back().toUTC(), utc(2025, 11, 2, 5, 30));
}

void RecurrenceTest::fixedOffsetAnchorStepsInItsOwnCalendar()
{
    // 01:00 on Feb 1 at +02:00 is still Jan 31 in UTC.
    const QDateTime anchor(QDate(2025, 2, 1), QTime(1, 0), Qt::OffsetFromUTC, 7200);
    RecurrenceRule rule = RecurrenceRule::monthly();
    rule.setCount(3);

    const auto occurrences = generateOccurrences(rule, anchor, 10);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(3));
    QCOMPARE((*occurrences)[1].toUTC(), utc(2025, 2, 28, 23, 0));
    QCOMPARE((*occurrences)[2].toUTC(), utc(2025, 3, 31, 23, 0));
    for (const QDateTime &occurrence : *occurrences) {
        QCOMPARE(occurrence.offsetFromUtc(), 7200);
        QCOMPARE(occurrence.time(), QTime(1, 0));
        QCOMPARE(occurrence.date().day(), 1);
    }
}

void RecurrenceTest::hugeIntervalStopsEarly()
{
    const auto rule = RecurrenceRule::fromRRule(QStringLiteral("FREQ=YEARLY;INTERVAL=2147483647;COUNT=2"),
                                                QTimeZone::utc());
    QVERIFY(rule.isOk());

    const auto occurrences = generateOccurrences(*rule, utc(2025, 1, 1), 10);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(1));
    QCOMPARE(occurrences->front(), utc(2025, 1, 1));
}

void RecurrenceTest::rejectsInvalidRules()
{
    RecurrenceRule zeroInterval = RecurrenceRule::daily();
    zeroInterval.setInterval(0);
    const auto interval = generateOccurrences(zeroInterval, utc(2025, 1, 1), 10);
    QVERIFY(!interval.isOk());
    QVERIFY(interval.error().code == core::ErrorCode::Recurrence);

    RecurrenceRule zeroCount = RecurrenceRule::weekly();
    zeroCount.setCount(0);
    QVERIFY(!zeroCount.validate().isOk());

    QVERIFY(!frequencyFromName(QStringLiteral("HOURLY")).isOk());
}

void RecurrenceTest::settingTerminatorClearsOther()
{
    RecurrenceRule rule = RecurrenceRule::daily();
    rule.setCount(4);
    rule.setUntil(utc(2025, 2, 1));
    QVERIFY(!rule.count().has_value());
    QVERIFY(rule.until().has_value());

    rule.setCount(2);
    QVERIFY(!rule.until().has_value());
    QCOMPARE(*rule.count(), 2);

    rule.clearTerminator();
    QVERIFY(!rule.count().has_value());
    QVERIFY(!rule.until().has_value());
}

void RecurrenceTest::rendersRRule()
{
    RecurrenceRule rule = RecurrenceRule::weekly();
    rule.setInterval(2);
    rule.setCount(10);
    rule.setWeekdays({Qt::Monday, Qt::Wednesday});
    QCOMPARE(rule.toRRule(), QStringLiteral("FREQ=WEEKLY;INTERVAL=2;COUNT=10;BYDAY=MO,WE"));

    RecurrenceRule until = RecurrenceRule::daily();
    until.setUntil(QDateTime(QDate(2025, 6, 30), QTime(23, 59, 59), QTimeZone("Europe/Vienna")));
    QCOMPARE(until.toRRule(), QStringLiteral("FREQ=DAILY;UNTIL=20250630T215959Z"));
}

void RecurrenceTest::parsesRRule()
{
    const QTimeZone vienna("Europe/Vienna");
    const auto rule = RecurrenceRule::fromRRule(QStringLiteral("RRULE:FREQ=MONTHLY;INTERVAL=3;UNTIL=20251231T120000Z"),
                                                vienna);
    QVERIFY(rule.isOk());
    QVERIFY(rule->frequency() == Frequency::Monthly);
    QCOMPARE(rule->interval(), 3);
    QVERIFY(rule->until().has_value());
    QCOMPARE(rule->until()->toUTC(), utc(2025, 12, 31, 12, 0));

    const auto dateOnly = RecurrenceRule::fromRRule(QStringLiteral("FREQ=DAILY;UNTIL=20250110"), vienna);
    QVERIFY(dateOnly.isOk());
    QCOMPARE(dateOnly->until()->toTimeZone(vienna).time(), QTime(23, 59, 59));

    RecurrenceRule weekly = RecurrenceRule::weekly();
    weekly.setCount(6);
    weekly.setWeekdays({Qt::Friday});
    const auto reparsed = RecurrenceRule::fromRRule(weekly.toRRule(), vienna);
    QVERIFY(reparsed.isOk());
    QVERIFY(*reparsed == weekly);
}

void RecurrenceTest::rejectsMalformedRRule_data()
{
    QTest::addColumn<QString>("text");
    QTest::newRow("no-freq") << QStringLiteral("INTERVAL=2");
    QTest::newRow("bad-freq") << QStringLiteral("FREQ=SECONDLY");
    QTest::newRow("zero-interval") << QStringLiteral("FREQ=DAILY;INTERVAL=0");
    QTest::newRow("count-and-until") << QStringLiteral("FREQ=DAILY;COUNT=2;UNTIL=20250101T000000Z");
    QTest::newRow("bad-byday") << QStringLiteral("FREQ=WEEKLY;BYDAY=XX");
    QTest::newRow("no-equals") << QStringLiteral("FREQ=DAILY;COUNT");
}

void RecurrenceTest::rejectsMalformedRRule()
{
    QFETCH(QString, text);
    const auto rule = RecurrenceRule::fromRRule(text, QTimeZone::utc());
    QVERIFY(!rule.isOk());
    QVERIFY(rule.error().code == core::ErrorCode::Recurrence);
}

QTEST_GUILESS_MAIN(RecurrenceTest)
#include "RecurrenceTest.moc"
