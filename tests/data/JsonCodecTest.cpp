#include <QtTest/QtTest>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "agenda/core/ZonedClock.hpp"
#include "agenda/data/JsonCodec.hpp"

using namespace agenda;
using namespace agenda::data;

class JsonCodecTest : public QObject
{
    Q_OBJECT

private slots:
    void writesExpectedFields();
    void roundTripsEventFields();
    void readsHandWrittenDocument();
    void rejectsMalformedDocuments_data();
    void rejectsMalformedDocuments();
};

void JsonCodecTest::writesExpectedFields()
{
    const QTimeZone berlin("Europe/Berlin");
    const auto start = core::clock::resolve(QStringLiteral("2025-07-01 10:00:00"), berlin);
    QVERIFY(start.isOk());
    auto event = Event::create(QStringLiteral("Retro"), *start, std::chrono::minutes(45), berlin);
    QVERIFY(event.isOk());

    Calendar calendar(QStringLiteral("Sprint"));
    calendar.addEvent(*event);

    const QJsonObject root = QJsonDocument::fromJson(JsonCodec::toJson(calendar)).object();
    QCOMPARE(root.value(QStringLiteral("name")).toString(), QStringLiteral("Sprint"));
    const QJsonArray events = root.value(QStringLiteral("events")).toArray();
    QCOMPARE(events.size(), 1);
    const QJsonObject written = events.at(0).toObject();
    QCOMPARE(written.value(QStringLiteral("title")).toString(), QStringLiteral("Retro"));
    QCOMPARE(written.value(QStringLiteral("timezone")).toString(), QStringLiteral("Europe/Berlin"));
    QCOMPARE(written.value(QStringLiteral("start_time")).toString(), QStringLiteral("2025-07-01T10:00:00+02:00"));
    QCOMPARE(written.value(QStringLiteral("end_time")).toString(), QStringLiteral("2025-07-01T10:45:00+02:00"));
    QCOMPARE(written.value(QStringLiteral("status")).toString(), QStringLiteral("CONFIRMED"));
    QVERIFY(!written.contains(QStringLiteral("rrule")));
}

void JsonCodecTest::roundTripsEventFields()
{
    const QTimeZone newYork("America/New_York");
    const auto start = core::clock::resolve(QStringLiteral("2025-09-01 08:30:00"), newYork);
    QVERIFY(start.isOk());
    auto event = Event::create(QStringLiteral("Commute"), *start, std::chrono::minutes(40), newYork);
    QVERIFY(event.isOk());
    event->setDescription(QStringLiteral("Train"));
    event->setLocation(QStringLiteral("Penn Station"));
    event->setUid(QStringLiteral("commute@example.com"));
    event->addAttendee(QStringLiteral("me@example.com"));
    RecurrenceRule rule = RecurrenceRule::daily();
    rule.setUntil(QDateTime(QDate(2025, 9, 30), QTime(12, 30), Qt::UTC).toTimeZone(newYork));
    event->setRecurrence(rule);
    RecurrenceFilter filter;
    filter.setSkipWeekends(true);
    event->setFilter(filter);
    event->addExceptionDate(QDate(2025, 9, 1));
    event->setStatus(EventStatus::Blocked);

    Calendar calendar(QStringLiteral("Routine"));
    calendar.setDescription(QStringLiteral("Weekday habits"));
    calendar.setTimeZone(newYork);
    calendar.addEvent(*event);

    const auto parsed = JsonCodec::fromJson(JsonCodec::toJson(calendar));
    QVERIFY(parsed.isOk());
    QCOMPARE(parsed->name(), QStringLiteral("Routine"));
    QCOMPARE(parsed->description(), QStringLiteral("Weekday habits"));
    QCOMPARE(parsed->timeZone().id(), QByteArray("America/New_York"));
    QCOMPARE(parsed->eventCount(), static_cast<size_t>(1));

    const Event &read = parsed->event(0);
    QCOMPARE(read.title(), QStringLiteral("Commute"));
    QCOMPARE(read.description(), QStringLiteral("Train"));
    QCOMPARE(read.location(), QStringLiteral("Penn Station"));
    QCOMPARE(read.uid(), QStringLiteral("commute@example.com"));
    QCOMPARE(read.attendees(), QStringList{QStringLiteral("me@example.com")});
    QCOMPARE(read.start(), event->start());
    QCOMPARE(read.end(), event->end());
    QCOMPARE(read.timeZone().id(), QByteArray("America/New_York"));
    QVERIFY(read.recurrence().has_value());
    QVERIFY(*read.recurrence() == rule);
    QVERIFY(read.filter().has_value());
    QVERIFY(read.filter()->skipWeekends());
    QVERIFY(read.exceptionDates() == event->exceptionDates());
    QVERIFY(read.status() == EventStatus::Blocked);
}

void JsonCodecTest::readsHandWrittenDocument()
{
    const QByteArray json = R"({
        "name": "Imported",
        "events": [
            {
                "title": "Dentist",
                "start_time": "2025-05-12T07:00:00Z",
                "end_time": "2025-05-12T08:00:00Z",
                "timezone": "Europe/Lisbon",
                "attendees": [],
                "filter": { "skip_weekends": false, "skip_dates": ["2025-05-19"] },
                "rrule": "FREQ=WEEKLY;COUNT=3"
            }
        ]
    })";

    const auto parsed = JsonCodec::fromJson(json);
    QVERIFY(parsed.isOk());
    QCOMPARE(parsed->eventCount(), static_cast<size_t>(1));
    const Event &read = parsed->event(0);
    QCOMPARE(read.start().toTimeZone(QTimeZone("Europe/Lisbon")).time(), QTime(8, 0));
    QVERIFY(read.status() == EventStatus::Confirmed);

    const auto occurrences = read.occurrencesBetween(read.start(), read.start().addDays(30), 1000);
    QVERIFY(occurrences.isOk());
    QCOMPARE(occurrences->size(), static_cast<size_t>(2));
    QCOMPARE(occurrences->back().date(), QDate(2025, 5, 26));
}

void JsonCodecTest::rejectsMalformedDocuments_data()
{
    QTest::addColumn<QByteArray>("json");
    QTest::addColumn<int>("code");

    const int json = static_cast<int>(core::ErrorCode::Json);
    QTest::newRow("not-json") << QByteArray("{ name: ") << json;
    QTest::newRow("array") << QByteArray("[]") << json;
    QTest::newRow("no-name") << QByteArray(R"({"events": []})") << json;
    QTest::newRow("no-title") << QByteArray(R"({"name": "x", "events": [{"timezone": "UTC",
        "start_time": "2025-01-01T10:00:00Z", "end_time": "2025-01-01T11:00:00Z"}]})")
                              << json;
    QTest::newRow("bad-zone") << QByteArray(R"({"name": "x", "events": [{"title": "a", "timezone": "Atlantis/Capital",
        "start_time": "2025-01-01T10:00:00Z", "end_time": "2025-01-01T11:00:00Z"}]})")
                              << static_cast<int>(core::ErrorCode::InvalidTimeZone);
    QTest::newRow("bad-time") << QByteArray(R"({"name": "x", "events": [{"title": "a", "timezone": "UTC",
        "start_time": "yesterday", "end_time": "2025-01-01T11:00:00Z"}]})")
                              << static_cast<int>(core::ErrorCode::TimeParse);
    QTest::newRow("inverted") << QByteArray(R"({"name": "x", "events": [{"title": "a", "timezone": "UTC",
        "start_time": "2025-01-01T12:00:00Z", "end_time": "2025-01-01T11:00:00Z"}]})")
                              << static_cast<int>(core::ErrorCode::Validation);
    QTest::newRow("bad-rrule") << QByteArray(R"({"name": "x", "events": [{"title": "a", "timezone": "UTC",
        "start_time": "2025-01-01T10:00:00Z", "end_time": "2025-01-01T11:00:00Z", "rrule": "FREQ=MINUTELY"}]})")
                               << static_cast<int>(core::ErrorCode::Recurrence);
}

void JsonCodecTest::rejectsMalformedDocuments()
{
    QFETCH(QByteArray, json);
    QFETCH(int, code);

    const auto parsed = JsonCodec::fromJson(json);
    QVERIFY(!parsed.isOk());
    QCOMPARE(static_cast<int>(parsed.error().code), code);
}

QTEST_GUILESS_MAIN(JsonCodecTest)
#include "JsonCodecTest.moc"
