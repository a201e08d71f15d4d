#include "agenda/core/ZonedClock.hpp"

#include "agenda/core/Logging.hpp"

#include <algorithm>
#include <vector>

namespace agenda {
namespace core {
namespace clock {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr auto TIME_FORMAT = "hh:mm:ss";
constexpr qint64 SECONDS_PER_DAY = 24 * 60 * 60;

int offsetAt(const QTimeZone &zone, qint64 utcSecs)
{
    return zone.offsetFromUtc(QDateTime::fromSecsSinceEpoch(utcSecs, Qt::UTC));
}
} // namespace

Result<QTimeZone> parseTimeZone(const QString &id)
{
    const QByteArray ianaId = id.trimmed().toUtf8();
    if (ianaId.isEmpty()) {
        return makeError(ErrorCode::InvalidTimeZone, QStringLiteral("Empty time zone id"));
    }
    QTimeZone zone(ianaId);
    if (!zone.isValid()) {
        return makeError(ErrorCode::InvalidTimeZone, QStringLiteral("Unknown time zone '%1'").arg(id));
    }
    return zone;
}

Result<CivilDateTime> parseCivil(const QString &text)
{
    const auto failure = [&text]() {
        return makeError(ErrorCode::TimeParse,
                         QStringLiteral("Could not parse '%1'. Expected 'YYYY-MM-DD HH:MM:SS' or "
                                        "'YYYY-MM-DDTHH:MM:SS'")
                             .arg(text));
    };
    if (text.size() != 19) {
        return failure();
    }
    const QChar separator = text.at(10);
    if (separator != QLatin1Char(' ') && separator != QLatin1Char('T')) {
        return failure();
    }
    const QDate date = QDate::fromString(text.left(10), QLatin1String(DATE_FORMAT));
    const QTime time = QTime::fromString(text.mid(11), QLatin1String(TIME_FORMAT));
    if (!date.isValid() || !time.isValid()) {
        return failure();
    }
    return CivilDateTime{date, time};
}

Result<CivilDateTime> parseBasicCivil(const QString &text)
{
    QString body = text;
    if (body.endsWith(QLatin1Char('Z'))) {
        body.chop(1);
    }
    if (body.size() != 15 || body.at(8) != QLatin1Char('T')) {
        return makeError(ErrorCode::TimeParse, QStringLiteral("Invalid date-time '%1'").arg(text));
    }
    const QDate date = QDate::fromString(body.left(8), QStringLiteral("yyyyMMdd"));
    const QTime time = QTime::fromString(body.mid(9), QStringLiteral("hhmmss"));
    if (!date.isValid() || !time.isValid()) {
        return makeError(ErrorCode::TimeParse, QStringLiteral("Invalid date-time '%1'").arg(text));
    }
    return CivilDateTime{date, time};
}

Result<QDateTime> resolve(const QDate &date, const QTime &time, const QTimeZone &zone,
                          Disambiguation disambiguation)
{
    if (!zone.isValid()) {
        return makeError(ErrorCode::InvalidTimeZone, QStringLiteral("Invalid time zone"));
    }
    if (!date.isValid() || !time.isValid()) {
        return makeError(ErrorCode::TimeParse, QStringLiteral("Invalid civil date/time"));
    }

    // Wall clock read as if it were UTC; every real instant for it lies
    // within a day of this value.
    const qint64 wallSecs = QDateTime(date, time, Qt::UTC).toSecsSinceEpoch();
    const int offsetBefore = offsetAt(zone, wallSecs - SECONDS_PER_DAY);
    const int offsetAfter = offsetAt(zone, wallSecs + SECONDS_PER_DAY);

    std::vector<qint64> candidates;
    for (const int offset : {offsetBefore, offsetAfter}) {
        const qint64 candidate = wallSecs - offset;
        if (offsetAt(zone, candidate) != offset) {
            continue;
        }
        if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
            candidates.push_back(candidate);
        }
    }
    std::sort(candidates.begin(), candidates.end());

    const QString civilText = QStringLiteral("%1 %2").arg(date.toString(QLatin1String(DATE_FORMAT)),
                                                          time.toString(QLatin1String(TIME_FORMAT)));
    if (candidates.empty()) {
        if (disambiguation == Disambiguation::ShiftForward) {
            qCDebug(lcAgendaClock) << "Shifting non-existent local time" << civilText << "in" << zone.id();
            return QDateTime::fromSecsSinceEpoch(wallSecs - offsetBefore, zone);
        }
        return makeError(ErrorCode::InvalidLocalTime,
                         QStringLiteral("Local time %1 does not exist in %2")
                             .arg(civilText, QString::fromUtf8(zone.id())));
    }

    const qint64 chosen = disambiguation == Disambiguation::Latest ? candidates.back() : candidates.front();
    return QDateTime::fromSecsSinceEpoch(chosen, zone);
}

Result<QDateTime> resolve(const QString &civil, const QTimeZone &zone, Disambiguation disambiguation)
{
    const auto parsed = parseCivil(civil);
    if (!parsed) {
        return parsed.error();
    }
    return resolve(parsed->date, parsed->time, zone, disambiguation);
}

Result<QDateTime> startOfDay(const QDate &date, const QTimeZone &zone)
{
    return resolve(date, QTime(0, 0), zone, Disambiguation::ShiftForward);
}

Result<QDateTime> endOfDay(const QDate &date, const QTimeZone &zone)
{
    return resolve(date, QTime(23, 59, 59), zone, Disambiguation::Latest);
}

QTimeZone zoneOf(const QDateTime &instant)
{
    switch (instant.timeSpec()) {
    case Qt::TimeZone:
        return instant.timeZone();
    case Qt::UTC:
        return QTimeZone::utc();
    case Qt::OffsetFromUTC:
        return QTimeZone(instant.offsetFromUtc());
    case Qt::LocalTime:
    default:
        return QTimeZone::systemTimeZone();
    }
}

QDateTime convertTimeZone(const QDateTime &instant, const QTimeZone &zone)
{
    return instant.toTimeZone(zone);
}

bool isDaylightTime(const QDateTime &instant)
{
    if (instant.timeSpec() != Qt::TimeZone) {
        return false;
    }
    return instant.timeZone().isDaylightTime(instant);
}

QString formatCivil(const QDateTime &instant)
{
    return instant.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss"));
}

} // namespace clock
} // namespace core
} // namespace agenda
