#include "agenda/data/IcsCodec.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/ZonedClock.hpp"
#include "agenda/data/EventConfig.hpp"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QSaveFile>
#include <QStringList>
#include <QTextStream>
#include <QUuid>

#include <utility>
#include <vector>

namespace agenda {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto UTC_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto CRLF = "\r\n";

core::Error icsError(const QString &message)
{
    return core::makeError(core::ErrorCode::Ics, message);
}

QString generateUid()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces) + QStringLiteral("@agenda");
}

QString unquote(const QString &value)
{
    if (value.size() >= 2 && value.startsWith(QLatin1Char('"')) && value.endsWith(QLatin1Char('"'))) {
        return value.mid(1, value.size() - 2);
    }
    return value;
}

QHash<QString, QString> parseParameters(const QString &property)
{
    QHash<QString, QString> parameters;
    const QStringList parts = property.split(QLatin1Char(';'));
    for (int i = 1; i < parts.size(); ++i) {
        const int equals = parts.at(i).indexOf(QLatin1Char('='));
        if (equals <= 0) {
            continue;
        }
        parameters.insert(parts.at(i).left(equals).trimmed().toUpper(), unquote(parts.at(i).mid(equals + 1).trimmed()));
    }
    return parameters;
}

// Raw VEVENT data collected while scanning; turned into an Event once the
// whole component has been read.
struct PendingEvent
{
    EventConfig config;
    QString rawRule;
    std::vector<std::pair<QString, QHash<QString, QString>>> rawExceptionDates;
    bool blocked = false;
};
} // namespace

QString IcsCodec::toIcs(const Calendar &calendar)
{
    QString output;
    QTextStream stream(&output);

    stream << "BEGIN:VCALENDAR" << CRLF;
    stream << "VERSION:2.0" << CRLF;
    stream << "PRODID:-//Agenda//EN" << CRLF;
    if (!calendar.name().isEmpty()) {
        stream << "X-WR-CALNAME:" << encodeText(calendar.name()) << CRLF;
    }
    if (!calendar.description().isEmpty()) {
        stream << "X-WR-CALDESC:" << encodeText(calendar.description()) << CRLF;
    }
    if (calendar.timeZone().isValid()) {
        stream << "X-WR-TIMEZONE:" << QString::fromUtf8(calendar.timeZone().id()) << CRLF;
    }

    for (const Event &event : calendar.events()) {
        const QTimeZone &zone = event.timeZone();
        stream << "BEGIN:VEVENT" << CRLF;
        stream << "UID:" << (event.uid().isEmpty() ? generateUid() : encodeText(event.uid())) << CRLF;
        stream << "SUMMARY:" << encodeText(event.title()) << CRLF;
        if (!event.description().isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(event.description()) << CRLF;
        }
        if (!event.location().isEmpty()) {
            stream << "LOCATION:" << encodeText(event.location()) << CRLF;
        }
        stream << formatProperty(QStringLiteral("DTSTART"), event.start(), zone) << CRLF;
        stream << formatProperty(QStringLiteral("DTEND"), event.end(), zone) << CRLF;
        for (const QString &attendee : event.attendees()) {
            stream << "ATTENDEE:mailto:" << attendee << CRLF;
        }
        if (event.recurrence()) {
            stream << "RRULE:" << event.recurrence()->toRRule() << CRLF;
        }
        const QTime startTime = event.start().time();
        for (const QDate &date : event.exceptionDates()) {
            const auto exception = core::clock::resolve(date, startTime, zone, core::Disambiguation::ShiftForward);
            if (!exception) {
                qCWarning(lcAgendaIcs) << "Dropping exception date" << date << core::describe(exception.error());
                continue;
            }
            stream << formatProperty(QStringLiteral("EXDATE"), *exception, zone) << CRLF;
        }
        if (event.status() == EventStatus::Blocked) {
            stream << "STATUS:CONFIRMED" << CRLF;
            stream << "X-AGENDA-STATUS:BLOCKED" << CRLF;
        } else {
            stream << "STATUS:" << eventStatusName(event.status()) << CRLF;
        }
        if (event.filter()) {
            if (event.filter()->skipWeekends()) {
                stream << "X-AGENDA-SKIP-WEEKENDS:TRUE" << CRLF;
            }
            for (const QDate &date : event.filter()->skipDates()) {
                stream << "X-AGENDA-SKIP-DATE;VALUE=DATE:" << date.toString(QLatin1String(DATE_FORMAT)) << CRLF;
            }
        }
        stream << "END:VEVENT" << CRLF;
    }

    stream << "END:VCALENDAR" << CRLF;
    stream.flush();
    return output;
}

core::Result<Calendar> IcsCodec::fromIcs(const QString &text)
{
    Calendar calendar(QStringLiteral("Imported Calendar"));
    QTimeZone defaultZone = QTimeZone::utc();

    bool sawCalendar = false;
    bool inEvent = false;
    int nestedDepth = 0;
    PendingEvent current;

    auto finalizeEvent = [&]() {
        EventConfig &config = current.config;
        QTimeZone zone = config.start.isValid() && config.start.timeSpec() == Qt::TimeZone ? config.start.timeZone()
                                                                                           : defaultZone;
        if (!current.rawRule.isEmpty()) {
            const auto rule = RecurrenceRule::fromRRule(current.rawRule, zone);
            if (!rule) {
                qCWarning(lcAgendaIcs) << "Skipping event" << config.title << core::describe(rule.error());
                return;
            }
            config.recurrence = *rule;
        }
        for (const auto &entry : current.rawExceptionDates) {
            for (const QString &value : entry.first.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
                const auto instant = parseDateTime(value.trimmed(), entry.second, zone);
                if (!instant) {
                    qCWarning(lcAgendaIcs) << "Ignoring EXDATE" << value << core::describe(instant.error());
                    continue;
                }
                config.exceptionDates.insert(instant->toTimeZone(zone).date());
            }
        }
        if (current.blocked) {
            config.status = EventStatus::Blocked;
        }

        auto event = config.build();
        if (!event) {
            qCWarning(lcAgendaIcs) << "Skipping event" << config.title << core::describe(event.error());
            return;
        }
        calendar.addEvent(std::move(event).value());
    };

    auto handleLine = [&](const QString &line) {
        if (line.isEmpty()) {
            return;
        }
        if (line == QLatin1String("BEGIN:VCALENDAR")) {
            sawCalendar = true;
            return;
        }
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            nestedDepth = 0;
            current = PendingEvent{};
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            if (inEvent) {
                finalizeEvent();
            }
            inEvent = false;
            return;
        }
        // VALARM and similar sub-components are skipped wholesale.
        if (line.startsWith(QLatin1String("BEGIN:"))) {
            ++nestedDepth;
            return;
        }
        if (line.startsWith(QLatin1String("END:"))) {
            nestedDepth = qMax(0, nestedDepth - 1);
            return;
        }
        if (nestedDepth > 0) {
            return;
        }

        const int colonIndex = line.indexOf(QLatin1Char(':'));
        if (colonIndex <= 0) {
            return;
        }
        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(QLatin1Char(';'), 0, 0).toUpper();
        const QHash<QString, QString> parameters = parseParameters(property);
        const QString value = decodeText(rawValue);

        if (!inEvent) {
            if (name == QLatin1String("X-WR-CALNAME")) {
                calendar.setName(value);
            } else if (name == QLatin1String("X-WR-CALDESC")) {
                calendar.setDescription(value);
            } else if (name == QLatin1String("X-WR-TIMEZONE")) {
                const auto zone = core::clock::parseTimeZone(value);
                if (zone) {
                    defaultZone = *zone;
                    calendar.setTimeZone(*zone);
                } else {
                    qCWarning(lcAgendaIcs) << "Ignoring calendar zone" << value;
                }
            }
            return;
        }

        EventConfig &config = current.config;
        if (name == QLatin1String("UID")) {
            config.uid = value;
        } else if (name == QLatin1String("SUMMARY")) {
            config.title = value;
        } else if (name == QLatin1String("DESCRIPTION")) {
            config.description = value;
        } else if (name == QLatin1String("LOCATION")) {
            config.location = value;
        } else if (name == QLatin1String("DTSTART") || name == QLatin1String("DTEND")) {
            const auto instant = parseDateTime(rawValue, parameters, defaultZone);
            if (!instant) {
                qCWarning(lcAgendaIcs) << "Unreadable" << name << rawValue << core::describe(instant.error());
                return;
            }
            if (name == QLatin1String("DTSTART")) {
                config.start = *instant;
            } else {
                config.end = *instant;
            }
        } else if (name == QLatin1String("ATTENDEE")) {
            QString attendee = rawValue;
            if (attendee.startsWith(QLatin1String("mailto:"), Qt::CaseInsensitive)) {
                attendee = attendee.mid(7);
            }
            config.attendees << attendee;
        } else if (name == QLatin1String("RRULE")) {
            current.rawRule = rawValue;
        } else if (name == QLatin1String("EXDATE")) {
            current.rawExceptionDates.emplace_back(rawValue, parameters);
        } else if (name == QLatin1String("STATUS")) {
            const auto status = eventStatusFromName(rawValue);
            if (status) {
                config.status = *status;
            }
        } else if (name == QLatin1String("X-AGENDA-STATUS")) {
            current.blocked = rawValue.compare(QLatin1String("BLOCKED"), Qt::CaseInsensitive) == 0;
        } else if (name == QLatin1String("X-AGENDA-SKIP-WEEKENDS")) {
            config.skipWeekends = rawValue.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
        } else if (name == QLatin1String("X-AGENDA-SKIP-DATE")) {
            const QDate date = QDate::fromString(rawValue.left(8), QLatin1String(DATE_FORMAT));
            if (date.isValid()) {
                config.skipDates.insert(date);
            }
        }
    };

    QString input = text;
    QTextStream stream(&input, QIODevice::ReadOnly);
    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(QLatin1Char(' ')) || line.startsWith(QLatin1Char('\t')))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    if (!sawCalendar) {
        return icsError(QStringLiteral("Input has no VCALENDAR component"));
    }
    return calendar;
}

core::Result<void> IcsCodec::exportToFile(const Calendar &calendar, const QString &filePath)
{
    if (filePath.isEmpty()) {
        return core::makeError(core::ErrorCode::Io, QStringLiteral("No file path given"));
    }

    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return core::makeError(core::ErrorCode::Io, QStringLiteral("Cannot create %1").arg(dir.path()));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return core::makeError(core::ErrorCode::Io,
                               QStringLiteral("Failed to write ICS file %1: %2").arg(filePath, file.errorString()));
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << toIcs(calendar);
    stream.flush();
    if (!file.commit()) {
        return core::makeError(core::ErrorCode::Io,
                               QStringLiteral("Failed to write ICS file %1: %2").arg(filePath, file.errorString()));
    }
    return {};
}

core::Result<Calendar> IcsCodec::importFromFile(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return core::makeError(core::ErrorCode::Io,
                               QStringLiteral("Failed to read ICS file %1: %2").arg(filePath, file.errorString()));
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return fromIcs(stream.readAll());
}

QString IcsCodec::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace(QLatin1Char('\\'), QLatin1String("\\\\"));
    encoded.replace(QLatin1Char('\n'), QLatin1String("\\n"));
    encoded.replace(QLatin1Char(','), QLatin1String("\\,"));
    encoded.replace(QLatin1Char(';'), QLatin1String("\\;"));
    return encoded;
}

QString IcsCodec::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c == QLatin1Char('\\') && i + 1 < text.size()) {
            const QChar next = text.at(++i);
            if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
                decoded += QLatin1Char('\n');
            } else {
                decoded += next;
            }
            continue;
        }
        decoded += c;
    }
    return decoded;
}

bool IcsCodec::isUtc(const QTimeZone &zone)
{
    const QByteArray id = zone.id();
    return id == "UTC" || id == "Etc/UTC" || zone == QTimeZone::utc();
}

QString IcsCodec::formatProperty(const QString &name, const QDateTime &instant, const QTimeZone &zone)
{
    if (isUtc(zone)) {
        return QStringLiteral("%1:%2").arg(name, instant.toUTC().toString(QLatin1String(UTC_DATE_TIME_FORMAT)));
    }
    return QStringLiteral("%1;TZID=%2:%3")
        .arg(name, QString::fromUtf8(zone.id()), instant.toTimeZone(zone).toString(QLatin1String(DATE_TIME_FORMAT)));
}

core::Result<QDateTime> IcsCodec::parseDateTime(const QString &value, const QHash<QString, QString> &parameters,
                                                const QTimeZone &fallbackZone)
{
    QTimeZone zone = fallbackZone;
    if (parameters.contains(QStringLiteral("TZID"))) {
        const auto parsed = core::clock::parseTimeZone(parameters.value(QStringLiteral("TZID")));
        if (!parsed) {
            return parsed.error();
        }
        zone = *parsed;
    }

    if (value.length() == 8 || parameters.value(QStringLiteral("VALUE")).compare(QLatin1String("DATE"),
                                                                                  Qt::CaseInsensitive) == 0) {
        const QDate date = QDate::fromString(value.left(8), QLatin1String(DATE_FORMAT));
        if (!date.isValid()) {
            return core::makeError(core::ErrorCode::TimeParse, QStringLiteral("Invalid date '%1'").arg(value));
        }
        return core::clock::startOfDay(date, zone);
    }
    const auto civil = core::clock::parseBasicCivil(value);
    if (!civil) {
        return civil.error();
    }
    if (value.endsWith(QLatin1Char('Z'))) {
        return core::clock::resolve(civil->date, civil->time, QTimeZone::utc());
    }
    return core::clock::resolve(civil->date, civil->time, zone, core::Disambiguation::Earliest);
}

} // namespace data
} // namespace agenda
