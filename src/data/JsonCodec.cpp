#include "agenda/data/JsonCodec.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/ZonedClock.hpp"
#include "agenda/data/EventConfig.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace agenda {
namespace data {

namespace {
core::Error jsonError(const QString &message)
{
    return core::makeError(core::ErrorCode::Json, message);
}

QJsonArray datesToJson(const std::set<QDate> &dates)
{
    QJsonArray array;
    for (const QDate &date : dates) {
        array.append(date.toString(Qt::ISODate));
    }
    return array;
}

core::Result<std::set<QDate>> datesFromJson(const QJsonValue &value, const char *field)
{
    std::set<QDate> dates;
    for (const QJsonValue &entry : value.toArray()) {
        const QDate date = QDate::fromString(entry.toString(), Qt::ISODate);
        if (!date.isValid()) {
            return jsonError(QStringLiteral("Invalid date '%1' in '%2'").arg(entry.toString(),
                                                                             QLatin1String(field)));
        }
        dates.insert(date);
    }
    return dates;
}

core::Result<QDateTime> instantFromJson(const QJsonObject &object, const char *field, const QTimeZone &zone)
{
    const QString text = object.value(QLatin1String(field)).toString();
    if (text.isEmpty()) {
        return jsonError(QStringLiteral("Event missing '%1'").arg(QLatin1String(field)));
    }
    const QDateTime parsed = QDateTime::fromString(text, Qt::ISODate);
    if (!parsed.isValid()) {
        return core::makeError(core::ErrorCode::TimeParse,
                               QStringLiteral("Invalid '%1' value '%2'").arg(QLatin1String(field), text));
    }
    return parsed.toTimeZone(zone);
}
} // namespace

QByteArray JsonCodec::toJson(const Calendar &calendar)
{
    QJsonObject root;
    root.insert(QStringLiteral("name"), calendar.name());
    if (!calendar.description().isEmpty()) {
        root.insert(QStringLiteral("description"), calendar.description());
    }
    if (calendar.timeZone().isValid()) {
        root.insert(QStringLiteral("timezone"), QString::fromUtf8(calendar.timeZone().id()));
    }
    QJsonArray events;
    for (const Event &event : calendar.events()) {
        events.append(eventToJson(event));
    }
    root.insert(QStringLiteral("events"), events);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

core::Result<Calendar> JsonCodec::fromJson(const QByteArray &json)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return jsonError(QStringLiteral("JSON parse error: %1").arg(parseError.errorString()));
    }
    if (!document.isObject()) {
        return jsonError(QStringLiteral("Calendar JSON must be an object"));
    }

    const QJsonObject root = document.object();
    if (!root.value(QStringLiteral("name")).isString()) {
        return jsonError(QStringLiteral("Missing 'name' field"));
    }
    Calendar calendar(root.value(QStringLiteral("name")).toString());
    calendar.setDescription(root.value(QStringLiteral("description")).toString());

    const QString zoneId = root.value(QStringLiteral("timezone")).toString();
    if (!zoneId.isEmpty()) {
        const auto zone = core::clock::parseTimeZone(zoneId);
        if (!zone) {
            return zone.error();
        }
        calendar.setTimeZone(*zone);
    }

    for (const QJsonValue &value : root.value(QStringLiteral("events")).toArray()) {
        auto event = eventFromJson(value.toObject());
        if (!event) {
            qCWarning(lcAgendaJson) << "Rejecting calendar" << calendar.name() << core::describe(event.error());
            return event.error();
        }
        calendar.addEvent(std::move(event).value());
    }
    qCDebug(lcAgendaJson) << "Read" << calendar.eventCount() << "events from JSON";
    return calendar;
}

QJsonObject JsonCodec::eventToJson(const Event &event)
{
    QJsonObject object;
    object.insert(QStringLiteral("title"), event.title());
    if (!event.description().isEmpty()) {
        object.insert(QStringLiteral("description"), event.description());
    }
    object.insert(QStringLiteral("start_time"), event.start().toString(Qt::ISODate));
    object.insert(QStringLiteral("end_time"), event.end().toString(Qt::ISODate));
    object.insert(QStringLiteral("timezone"), QString::fromUtf8(event.timeZone().id()));
    object.insert(QStringLiteral("attendees"), QJsonArray::fromStringList(event.attendees()));
    if (!event.location().isEmpty()) {
        object.insert(QStringLiteral("location"), event.location());
    }
    if (!event.uid().isEmpty()) {
        object.insert(QStringLiteral("uid"), event.uid());
    }
    object.insert(QStringLiteral("status"), eventStatusName(event.status()));
    if (event.recurrence()) {
        object.insert(QStringLiteral("rrule"), event.recurrence()->toRRule());
    }
    if (event.filter()) {
        QJsonObject filter;
        filter.insert(QStringLiteral("skip_weekends"), event.filter()->skipWeekends());
        filter.insert(QStringLiteral("skip_dates"), datesToJson(event.filter()->skipDates()));
        object.insert(QStringLiteral("filter"), filter);
    }
    if (!event.exceptionDates().empty()) {
        object.insert(QStringLiteral("exception_dates"), datesToJson(event.exceptionDates()));
    }
    return object;
}

core::Result<Event> JsonCodec::eventFromJson(const QJsonObject &object)
{
    const QString title = object.value(QStringLiteral("title")).toString();
    if (title.isEmpty()) {
        return jsonError(QStringLiteral("Event missing 'title'"));
    }
    const QString zoneId = object.value(QStringLiteral("timezone")).toString();
    if (zoneId.isEmpty()) {
        return jsonError(QStringLiteral("Event missing 'timezone'"));
    }
    const auto zone = core::clock::parseTimeZone(zoneId);
    if (!zone) {
        return zone.error();
    }

    const auto start = instantFromJson(object, "start_time", *zone);
    if (!start) {
        return start.error();
    }
    const auto end = instantFromJson(object, "end_time", *zone);
    if (!end) {
        return end.error();
    }

    EventConfig config;
    config.title = title;
    config.description = object.value(QStringLiteral("description")).toString();
    config.location = object.value(QStringLiteral("location")).toString();
    config.uid = object.value(QStringLiteral("uid")).toString();
    config.timeZoneId = zoneId;
    config.start = *start;
    config.end = *end;
    for (const QJsonValue &attendee : object.value(QStringLiteral("attendees")).toArray()) {
        config.attendees << attendee.toString();
    }

    const QString statusName = object.value(QStringLiteral("status")).toString();
    if (!statusName.isEmpty()) {
        const auto status = eventStatusFromName(statusName);
        if (!status) {
            return jsonError(QStringLiteral("Unknown status '%1'").arg(statusName));
        }
        config.status = *status;
    }

    const QString rrule = object.value(QStringLiteral("rrule")).toString();
    if (!rrule.isEmpty()) {
        const auto rule = RecurrenceRule::fromRRule(rrule, *zone);
        if (!rule) {
            return rule.error();
        }
        config.recurrence = *rule;
    }

    if (object.contains(QStringLiteral("filter"))) {
        const QJsonObject filter = object.value(QStringLiteral("filter")).toObject();
        config.skipWeekends = filter.value(QStringLiteral("skip_weekends")).toBool();
        const auto skipDates = datesFromJson(filter.value(QStringLiteral("skip_dates")), "skip_dates");
        if (!skipDates) {
            return skipDates.error();
        }
        config.skipDates = *skipDates;
    }

    const auto exceptionDates = datesFromJson(object.value(QStringLiteral("exception_dates")), "exception_dates");
    if (!exceptionDates) {
        return exceptionDates.error();
    }
    config.exceptionDates = *exceptionDates;

    return config.build();
}

} // namespace data
} // namespace agenda
