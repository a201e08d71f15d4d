#include "agenda/data/Event.hpp"

#include "agenda/core/ZonedClock.hpp"

#include <algorithm>

namespace agenda {
namespace data {

namespace {
core::Error validationError(const QString &message)
{
    return core::makeError(core::ErrorCode::Validation, message);
}
} // namespace

QString eventStatusName(EventStatus status)
{
    switch (status) {
    case EventStatus::Tentative:
        return QStringLiteral("TENTATIVE");
    case EventStatus::Cancelled:
        return QStringLiteral("CANCELLED");
    case EventStatus::Blocked:
        return QStringLiteral("BLOCKED");
    case EventStatus::Confirmed:
    default:
        return QStringLiteral("CONFIRMED");
    }
}

std::optional<EventStatus> eventStatusFromName(const QString &name)
{
    const QString normalized = name.trimmed().toUpper();
    if (normalized == QLatin1String("CONFIRMED")) {
        return EventStatus::Confirmed;
    }
    if (normalized == QLatin1String("TENTATIVE")) {
        return EventStatus::Tentative;
    }
    if (normalized == QLatin1String("CANCELLED")) {
        return EventStatus::Cancelled;
    }
    if (normalized == QLatin1String("BLOCKED")) {
        return EventStatus::Blocked;
    }
    return std::nullopt;
}

core::Result<Event> Event::create(const QString &title, const QDateTime &start, const QDateTime &end,
                                  const QTimeZone &zone)
{
    if (title.isEmpty()) {
        return validationError(QStringLiteral("Event title is required"));
    }
    if (!start.isValid()) {
        return validationError(QStringLiteral("Event start time is required"));
    }
    if (!end.isValid()) {
        return validationError(QStringLiteral("Event end time is required"));
    }
    const QTimeZone eventZone = zone.isValid() ? zone : core::clock::zoneOf(start);
    if (!eventZone.isValid()) {
        return validationError(QStringLiteral("Event timezone is required"));
    }
    if (end <= start) {
        return validationError(QStringLiteral("Event end time must be after start time"));
    }

    Event event;
    event.m_title = title;
    event.m_zone = eventZone;
    event.m_start = start.toTimeZone(eventZone);
    event.m_end = end.toTimeZone(eventZone);
    return event;
}

core::Result<Event> Event::create(const QString &title, const QDateTime &start, std::chrono::seconds duration,
                                  const QTimeZone &zone)
{
    if (!start.isValid()) {
        return validationError(QStringLiteral("Event start time is required"));
    }
    return create(title, start, start.addSecs(duration.count()), zone);
}

const QString &Event::title() const
{
    return m_title;
}

const QDateTime &Event::start() const
{
    return m_start;
}

const QDateTime &Event::end() const
{
    return m_end;
}

const QTimeZone &Event::timeZone() const
{
    return m_zone;
}

const QString &Event::description() const
{
    return m_description;
}

void Event::setDescription(const QString &description)
{
    m_description = description;
}

const QString &Event::location() const
{
    return m_location;
}

void Event::setLocation(const QString &location)
{
    m_location = location;
}

const QString &Event::uid() const
{
    return m_uid;
}

void Event::setUid(const QString &uid)
{
    m_uid = uid;
}

const QStringList &Event::attendees() const
{
    return m_attendees;
}

void Event::setAttendees(const QStringList &attendees)
{
    m_attendees = attendees;
}

void Event::addAttendee(const QString &attendee)
{
    m_attendees << attendee;
}

const std::optional<RecurrenceRule> &Event::recurrence() const
{
    return m_recurrence;
}

void Event::setRecurrence(std::optional<RecurrenceRule> rule)
{
    m_recurrence = std::move(rule);
}

const std::optional<RecurrenceFilter> &Event::filter() const
{
    return m_filter;
}

void Event::setFilter(std::optional<RecurrenceFilter> filter)
{
    m_filter = std::move(filter);
}

const std::set<QDate> &Event::exceptionDates() const
{
    return m_exceptionDates;
}

void Event::setExceptionDates(std::set<QDate> dates)
{
    m_exceptionDates = std::move(dates);
}

void Event::addExceptionDate(const QDate &date)
{
    if (date.isValid()) {
        m_exceptionDates.insert(date);
    }
}

EventStatus Event::status() const
{
    return m_status;
}

void Event::setStatus(EventStatus status)
{
    m_status = status;
}

std::chrono::seconds Event::duration() const
{
    return std::chrono::seconds(m_start.secsTo(m_end));
}

bool Event::isActive() const
{
    return m_status != EventStatus::Cancelled;
}

void Event::confirm()
{
    m_status = EventStatus::Confirmed;
}

void Event::cancel()
{
    m_status = EventStatus::Cancelled;
}

void Event::tentative()
{
    m_status = EventStatus::Tentative;
}

core::Result<void> Event::reschedule(const QDateTime &newStart, const QDateTime &newEnd)
{
    if (!newStart.isValid() || !newEnd.isValid()) {
        return validationError(QStringLiteral("Reschedule needs valid start and end times"));
    }
    if (newEnd <= newStart) {
        return validationError(QStringLiteral("Event end time must be after start time"));
    }
    m_start = newStart.toTimeZone(m_zone);
    m_end = newEnd.toTimeZone(m_zone);
    if (m_status == EventStatus::Cancelled) {
        m_status = EventStatus::Confirmed;
    }
    return {};
}

core::Result<std::vector<QDateTime>> Event::occurrencesBetween(const QDateTime &rangeStart,
                                                               const QDateTime &rangeEnd, int maxOccurrences) const
{
    std::vector<QDateTime> occurrences;
    if (!m_recurrence) {
        if (m_start >= rangeStart && m_start <= rangeEnd) {
            occurrences.push_back(m_start);
        }
        return occurrences;
    }

    auto generated = generateOccurrences(*m_recurrence, m_start, maxOccurrences);
    if (!generated) {
        return generated.error();
    }
    occurrences = std::move(generated).value();

    occurrences.erase(std::remove_if(occurrences.begin(), occurrences.end(),
                                     [&](const QDateTime &instant) {
                                         return instant < rangeStart || instant > rangeEnd;
                                     }),
                      occurrences.end());

    if (m_filter) {
        occurrences = m_filter->filterOccurrences(occurrences);
    }

    if (!m_exceptionDates.empty()) {
        occurrences.erase(std::remove_if(occurrences.begin(), occurrences.end(),
                                         [this](const QDateTime &instant) {
                                             return m_exceptionDates.count(instant.date()) > 0;
                                         }),
                          occurrences.end());
    }
    return occurrences;
}

core::Result<bool> Event::occursOn(const QDate &date, int maxOccurrences) const
{
    const auto dayStart = core::clock::startOfDay(date, m_zone);
    if (!dayStart) {
        return dayStart.error();
    }
    const auto dayEnd = core::clock::endOfDay(date, m_zone);
    if (!dayEnd) {
        return dayEnd.error();
    }
    const auto occurrences = occurrencesBetween(*dayStart, *dayEnd, maxOccurrences);
    if (!occurrences) {
        return occurrences.error();
    }
    return !occurrences->empty();
}

} // namespace data
} // namespace agenda
