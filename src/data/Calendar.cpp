#include "agenda/data/Calendar.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/ZonedClock.hpp"

#include <algorithm>

namespace agenda {
namespace data {

Calendar::Calendar(QString name, int maxOccurrencesPerEvent)
    : m_name(std::move(name))
    , m_maxOccurrencesPerEvent(maxOccurrencesPerEvent)
{
}

const QString &Calendar::name() const
{
    return m_name;
}

void Calendar::setName(const QString &name)
{
    m_name = name;
}

const QString &Calendar::description() const
{
    return m_description;
}

void Calendar::setDescription(const QString &description)
{
    m_description = description;
}

const QTimeZone &Calendar::timeZone() const
{
    return m_zone;
}

void Calendar::setTimeZone(const QTimeZone &zone)
{
    m_zone = zone;
}

int Calendar::maxOccurrencesPerEvent() const
{
    return m_maxOccurrencesPerEvent;
}

void Calendar::setMaxOccurrencesPerEvent(int cap)
{
    m_maxOccurrencesPerEvent = cap;
}

void Calendar::addEvent(Event event)
{
    m_events.push_back(std::move(event));
}

void Calendar::addEvents(std::vector<Event> events)
{
    m_events.reserve(m_events.size() + events.size());
    for (auto &event : events) {
        m_events.push_back(std::move(event));
    }
}

std::optional<Event> Calendar::removeEvent(std::size_t index)
{
    if (index >= m_events.size()) {
        return std::nullopt;
    }
    Event removed = std::move(m_events[index]);
    m_events.erase(m_events.begin() + static_cast<std::ptrdiff_t>(index));
    return removed;
}

bool Calendar::updateEvent(std::size_t index, const std::function<void(Event &)> &update)
{
    if (index >= m_events.size() || !update) {
        return false;
    }
    update(m_events[index]);
    return true;
}

void Calendar::clearEvents()
{
    m_events.clear();
}

const Event &Calendar::event(std::size_t index) const
{
    return m_events.at(index);
}

const std::vector<Event> &Calendar::events() const
{
    return m_events;
}

std::size_t Calendar::eventCount() const
{
    return m_events.size();
}

std::vector<std::size_t> Calendar::findEventsByTitle(const QString &text) const
{
    std::vector<std::size_t> matches;
    for (std::size_t index = 0; index < m_events.size(); ++index) {
        if (m_events[index].title().contains(text, Qt::CaseInsensitive)) {
            matches.push_back(index);
        }
    }
    return matches;
}

core::Result<std::vector<Occurrence>> Calendar::eventsBetween(const QDateTime &start, const QDateTime &end,
                                                              OccurrenceScope scope) const
{
    std::vector<Occurrence> occurrences;
    for (std::size_t index = 0; index < m_events.size(); ++index) {
        const Event &event = m_events[index];
        if (scope == OccurrenceScope::ActiveEvents && !event.isActive()) {
            continue;
        }
        const auto starts = event.occurrencesBetween(start, end, m_maxOccurrencesPerEvent);
        if (!starts) {
            return starts.error();
        }
        for (const QDateTime &instant : *starts) {
            occurrences.push_back(Occurrence{index, instant});
        }
    }

    std::stable_sort(occurrences.begin(), occurrences.end(), [](const Occurrence &lhs, const Occurrence &rhs) {
        return lhs.start < rhs.start;
    });
    qCDebug(lcAgendaCalendar) << "Expanded" << m_events.size() << "events into" << occurrences.size()
                              << "occurrences";
    return occurrences;
}

core::Result<std::vector<Occurrence>> Calendar::eventsOnDate(const QDateTime &date, OccurrenceScope scope) const
{
    const QTimeZone zone = core::clock::zoneOf(date);
    return eventsOnDate(date.toTimeZone(zone).date(), zone, scope);
}

core::Result<std::vector<Occurrence>> Calendar::eventsOnDate(const QDate &date, const QTimeZone &zone,
                                                             OccurrenceScope scope) const
{
    const auto dayStart = core::clock::startOfDay(date, zone);
    if (!dayStart) {
        return dayStart.error();
    }
    const auto dayEnd = core::clock::endOfDay(date, zone);
    if (!dayEnd) {
        return dayEnd.error();
    }
    return eventsBetween(*dayStart, *dayEnd, scope);
}

const Event &Calendar::eventFor(const Occurrence &occurrence) const
{
    return m_events.at(occurrence.eventIndex);
}

const QString &Calendar::titleOf(const Occurrence &occurrence) const
{
    return eventFor(occurrence).title();
}

QDateTime Calendar::endOf(const Occurrence &occurrence) const
{
    return occurrence.start.addSecs(eventFor(occurrence).duration().count());
}

} // namespace data
} // namespace agenda
