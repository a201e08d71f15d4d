#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTimeZone>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "agenda/core/Error.hpp"
#include "agenda/core/Settings.hpp"
#include "agenda/data/Event.hpp"

namespace agenda {
namespace data {

// One realization of an event. Refers to its event by position in the
// calendar that produced it and is only meaningful against that calendar.
struct Occurrence
{
    std::size_t eventIndex = 0;
    QDateTime start;
};

enum class OccurrenceScope
{
    AllEvents,
    ActiveEvents, // skips Cancelled events
};

class Calendar
{
public:
    explicit Calendar(QString name = QString(),
                      int maxOccurrencesPerEvent = core::Settings::DEFAULT_MAX_OCCURRENCES);

    const QString &name() const;
    void setName(const QString &name);

    const QString &description() const;
    void setDescription(const QString &description);

    const QTimeZone &timeZone() const;
    void setTimeZone(const QTimeZone &zone);

    int maxOccurrencesPerEvent() const;
    void setMaxOccurrencesPerEvent(int cap);

    void addEvent(Event event);
    void addEvents(std::vector<Event> events);
    std::optional<Event> removeEvent(std::size_t index);
    bool updateEvent(std::size_t index, const std::function<void(Event &)> &update);
    void clearEvents();

    const Event &event(std::size_t index) const;
    const std::vector<Event> &events() const;
    std::size_t eventCount() const;

    // Case-insensitive substring match; returns event indices.
    std::vector<std::size_t> findEventsByTitle(const QString &text) const;

    // All occurrences starting in [start, end], ordered by instant. Ties keep
    // event insertion order.
    core::Result<std::vector<Occurrence>> eventsBetween(const QDateTime &start, const QDateTime &end,
                                                        OccurrenceScope scope = OccurrenceScope::AllEvents) const;
    // Whole civil day of date, in date's own zone.
    core::Result<std::vector<Occurrence>> eventsOnDate(const QDateTime &date,
                                                       OccurrenceScope scope = OccurrenceScope::AllEvents) const;
    core::Result<std::vector<Occurrence>> eventsOnDate(const QDate &date, const QTimeZone &zone,
                                                       OccurrenceScope scope = OccurrenceScope::AllEvents) const;

    const Event &eventFor(const Occurrence &occurrence) const;
    const QString &titleOf(const Occurrence &occurrence) const;
    QDateTime endOf(const Occurrence &occurrence) const;

private:
    QString m_name;
    QString m_description;
    QTimeZone m_zone;
    int m_maxOccurrencesPerEvent = core::Settings::DEFAULT_MAX_OCCURRENCES;
    std::vector<Event> m_events;
};

} // namespace data
} // namespace agenda
