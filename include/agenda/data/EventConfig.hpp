#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <chrono>
#include <optional>
#include <set>

#include "agenda/core/Error.hpp"
#include "agenda/data/Event.hpp"

namespace agenda {
namespace data {

// Every field of an event in raw form. Nothing is checked until build(),
// which either returns a complete Event or the first problem found.
struct EventConfig
{
    QString title;
    QString description;
    QString location;
    QString uid;
    QStringList attendees;

    // Start: either an instant, or civil text resolved in timeZoneId.
    QDateTime start;
    QString startCivil;
    QString timeZoneId;

    // End: an instant, civil text in the event zone, or a duration.
    QDateTime end;
    QString endCivil;
    std::optional<std::chrono::seconds> duration;

    std::optional<RecurrenceRule> recurrence;
    bool skipWeekends = false;
    std::set<QDate> skipDates;
    std::set<QDate> exceptionDates;
    EventStatus status = EventStatus::Confirmed;

    core::Result<Event> build() const;
};

} // namespace data
} // namespace agenda
