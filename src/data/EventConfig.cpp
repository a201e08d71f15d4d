#include "agenda/data/EventConfig.hpp"

#include "agenda/core/ZonedClock.hpp"

namespace agenda {
namespace data {

namespace {
core::Error validationError(const QString &message)
{
    return core::makeError(core::ErrorCode::Validation, message);
}
} // namespace

core::Result<Event> EventConfig::build() const
{
    if (title.isEmpty()) {
        return validationError(QStringLiteral("Event title is required"));
    }

    QTimeZone zone;
    if (!timeZoneId.isEmpty()) {
        const auto parsed = core::clock::parseTimeZone(timeZoneId);
        if (!parsed) {
            return parsed.error();
        }
        zone = *parsed;
    }

    QDateTime startInstant = start;
    if (!startCivil.isEmpty()) {
        if (start.isValid()) {
            return validationError(QStringLiteral("Event start given both as instant and as civil text"));
        }
        if (!zone.isValid()) {
            return validationError(QStringLiteral("Event timezone is required for civil start '%1'").arg(startCivil));
        }
        const auto resolved = core::clock::resolve(startCivil, zone, core::Disambiguation::Earliest);
        if (!resolved) {
            return resolved.error();
        }
        startInstant = *resolved;
    }
    if (!startInstant.isValid()) {
        return validationError(QStringLiteral("Event start time is required"));
    }
    if (!zone.isValid() && startInstant.timeSpec() == Qt::TimeZone) {
        zone = startInstant.timeZone();
    }
    if (!zone.isValid() && startInstant.timeSpec() == Qt::UTC) {
        zone = QTimeZone::utc();
    }
    if (!zone.isValid()) {
        return validationError(QStringLiteral("Event timezone is required"));
    }

    const int endSources = (end.isValid() ? 1 : 0) + (endCivil.isEmpty() ? 0 : 1) + (duration ? 1 : 0);
    if (endSources > 1) {
        return validationError(QStringLiteral("Event end given more than once"));
    }

    QDateTime endInstant = end;
    if (!endCivil.isEmpty()) {
        const auto resolved = core::clock::resolve(endCivil, zone, core::Disambiguation::Earliest);
        if (!resolved) {
            return resolved.error();
        }
        endInstant = *resolved;
    } else if (duration) {
        endInstant = startInstant.addSecs(duration->count());
    }
    if (!endInstant.isValid()) {
        return validationError(QStringLiteral("Event end time is required"));
    }

    auto created = Event::create(title, startInstant, endInstant, zone);
    if (!created) {
        return created.error();
    }

    Event &event = *created;
    event.setDescription(description);
    event.setLocation(location);
    event.setUid(uid);
    event.setAttendees(attendees);
    if (recurrence) {
        const auto valid = recurrence->validate();
        if (!valid) {
            return valid.error();
        }
        event.setRecurrence(recurrence);
    }
    if (skipWeekends || !skipDates.empty()) {
        RecurrenceFilter filter;
        filter.setSkipWeekends(skipWeekends);
        for (const QDate &date : skipDates) {
            filter.addSkipDate(date);
        }
        event.setFilter(filter);
    }
    event.setExceptionDates(exceptionDates);
    event.setStatus(status);
    return created;
}

} // namespace data
} // namespace agenda
