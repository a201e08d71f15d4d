#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QTimeZone>

#include <chrono>
#include <optional>
#include <set>
#include <vector>

#include "agenda/core/Error.hpp"
#include "agenda/core/Settings.hpp"
#include "agenda/data/Recurrence.hpp"
#include "agenda/data/RecurrenceFilter.hpp"

namespace agenda {
namespace data {

enum class EventStatus
{
    Confirmed,
    Tentative,
    Cancelled,
    Blocked,
};

QString eventStatusName(EventStatus status);
std::optional<EventStatus> eventStatusFromName(const QString &name);

// A titled interval in its own zone. end() > start() holds for every
// instance; construction and reschedule() reject anything else.
class Event
{
public:
    static core::Result<Event> create(const QString &title, const QDateTime &start, const QDateTime &end,
                                      const QTimeZone &zone = QTimeZone());
    static core::Result<Event> create(const QString &title, const QDateTime &start, std::chrono::seconds duration,
                                      const QTimeZone &zone = QTimeZone());

    const QString &title() const;
    const QDateTime &start() const;
    const QDateTime &end() const;
    const QTimeZone &timeZone() const;

    const QString &description() const;
    void setDescription(const QString &description);

    const QString &location() const;
    void setLocation(const QString &location);

    const QString &uid() const;
    void setUid(const QString &uid);

    const QStringList &attendees() const;
    void setAttendees(const QStringList &attendees);
    void addAttendee(const QString &attendee);

    const std::optional<RecurrenceRule> &recurrence() const;
    void setRecurrence(std::optional<RecurrenceRule> rule);

    const std::optional<RecurrenceFilter> &filter() const;
    void setFilter(std::optional<RecurrenceFilter> filter);

    const std::set<QDate> &exceptionDates() const;
    void setExceptionDates(std::set<QDate> dates);
    void addExceptionDate(const QDate &date);

    EventStatus status() const;
    void setStatus(EventStatus status);

    std::chrono::seconds duration() const;
    bool isActive() const;

    void confirm();
    void cancel();
    void tentative();
    // Un-cancels: a Cancelled event becomes Confirmed on success.
    core::Result<void> reschedule(const QDateTime &newStart, const QDateTime &newEnd);

    // Occurrence starts inside [rangeStart, rangeEnd], both ends inclusive.
    core::Result<std::vector<QDateTime>> occurrencesBetween(const QDateTime &rangeStart, const QDateTime &rangeEnd,
                                                            int maxOccurrences) const;
    core::Result<bool> occursOn(const QDate &date,
                                int maxOccurrences = core::Settings::DEFAULT_MAX_OCCURRENCES) const;

private:
    Event() = default;

    QString m_title;
    QString m_description;
    QDateTime m_start;
    QDateTime m_end;
    QTimeZone m_zone;
    QStringList m_attendees;
    std::optional<RecurrenceRule> m_recurrence;
    std::optional<RecurrenceFilter> m_filter;
    std::set<QDate> m_exceptionDates;
    QString m_location;
    QString m_uid;
    EventStatus m_status = EventStatus::Confirmed;
};

} // namespace data
} // namespace agenda
