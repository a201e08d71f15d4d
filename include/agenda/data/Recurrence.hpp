#pragma once

#include <QDateTime>
#include <QString>
#include <QTimeZone>

#include <optional>
#include <vector>

#include "agenda/core/Error.hpp"

namespace agenda {
namespace data {

enum class Frequency
{
    Daily,
    Weekly,
    Monthly,
    Yearly,
};

QString frequencyName(Frequency frequency);
core::Result<Frequency> frequencyFromName(const QString &name);

// Repetition pattern of an event. The terminator is either a count, an
// until instant, or absent; setting one clears the other.
class RecurrenceRule
{
public:
    explicit RecurrenceRule(Frequency frequency = Frequency::Daily);

    static RecurrenceRule daily();
    static RecurrenceRule weekly();
    static RecurrenceRule monthly();
    static RecurrenceRule yearly();

    Frequency frequency() const;
    void setFrequency(Frequency frequency);

    int interval() const;
    void setInterval(int interval);

    std::optional<int> count() const;
    void setCount(int count);

    std::optional<QDateTime> until() const;
    void setUntil(const QDateTime &until);

    void clearTerminator();

    // Stored for export only; generation does not consult it.
    const std::vector<Qt::DayOfWeek> &weekdays() const;
    void setWeekdays(std::vector<Qt::DayOfWeek> weekdays);

    core::Result<void> validate() const;

    // FREQ=...;INTERVAL=...;COUNT=...|UNTIL=...;BYDAY=...
    QString toRRule() const;
    static core::Result<RecurrenceRule> fromRRule(const QString &text, const QTimeZone &zone);

    bool operator==(const RecurrenceRule &other) const;
    bool operator!=(const RecurrenceRule &other) const { return !(*this == other); }

private:
    Frequency m_frequency = Frequency::Daily;
    int m_interval = 1;
    std::optional<int> m_count;
    std::optional<QDateTime> m_until;
    std::vector<Qt::DayOfWeek> m_weekdays;
};

QString weekdayCode(Qt::DayOfWeek day);
std::optional<Qt::DayOfWeek> weekdayFromCode(const QString &code);

// Strictly increasing instants starting at anchor, at most cap of them.
// Stops early (without error) when a monthly or yearly step lands on a
// date the target month or year does not have.
core::Result<std::vector<QDateTime>> generateOccurrences(const RecurrenceRule &rule, const QDateTime &anchor,
                                                         int cap);

} // namespace data
} // namespace agenda
