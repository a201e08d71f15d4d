#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <chrono>
#include <optional>
#include <vector>

#include "agenda/core/Error.hpp"

namespace agenda {
namespace data {
class Calendar;
}

namespace analysis {

struct TimeGap
{
    QDateTime start;
    QDateTime end;
    std::chrono::seconds duration{0};
    QString precedingLabel; // empty when no occurrence precedes the gap
    QString followingLabel; // empty for the trailing gap

    qint64 durationMinutes() const;
};

struct Overlap
{
    QDateTime start;
    QDateTime end;
    std::chrono::seconds duration{0};
    QStringList participants;

    qint64 durationMinutes() const;
};

struct DensityReport
{
    std::chrono::seconds windowDuration{0};
    std::chrono::seconds busyDuration{0};
    std::chrono::seconds freeDuration{0};
    double occupancyPercent = 0.0;
    std::size_t occurrenceCount = 0;
    std::size_t gapCount = 0;
    std::size_t overlapCount = 0;

    bool isBusy() const;  // > 60 %
    bool isLight() const; // < 30 %
    bool hasConflicts() const;
};

// Free time, conflicts and occupancy of a calendar. Cancelled events are
// left out of every computation. Nothing is cached: each call expands the
// calendar again.
class ScheduleAnalyzer
{
public:
    explicit ScheduleAnalyzer(const data::Calendar &calendar);

    std::chrono::seconds suggestionStep() const;
    void setSuggestionStep(std::chrono::seconds step);

    std::chrono::seconds slotLookback() const;
    void setSlotLookback(std::chrono::seconds lookback);

    core::Result<std::vector<TimeGap>> findGaps(const QDateTime &start, const QDateTime &end,
                                                std::chrono::seconds minDuration) const;
    // Pairwise: three mutually overlapping occurrences give three records.
    core::Result<std::vector<Overlap>> findOverlaps(const QDateTime &start, const QDateTime &end) const;
    // Busy time is the unmerged sum, so overlapping occurrences count twice.
    core::Result<DensityReport> calculateDensity(const QDateTime &start, const QDateTime &end) const;

    core::Result<std::optional<TimeGap>> findLongestGap(const QDateTime &start, const QDateTime &end) const;
    core::Result<std::vector<TimeGap>> findAvailableSlots(const QDateTime &start, const QDateTime &end,
                                                          std::chrono::seconds duration) const;
    // Touching boundaries do not conflict.
    core::Result<bool> isSlotAvailable(const QDateTime &slotStart, const QDateTime &slotEnd) const;
    core::Result<std::vector<QDateTime>> suggestAlternatives(const QDateTime &requestedStart,
                                                             std::chrono::seconds duration,
                                                             std::chrono::seconds searchWindow) const;

private:
    const data::Calendar &m_calendar;
    std::chrono::seconds m_suggestionStep{std::chrono::hours(1)};
    std::chrono::seconds m_slotLookback{std::chrono::hours(24)};
};

} // namespace analysis
} // namespace agenda
