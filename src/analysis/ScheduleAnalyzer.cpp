#include "agenda/analysis/ScheduleAnalyzer.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/data/Calendar.hpp"

#include <algorithm>

namespace agenda {
namespace analysis {

using data::OccurrenceScope;

namespace {
std::chrono::seconds between(const QDateTime &from, const QDateTime &to)
{
    return std::chrono::seconds(from.secsTo(to));
}

TimeGap makeGap(const QDateTime &start, const QDateTime &end, const QString &preceding, const QString &following)
{
    TimeGap gap;
    gap.start = start;
    gap.end = end;
    gap.duration = between(start, end);
    gap.precedingLabel = preceding;
    gap.followingLabel = following;
    return gap;
}
} // namespace

qint64 TimeGap::durationMinutes() const
{
    return std::chrono::duration_cast<std::chrono::minutes>(duration).count();
}

qint64 Overlap::durationMinutes() const
{
    return std::chrono::duration_cast<std::chrono::minutes>(duration).count();
}

bool DensityReport::isBusy() const
{
    return occupancyPercent > 60.0;
}

bool DensityReport::isLight() const
{
    return occupancyPercent < 30.0;
}

bool DensityReport::hasConflicts() const
{
    return overlapCount > 0;
}

ScheduleAnalyzer::ScheduleAnalyzer(const data::Calendar &calendar)
    : m_calendar(calendar)
{
}

std::chrono::seconds ScheduleAnalyzer::suggestionStep() const
{
    return m_suggestionStep;
}

void ScheduleAnalyzer::setSuggestionStep(std::chrono::seconds step)
{
    if (step.count() <= 0) {
        return;
    }
    m_suggestionStep = step;
}

std::chrono::seconds ScheduleAnalyzer::slotLookback() const
{
    return m_slotLookback;
}

void ScheduleAnalyzer::setSlotLookback(std::chrono::seconds lookback)
{
    if (lookback.count() < 0) {
        return;
    }
    m_slotLookback = lookback;
}

core::Result<std::vector<TimeGap>> ScheduleAnalyzer::findGaps(const QDateTime &start, const QDateTime &end,
                                                              std::chrono::seconds minDuration) const
{
    const auto occurrences = m_calendar.eventsBetween(start, end, OccurrenceScope::ActiveEvents);
    if (!occurrences) {
        return occurrences.error();
    }

    std::vector<TimeGap> gaps;
    QDateTime frontier = start;
    QString frontierLabel;
    for (const auto &occurrence : *occurrences) {
        const QString &title = m_calendar.titleOf(occurrence);
        if (occurrence.start > frontier) {
            TimeGap gap = makeGap(frontier, occurrence.start, frontierLabel, title);
            if (gap.duration >= minDuration) {
                gaps.push_back(std::move(gap));
            }
        }
        const QDateTime occurrenceEnd = m_calendar.endOf(occurrence);
        if (occurrenceEnd > frontier) {
            frontier = occurrenceEnd;
            frontierLabel = title;
        }
    }

    if (end > frontier) {
        TimeGap gap = makeGap(frontier, end, frontierLabel, QString());
        if (gap.duration >= minDuration) {
            gaps.push_back(std::move(gap));
        }
    }
    return gaps;
}

core::Result<std::vector<Overlap>> ScheduleAnalyzer::findOverlaps(const QDateTime &start,
                                                                  const QDateTime &end) const
{
    const auto occurrences = m_calendar.eventsBetween(start, end, OccurrenceScope::ActiveEvents);
    if (!occurrences) {
        return occurrences.error();
    }

    std::vector<Overlap> overlaps;
    const auto &list = *occurrences;
    for (std::size_t i = 0; i < list.size(); ++i) {
        const QDateTime startI = list[i].start;
        const QDateTime endI = m_calendar.endOf(list[i]);
        for (std::size_t j = i + 1; j < list.size(); ++j) {
            const QDateTime startJ = list[j].start;
            const QDateTime endJ = m_calendar.endOf(list[j]);
            if (startI < endJ && startJ < endI) {
                Overlap overlap;
                overlap.start = std::max(startI, startJ);
                overlap.end = std::min(endI, endJ);
                overlap.duration = between(overlap.start, overlap.end);
                overlap.participants << m_calendar.titleOf(list[i]) << m_calendar.titleOf(list[j]);
                overlaps.push_back(std::move(overlap));
            }
        }
    }
    if (!overlaps.empty()) {
        qCDebug(lcAgendaAnalysis) << "Found" << overlaps.size() << "overlapping pairs between" << start << "and"
                                  << end;
    }
    return overlaps;
}

core::Result<DensityReport> ScheduleAnalyzer::calculateDensity(const QDateTime &start, const QDateTime &end) const
{
    const auto occurrences = m_calendar.eventsBetween(start, end, OccurrenceScope::ActiveEvents);
    if (!occurrences) {
        return occurrences.error();
    }

    DensityReport report;
    report.windowDuration = between(start, end);
    for (const auto &occurrence : *occurrences) {
        const QDateTime clippedStart = std::max(occurrence.start, start);
        const QDateTime clippedEnd = std::min(m_calendar.endOf(occurrence), end);
        if (clippedEnd > clippedStart) {
            report.busyDuration += between(clippedStart, clippedEnd);
        }
    }
    report.freeDuration = report.windowDuration - report.busyDuration;
    if (report.windowDuration.count() > 0) {
        report.occupancyPercent = static_cast<double>(report.busyDuration.count()) * 100.0
            / static_cast<double>(report.windowDuration.count());
    }
    report.occurrenceCount = occurrences->size();

    const auto gaps = findGaps(start, end, std::chrono::seconds(0));
    if (!gaps) {
        return gaps.error();
    }
    report.gapCount = gaps->size();

    const auto overlaps = findOverlaps(start, end);
    if (!overlaps) {
        return overlaps.error();
    }
    report.overlapCount = overlaps->size();
    return report;
}

core::Result<std::optional<TimeGap>> ScheduleAnalyzer::findLongestGap(const QDateTime &start,
                                                                      const QDateTime &end) const
{
    const auto gaps = findGaps(start, end, std::chrono::seconds(0));
    if (!gaps) {
        return gaps.error();
    }
    std::optional<TimeGap> longest;
    for (const TimeGap &gap : *gaps) {
        if (!longest || gap.duration > longest->duration) {
            longest = gap;
        }
    }
    return longest;
}

core::Result<std::vector<TimeGap>> ScheduleAnalyzer::findAvailableSlots(const QDateTime &start,
                                                                        const QDateTime &end,
                                                                        std::chrono::seconds duration) const
{
    return findGaps(start, end, duration);
}

core::Result<bool> ScheduleAnalyzer::isSlotAvailable(const QDateTime &slotStart, const QDateTime &slotEnd) const
{
    const QDateTime queryStart = slotStart.addSecs(-m_slotLookback.count());
    const auto occurrences = m_calendar.eventsBetween(queryStart, slotEnd, OccurrenceScope::ActiveEvents);
    if (!occurrences) {
        return occurrences.error();
    }
    for (const auto &occurrence : *occurrences) {
        if (occurrence.start < slotEnd && slotStart < m_calendar.endOf(occurrence)) {
            return false;
        }
    }
    return true;
}

core::Result<std::vector<QDateTime>> ScheduleAnalyzer::suggestAlternatives(const QDateTime &requestedStart,
                                                                           std::chrono::seconds duration,
                                                                           std::chrono::seconds searchWindow) const
{
    const QDateTime searchStart = requestedStart.addSecs(-searchWindow.count());
    const QDateTime searchEnd = requestedStart.addSecs(searchWindow.count());
    const auto gaps = findGaps(searchStart, searchEnd, duration);
    if (!gaps) {
        return gaps.error();
    }

    std::vector<QDateTime> suggestions;
    for (const TimeGap &gap : *gaps) {
        if (gap.duration < duration) {
            continue;
        }
        suggestions.push_back(gap.start);
        QDateTime candidate = gap.start.addSecs(m_suggestionStep.count());
        while (candidate.addSecs(duration.count()) <= gap.end) {
            suggestions.push_back(candidate);
            candidate = candidate.addSecs(m_suggestionStep.count());
        }
    }
    std::sort(suggestions.begin(), suggestions.end());
    return suggestions;
}

} // namespace analysis
} // namespace agenda
