#include "agenda/data/RecurrenceFilter.hpp"

#include <algorithm>
#include <iterator>

namespace agenda {
namespace data {

bool RecurrenceFilter::skipWeekends() const
{
    return m_skipWeekends;
}

void RecurrenceFilter::setSkipWeekends(bool skip)
{
    m_skipWeekends = skip;
}

const std::set<QDate> &RecurrenceFilter::skipDates() const
{
    return m_skipDates;
}

void RecurrenceFilter::addSkipDate(const QDate &date)
{
    if (date.isValid()) {
        m_skipDates.insert(date);
    }
}

void RecurrenceFilter::addSkipDates(const std::vector<QDateTime> &instants)
{
    for (const QDateTime &instant : instants) {
        addSkipDate(instant.date());
    }
}

bool RecurrenceFilter::shouldSkip(const QDateTime &instant) const
{
    const QDate date = instant.date();
    if (m_skipWeekends) {
        const int weekday = date.dayOfWeek();
        if (weekday == Qt::Saturday || weekday == Qt::Sunday) {
            return true;
        }
    }
    return m_skipDates.count(date) > 0;
}

std::vector<QDateTime> RecurrenceFilter::filterOccurrences(const std::vector<QDateTime> &occurrences) const
{
    std::vector<QDateTime> kept;
    kept.reserve(occurrences.size());
    std::copy_if(occurrences.begin(), occurrences.end(), std::back_inserter(kept),
                 [this](const QDateTime &instant) { return !shouldSkip(instant); });
    return kept;
}

bool RecurrenceFilter::isEmpty() const
{
    return !m_skipWeekends && m_skipDates.empty();
}

bool RecurrenceFilter::operator==(const RecurrenceFilter &other) const
{
    return m_skipWeekends == other.m_skipWeekends && m_skipDates == other.m_skipDates;
}

} // namespace data
} // namespace agenda
