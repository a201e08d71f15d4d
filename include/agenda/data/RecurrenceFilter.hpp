#pragma once

#include <QDate>
#include <QDateTime>

#include <set>
#include <vector>

namespace agenda {
namespace data {

// Drops generated occurrences that fall on a weekend (when enabled) or on
// one of the skip dates. Dates compare by civil date only.
class RecurrenceFilter
{
public:
    RecurrenceFilter() = default;

    bool skipWeekends() const;
    void setSkipWeekends(bool skip);

    const std::set<QDate> &skipDates() const;
    void addSkipDate(const QDate &date);
    void addSkipDates(const std::vector<QDateTime> &instants);

    bool shouldSkip(const QDateTime &instant) const;
    std::vector<QDateTime> filterOccurrences(const std::vector<QDateTime> &occurrences) const;

    bool isEmpty() const;

    bool operator==(const RecurrenceFilter &other) const;
    bool operator!=(const RecurrenceFilter &other) const { return !(*this == other); }

private:
    bool m_skipWeekends = false;
    std::set<QDate> m_skipDates;
};

} // namespace data
} // namespace agenda
