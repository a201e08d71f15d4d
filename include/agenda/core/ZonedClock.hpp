#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <QTimeZone>

#include "agenda/core/Error.hpp"

namespace agenda {
namespace core {

// How a wall-clock time is mapped to an instant when the zone's offset
// changes around it.
enum class Disambiguation
{
    Earliest,     // first instant of a repeated time, fails inside a gap
    Latest,       // second instant of a repeated time, fails inside a gap
    ShiftForward, // Earliest for repeated times, pre-transition offset inside a gap
};

struct CivilDateTime
{
    QDate date;
    QTime time;
};

namespace clock {

Result<QTimeZone> parseTimeZone(const QString &id);

// Accepts "yyyy-MM-dd hh:mm:ss" and "yyyy-MM-ddThh:mm:ss" only.
Result<CivilDateTime> parseCivil(const QString &text);
// iCalendar basic form "yyyyMMddThhmmss", optionally followed by 'Z'.
Result<CivilDateTime> parseBasicCivil(const QString &text);

Result<QDateTime> resolve(const QDate &date, const QTime &time, const QTimeZone &zone,
                          Disambiguation disambiguation = Disambiguation::Earliest);
Result<QDateTime> resolve(const QString &civil, const QTimeZone &zone,
                          Disambiguation disambiguation = Disambiguation::Earliest);

Result<QDateTime> startOfDay(const QDate &date, const QTimeZone &zone);
Result<QDateTime> endOfDay(const QDate &date, const QTimeZone &zone);

// Zone an instant carries: its QTimeZone, UTC, a fixed-offset zone, or the
// system zone for local time.
QTimeZone zoneOf(const QDateTime &instant);
QDateTime convertTimeZone(const QDateTime &instant, const QTimeZone &zone);
bool isDaylightTime(const QDateTime &instant);

QString formatCivil(const QDateTime &instant);

} // namespace clock
} // namespace core
} // namespace agenda
