#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QTimeZone>

#include "agenda/core/Error.hpp"
#include "agenda/data/Calendar.hpp"

namespace agenda {
namespace data {

// iCalendar (RFC 5545) reader/writer for the subset the model carries:
// VEVENT basics, ATTENDEE, RRULE, EXDATE, STATUS and X-AGENDA-* extensions.
class IcsCodec
{
public:
    static QString toIcs(const Calendar &calendar);
    static core::Result<Calendar> fromIcs(const QString &text);

    static core::Result<void> exportToFile(const Calendar &calendar, const QString &filePath);
    static core::Result<Calendar> importFromFile(const QString &filePath);

private:
    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static bool isUtc(const QTimeZone &zone);
    static QString formatProperty(const QString &name, const QDateTime &instant, const QTimeZone &zone);
    static core::Result<QDateTime> parseDateTime(const QString &value, const QHash<QString, QString> &parameters,
                                                 const QTimeZone &fallbackZone);
};

} // namespace data
} // namespace agenda
