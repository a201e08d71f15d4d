#include "agenda/core/Error.hpp"

namespace agenda {
namespace core {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::TimeParse:
        return QStringLiteral("TimeParseError");
    case ErrorCode::InvalidTimeZone:
        return QStringLiteral("InvalidTimeZone");
    case ErrorCode::InvalidLocalTime:
        return QStringLiteral("InvalidLocalTime");
    case ErrorCode::Validation:
        return QStringLiteral("ValidationError");
    case ErrorCode::Recurrence:
        return QStringLiteral("RecurrenceError");
    case ErrorCode::Ics:
        return QStringLiteral("IcsError");
    case ErrorCode::Json:
        return QStringLiteral("JsonError");
    case ErrorCode::Io:
    default:
        return QStringLiteral("IoError");
    }
}

QString describe(const Error &error)
{
    return QStringLiteral("%1: %2").arg(errorCodeName(error.code), error.message);
}

} // namespace core
} // namespace agenda
