#include "agenda/data/Recurrence.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/ZonedClock.hpp"

#include <QStringList>

#include <limits>

namespace agenda {
namespace data {

namespace {
constexpr auto UNTIL_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto DATE_FORMAT = "yyyyMMdd";

core::Error recurrenceError(const QString &message)
{
    return core::makeError(core::ErrorCode::Recurrence, message);
}

// Civil date for a year that may be past the int range; invalid when it is.
QDate civilDate(qint64 year, int month, int day)
{
    if (year < std::numeric_limits<int>::min() || year > std::numeric_limits<int>::max()) {
        return {};
    }
    return QDate(static_cast<int>(year), month, day);
}

// Civil date k steps after the anchor date; invalid when the target month
// or year has no such day.
QDate stepDate(const QDate &anchor, Frequency frequency, qint64 steps)
{
    switch (frequency) {
    case Frequency::Daily:
        return anchor.addDays(steps);
    case Frequency::Weekly:
        return anchor.addDays(steps * 7);
    case Frequency::Monthly: {
        const qint64 monthIndex = static_cast<qint64>(anchor.month() - 1) + steps;
        const qint64 year = anchor.year() + monthIndex / 12;
        const int month = static_cast<int>(monthIndex % 12) + 1;
        return civilDate(year, month, anchor.day());
    }
    case Frequency::Yearly:
        return civilDate(anchor.year() + steps, anchor.month(), anchor.day());
    }
    return {};
}

core::Result<QDateTime> parseUntil(const QString &value, const QTimeZone &zone)
{
    if (value.size() == 8) {
        const QDate date = QDate::fromString(value, QLatin1String(DATE_FORMAT));
        if (!date.isValid()) {
            return recurrenceError(QStringLiteral("Invalid UNTIL date '%1'").arg(value));
        }
        return core::clock::endOfDay(date, zone);
    }
    const auto civil = core::clock::parseBasicCivil(value);
    if (!civil) {
        return recurrenceError(QStringLiteral("Invalid UNTIL value '%1'").arg(value));
    }
    if (value.endsWith(QLatin1Char('Z'))) {
        const auto utc = core::clock::resolve(civil->date, civil->time, QTimeZone::utc());
        if (!utc) {
            return utc.error();
        }
        return utc->toTimeZone(zone);
    }
    return core::clock::resolve(civil->date, civil->time, zone, core::Disambiguation::ShiftForward);
}

bool parsePositive(const QString &value, int *out)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed < 1) {
        return false;
    }
    *out = parsed;
    return true;
}
} // namespace

QString frequencyName(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Daily:
        return QStringLiteral("DAILY");
    case Frequency::Weekly:
        return QStringLiteral("WEEKLY");
    case Frequency::Monthly:
        return QStringLiteral("MONTHLY");
    case Frequency::Yearly:
        return QStringLiteral("YEARLY");
    }
    return QString();
}

core::Result<Frequency> frequencyFromName(const QString &name)
{
    const QString normalized = name.trimmed().toUpper();
    if (normalized == QLatin1String("DAILY")) {
        return Frequency::Daily;
    }
    if (normalized == QLatin1String("WEEKLY")) {
        return Frequency::Weekly;
    }
    if (normalized == QLatin1String("MONTHLY")) {
        return Frequency::Monthly;
    }
    if (normalized == QLatin1String("YEARLY")) {
        return Frequency::Yearly;
    }
    return recurrenceError(QStringLiteral("Unsupported frequency '%1'").arg(name));
}

QString weekdayCode(Qt::DayOfWeek day)
{
    switch (day) {
    case Qt::Monday:
        return QStringLiteral("MO");
    case Qt::Tuesday:
        return QStringLiteral("TU");
    case Qt::Wednesday:
        return QStringLiteral("WE");
    case Qt::Thursday:
        return QStringLiteral("TH");
    case Qt::Friday:
        return QStringLiteral("FR");
    case Qt::Saturday:
        return QStringLiteral("SA");
    case Qt::Sunday:
        return QStringLiteral("SU");
    }
    return QString();
}

std::optional<Qt::DayOfWeek> weekdayFromCode(const QString &code)
{
    static const QStringList codes = {QStringLiteral("MO"), QStringLiteral("TU"), QStringLiteral("WE"),
                                      QStringLiteral("TH"), QStringLiteral("FR"), QStringLiteral("SA"),
                                      QStringLiteral("SU")};
    const int index = codes.indexOf(code.trimmed().toUpper());
    if (index < 0) {
        return std::nullopt;
    }
    return static_cast<Qt::DayOfWeek>(index + 1);
}

RecurrenceRule::RecurrenceRule(Frequency frequency)
    : m_frequency(frequency)
{
}

RecurrenceRule RecurrenceRule::daily()
{
    return RecurrenceRule(Frequency::Daily);
}

RecurrenceRule RecurrenceRule::weekly()
{
    return RecurrenceRule(Frequency::Weekly);
}

RecurrenceRule RecurrenceRule::monthly()
{
    return RecurrenceRule(Frequency::Monthly);
}

RecurrenceRule RecurrenceRule::yearly()
{
    return RecurrenceRule(Frequency::Yearly);
}

Frequency RecurrenceRule::frequency() const
{
    return m_frequency;
}

void RecurrenceRule::setFrequency(Frequency frequency)
{
    m_frequency = frequency;
}

int RecurrenceRule::interval() const
{
    return m_interval;
}

void RecurrenceRule::setInterval(int interval)
{
    m_interval = interval;
}

std::optional<int> RecurrenceRule::count() const
{
    return m_count;
}

void RecurrenceRule::setCount(int count)
{
    m_count = count;
    m_until.reset();
}

std::optional<QDateTime> RecurrenceRule::until() const
{
    return m_until;
}

void RecurrenceRule::setUntil(const QDateTime &until)
{
    m_until = until;
    m_count.reset();
}

void RecurrenceRule::clearTerminator()
{
    m_count.reset();
    m_until.reset();
}

const std::vector<Qt::DayOfWeek> &RecurrenceRule::weekdays() const
{
    return m_weekdays;
}

void RecurrenceRule::setWeekdays(std::vector<Qt::DayOfWeek> weekdays)
{
    m_weekdays = std::move(weekdays);
}

core::Result<void> RecurrenceRule::validate() const
{
    switch (m_frequency) {
    case Frequency::Daily:
    case Frequency::Weekly:
    case Frequency::Monthly:
    case Frequency::Yearly:
        break;
    default:
        return recurrenceError(QStringLiteral("Unsupported frequency value %1").arg(static_cast<int>(m_frequency)));
    }
    if (m_interval < 1) {
        return recurrenceError(QStringLiteral("Interval must be at least 1, got %1").arg(m_interval));
    }
    if (m_count && *m_count < 1) {
        return recurrenceError(QStringLiteral("Count must be at least 1, got %1").arg(*m_count));
    }
    if (m_until && !m_until->isValid()) {
        return recurrenceError(QStringLiteral("Until is not a valid instant"));
    }
    return {};
}

QString RecurrenceRule::toRRule() const
{
    QStringList parts;
    parts << QStringLiteral("FREQ=%1").arg(frequencyName(m_frequency));
    if (m_interval > 1) {
        parts << QStringLiteral("INTERVAL=%1").arg(m_interval);
    }
    if (m_count) {
        parts << QStringLiteral("COUNT=%1").arg(*m_count);
    }
    if (m_until) {
        parts << QStringLiteral("UNTIL=%1").arg(m_until->toUTC().toString(QLatin1String(UNTIL_FORMAT)));
    }
    if (!m_weekdays.empty()) {
        QStringList days;
        for (const Qt::DayOfWeek day : m_weekdays) {
            days << weekdayCode(day);
        }
        parts << QStringLiteral("BYDAY=%1").arg(days.join(QLatin1Char(',')));
    }
    return parts.join(QLatin1Char(';'));
}

core::Result<RecurrenceRule> RecurrenceRule::fromRRule(const QString &text, const QTimeZone &zone)
{
    QString body = text.trimmed();
    if (body.startsWith(QLatin1String("RRULE:"), Qt::CaseInsensitive)) {
        body = body.mid(6);
    }

    RecurrenceRule rule;
    bool hasFrequency = false;
    const QStringList parts = body.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equals = part.indexOf(QLatin1Char('='));
        if (equals <= 0) {
            return recurrenceError(QStringLiteral("Malformed RRULE part '%1'").arg(part));
        }
        const QString key = part.left(equals).trimmed().toUpper();
        const QString value = part.mid(equals + 1).trimmed();

        if (key == QLatin1String("FREQ")) {
            const auto frequency = frequencyFromName(value);
            if (!frequency) {
                return frequency.error();
            }
            rule.m_frequency = *frequency;
            hasFrequency = true;
        } else if (key == QLatin1String("INTERVAL")) {
            if (!parsePositive(value, &rule.m_interval)) {
                return recurrenceError(QStringLiteral("Invalid INTERVAL '%1'").arg(value));
            }
        } else if (key == QLatin1String("COUNT")) {
            int count = 0;
            if (!parsePositive(value, &count)) {
                return recurrenceError(QStringLiteral("Invalid COUNT '%1'").arg(value));
            }
            if (rule.m_until) {
                return recurrenceError(QStringLiteral("COUNT and UNTIL are mutually exclusive"));
            }
            rule.m_count = count;
        } else if (key == QLatin1String("UNTIL")) {
            if (rule.m_count) {
                return recurrenceError(QStringLiteral("COUNT and UNTIL are mutually exclusive"));
            }
            const auto until = parseUntil(value, zone);
            if (!until) {
                return until.error();
            }
            rule.m_until = *until;
        } else if (key == QLatin1String("BYDAY")) {
            for (const QString &code : value.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
                const auto day = weekdayFromCode(code);
                if (!day) {
                    return recurrenceError(QStringLiteral("Unsupported BYDAY value '%1'").arg(code));
                }
                rule.m_weekdays.push_back(*day);
            }
        } else {
            qCWarning(lcAgendaRecurrence) << "Ignoring unsupported RRULE part" << key;
        }
    }

    if (!hasFrequency) {
        return recurrenceError(QStringLiteral("RRULE '%1' has no FREQ").arg(text));
    }
    return rule;
}

bool RecurrenceRule::operator==(const RecurrenceRule &other) const
{
    return m_frequency == other.m_frequency && m_interval == other.m_interval && m_count == other.m_count
        && m_until == other.m_until && m_weekdays == other.m_weekdays;
}

core::Result<std::vector<QDateTime>> generateOccurrences(const RecurrenceRule &rule, const QDateTime &anchor,
                                                         int cap)
{
    const auto valid = rule.validate();
    if (!valid) {
        return valid.error();
    }
    if (!anchor.isValid()) {
        return recurrenceError(QStringLiteral("Anchor is not a valid instant"));
    }
    if (cap < 0) {
        return recurrenceError(QStringLiteral("Occurrence cap must not be negative"));
    }

    const int limit = rule.count() ? qMin(*rule.count(), cap) : cap;
    const QTimeZone zone = core::clock::zoneOf(anchor);
    const QDateTime local = anchor.toTimeZone(zone);
    const QDate anchorDate = local.date();
    const QTime anchorTime = local.time();
    const auto until = rule.until();

    std::vector<QDateTime> occurrences;
    occurrences.reserve(static_cast<size_t>(limit));
    for (int index = 0; index < limit; ++index) {
        QDateTime current = local;
        if (index > 0) {
            const QDate date = stepDate(anchorDate, rule.frequency(), static_cast<qint64>(index) * rule.interval());
            if (!date.isValid()) {
                qCDebug(lcAgendaRecurrence) << "Stopping after" << occurrences.size()
                                            << "occurrences: no day" << anchorDate.day() << "in step" << index;
                break;
            }
            const auto resolved = core::clock::resolve(date, anchorTime, zone, core::Disambiguation::ShiftForward);
            if (!resolved) {
                return resolved.error();
            }
            current = *resolved;
        }
        if (until && current > *until) {
            break;
        }
        occurrences.push_back(current);
    }
    return occurrences;
}

} // namespace data
} // namespace agenda
