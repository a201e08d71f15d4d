#include "agenda/core/Settings.hpp"

#include <QSettings>

namespace agenda {
namespace core {

namespace {
int intOr(const QSettings &settings, const QString &key, int fallback, int minimum)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value < minimum) {
        return fallback;
    }
    return value;
}

int positiveOr(const QSettings &settings, const QString &key, int fallback)
{
    return intOr(settings, key, fallback, 1);
}
} // namespace

Settings Settings::load(const QSettings &settings)
{
    Settings result;
    result.maxOccurrencesPerEvent = positiveOr(settings, QStringLiteral("calendar/maxOccurrencesPerEvent"),
                                               result.maxOccurrencesPerEvent);
    const QString zone = settings.value(QStringLiteral("calendar/defaultTimeZone")).toString().trimmed();
    if (!zone.isEmpty()) {
        result.defaultTimeZone = zone;
    }
    result.minimumGapMinutes = intOr(settings, QStringLiteral("analysis/minimumGapMinutes"),
                                     result.minimumGapMinutes, 0);
    result.suggestionStepMinutes = positiveOr(settings, QStringLiteral("analysis/suggestionStepMinutes"),
                                              result.suggestionStepMinutes);
    result.slotLookbackHours = positiveOr(settings, QStringLiteral("analysis/slotLookbackHours"),
                                          result.slotLookbackHours);
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("calendar/maxOccurrencesPerEvent"), maxOccurrencesPerEvent);
    settings.setValue(QStringLiteral("calendar/defaultTimeZone"), defaultTimeZone);
    settings.setValue(QStringLiteral("analysis/minimumGapMinutes"), minimumGapMinutes);
    settings.setValue(QStringLiteral("analysis/suggestionStepMinutes"), suggestionStepMinutes);
    settings.setValue(QStringLiteral("analysis/slotLookbackHours"), slotLookbackHours);
}

} // namespace core
} // namespace agenda
