#pragma once

#include <QString>

class QSettings;

namespace agenda {
namespace core {

struct Settings
{
    static constexpr int DEFAULT_MAX_OCCURRENCES = 1000;

    int maxOccurrencesPerEvent = DEFAULT_MAX_OCCURRENCES;
    QString defaultTimeZone = QStringLiteral("UTC");
    int minimumGapMinutes = 30;
    int suggestionStepMinutes = 60;
    int slotLookbackHours = 24;

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace agenda
