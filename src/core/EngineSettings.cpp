#include "recurring/core/EngineSettings.hpp"

#include <QSettings>

namespace recurring {
namespace core {

namespace {
const auto kHorizonDaysKey = QStringLiteral("expansion/horizonDays");
const auto kMaxOccurrencesKey = QStringLiteral("expansion/maxOccurrences");
const auto kDefaultTimeFieldKey = QStringLiteral("records/defaultTimeField");
const auto kStandaloneNameKey = QStringLiteral("groups/standaloneName");
const auto kStandaloneNameFieldKey = QStringLiteral("groups/standaloneNameField");
const auto kInstanceLimitKey = QStringLiteral("summary/instanceLimit");
} // namespace

EngineSettings EngineSettings::load(const QSettings &settings)
{
    EngineSettings result;
    const int horizon = settings.value(kHorizonDaysKey, result.horizonDays).toInt();
    if (horizon > 0) {
        result.horizonDays = horizon;
    }
    const int maxOccurrences = settings.value(kMaxOccurrencesKey, result.maxOccurrences).toInt();
    if (maxOccurrences > 0) {
        result.maxOccurrences = maxOccurrences;
    }
    const QString timeField = settings.value(kDefaultTimeFieldKey, result.defaultTimeField).toString().trimmed();
    if (!timeField.isEmpty()) {
        result.defaultTimeField = timeField;
    }
    const QString standaloneName = settings.value(kStandaloneNameKey, result.standaloneGroupName).toString().trimmed();
    if (!standaloneName.isEmpty()) {
        result.standaloneGroupName = standaloneName;
    }
    result.standaloneNameField = settings.value(kStandaloneNameFieldKey, result.standaloneNameField).toString().trimmed();
    const int limit = settings.value(kInstanceLimitKey, result.summaryInstanceLimit).toInt();
    if (limit >= 0) {
        result.summaryInstanceLimit = limit;
    }
    return result;
}

void EngineSettings::save(QSettings &settings) const
{
    settings.setValue(kHorizonDaysKey, horizonDays);
    settings.setValue(kMaxOccurrencesKey, maxOccurrences);
    settings.setValue(kDefaultTimeFieldKey, defaultTimeField);
    settings.setValue(kStandaloneNameKey, standaloneGroupName);
    settings.setValue(kStandaloneNameFieldKey, standaloneNameField);
    settings.setValue(kInstanceLimitKey, summaryInstanceLimit);
}

} // namespace core
} // namespace recurring
