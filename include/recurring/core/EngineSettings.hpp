#pragma once

#include <QString>

class QSettings;

namespace recurring {
namespace core {

struct EngineSettings
{
    int horizonDays = 90;
    int maxOccurrences = 5000;
    QString defaultTimeField = QStringLiteral("time_slot");
    QString standaloneGroupName = QStringLiteral("Recurring Schedule");
    // Template key whose value names a group created for a standalone series.
    QString standaloneNameField = QStringLiteral("purpose");
    int summaryInstanceLimit = 100;

    static EngineSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace recurring
