#pragma once

#include <optional>

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <QVariantMap>

namespace recurring {
namespace data {

enum class SeriesStatus
{
    Active,
    Paused,
    NeedsAttention,
    Ended,
};

QString seriesStatusToString(SeriesStatus status);
std::optional<SeriesStatus> seriesStatusFromString(const QString &value);

struct Series
{
    qint64 id = 0;
    std::optional<qint64> groupId;
    int versionNumber = 1;
    QDate effectiveFrom;
    QDate effectiveUntil; // invalid while this is the current version
    QString recordType;
    QVariantMap recordTemplate;
    QString rule; // RFC 5545 RRULE value, e.g. "FREQ=WEEKLY;BYDAY=MO,WE,FR"
    QDateTime anchor;
    qint64 durationSecs = 0;
    QByteArray timeZoneId; // IANA id, empty means UTC
    QString timeField = QStringLiteral("time_slot");
    SeriesStatus status = SeriesStatus::Active;
    QDate expandedUntil;
    QUuid createdBy;
    QDateTime createdAt;
    QDateTime templateUpdatedAt;
    QUuid templateUpdatedBy;

    bool isCurrent() const { return !effectiveUntil.isValid(); }
};

} // namespace data
} // namespace recurring
