#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>

namespace recurring {
namespace data {

// Half-open interval [start, end).
struct TimeRange
{
    QDateTime start;
    QDateTime end;

    bool isValid() const;
    bool overlaps(const TimeRange &other) const;
    qint64 durationSecs() const;

    // "[2026-01-05T09:00:00Z,2026-01-05T10:00:00Z)"
    QString toString() const;
    static TimeRange fromString(const QString &text);

    bool operator==(const TimeRange &other) const;
    bool operator!=(const TimeRange &other) const;
};

} // namespace data
} // namespace recurring

Q_DECLARE_METATYPE(recurring::data::TimeRange)
