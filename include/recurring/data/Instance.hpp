#pragma once

#include <optional>
#include <vector>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>

#include "recurring/data/TimeRange.hpp"

namespace recurring {
namespace data {

enum class ExceptionType
{
    None,
    Modified,
    Rescheduled,
    Cancelled,
    ConflictSkipped,
};

QString exceptionTypeToString(ExceptionType type);
std::optional<ExceptionType> exceptionTypeFromString(const QString &value);

// Links one occurrence of a series to the record that represents it, if any.
struct Instance
{
    qint64 id = 0;
    qint64 seriesId = 0;
    QDate occurrenceDate;
    QString recordType;
    std::optional<qint64> recordId; // empty when cancelled or never created
    bool isException = false;
    ExceptionType exceptionType = ExceptionType::None;
    std::optional<TimeRange> originalRange; // range before the latest reschedule
    std::vector<TimeRange> rescheduleHistory; // every prior range, oldest first
    QString exceptionReason;
    QDateTime exceptionAt;
    QUuid exceptionBy;
    QDateTime createdAt;
};

} // namespace data
} // namespace recurring
