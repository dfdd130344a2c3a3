#include "recurring/data/Series.hpp"

#include "recurring/data/Instance.hpp"

namespace recurring {
namespace data {

QString seriesStatusToString(SeriesStatus status)
{
    switch (status) {
    case SeriesStatus::Paused:
        return QStringLiteral("paused");
    case SeriesStatus::NeedsAttention:
        return QStringLiteral("needs_attention");
    case SeriesStatus::Ended:
        return QStringLiteral("ended");
    case SeriesStatus::Active:
    default:
        return QStringLiteral("active");
    }
}

std::optional<SeriesStatus> seriesStatusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("active")) {
        return SeriesStatus::Active;
    }
    if (normalized == QLatin1String("paused")) {
        return SeriesStatus::Paused;
    }
    if (normalized == QLatin1String("needs_attention")) {
        return SeriesStatus::NeedsAttention;
    }
    if (normalized == QLatin1String("ended")) {
        return SeriesStatus::Ended;
    }
    return std::nullopt;
}

QString exceptionTypeToString(ExceptionType type)
{
    switch (type) {
    case ExceptionType::Modified:
        return QStringLiteral("modified");
    case ExceptionType::Rescheduled:
        return QStringLiteral("rescheduled");
    case ExceptionType::Cancelled:
        return QStringLiteral("cancelled");
    case ExceptionType::ConflictSkipped:
        return QStringLiteral("conflict_skipped");
    case ExceptionType::None:
    default:
        return QStringLiteral("none");
    }
}

std::optional<ExceptionType> exceptionTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized.isEmpty() || normalized == QLatin1String("none")) {
        return ExceptionType::None;
    }
    if (normalized == QLatin1String("modified")) {
        return ExceptionType::Modified;
    }
    if (normalized == QLatin1String("rescheduled")) {
        return ExceptionType::Rescheduled;
    }
    if (normalized == QLatin1String("cancelled")) {
        return ExceptionType::Cancelled;
    }
    if (normalized == QLatin1String("conflict_skipped")) {
        return ExceptionType::ConflictSkipped;
    }
    return std::nullopt;
}

} // namespace data
} // namespace recurring
