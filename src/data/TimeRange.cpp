#include "recurring/data/TimeRange.hpp"

namespace recurring {
namespace data {

bool TimeRange::isValid() const
{
    return start.isValid() && end.isValid() && start < end;
}

bool TimeRange::overlaps(const TimeRange &other) const
{
    if (!isValid() || !other.isValid()) {
        return false;
    }
    return start < other.end && other.start < end;
}

qint64 TimeRange::durationSecs() const
{
    if (!isValid()) {
        return 0;
    }
    return start.secsTo(end);
}

QString TimeRange::toString() const
{
    if (!start.isValid() || !end.isValid()) {
        return {};
    }
    return QStringLiteral("[%1,%2)")
        .arg(start.toUTC().toString(Qt::ISODate), end.toUTC().toString(Qt::ISODate));
}

TimeRange TimeRange::fromString(const QString &text)
{
    QString trimmed = text.trimmed();
    if (trimmed.size() < 3 || !trimmed.startsWith('[') || !trimmed.endsWith(')')) {
        return {};
    }
    trimmed = trimmed.mid(1, trimmed.size() - 2);
    const int comma = trimmed.indexOf(',');
    if (comma <= 0) {
        return {};
    }
    TimeRange range;
    range.start = QDateTime::fromString(trimmed.left(comma).trimmed(), Qt::ISODate);
    range.end = QDateTime::fromString(trimmed.mid(comma + 1).trimmed(), Qt::ISODate);
    if (!range.isValid()) {
        return {};
    }
    return range;
}

bool TimeRange::operator==(const TimeRange &other) const
{
    return start == other.start && end == other.end;
}

bool TimeRange::operator!=(const TimeRange &other) const
{
    return !(*this == other);
}

} // namespace data
} // namespace recurring
