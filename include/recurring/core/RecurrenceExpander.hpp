#pragma once

#include <optional>
#include <vector>

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QTimeZone>

#include "recurring/core/RecurrenceRule.hpp"
#include "recurring/core/ScheduleError.hpp"
#include "recurring/data/TimeRange.hpp"

namespace recurring {
namespace core {

struct Occurrence
{
    data::TimeRange range; // UTC
    QDate localDate;       // calendar date of the start in the series timezone
};

// Turns a rule plus anchor into concrete occurrences. Stateless apart from the cap.
//
// Occurrences are generated on the wall clock of the series timezone, so a
// 09:00 weekly slot stays at 09:00 local time across daylight-saving changes.
// COUNT is counted from the anchor, which keeps every result a prefix of the
// result for any later window end.
class RecurrenceExpander
{
public:
    explicit RecurrenceExpander(int maxOccurrences = 5000);

    int maxOccurrences() const;
    void setMaxOccurrences(int maxOccurrences);

    // windowEnd is inclusive: an occurrence starting exactly at windowEnd is returned.
    std::optional<std::vector<Occurrence>> expand(const QString &rule, const QDateTime &anchor, qint64 durationSecs,
                                                  const QByteArray &timeZoneId, const QDateTime &windowEnd,
                                                  ScheduleError *error = nullptr) const;

    std::vector<Occurrence> expand(const RecurrenceRule &rule, const QDateTime &anchor, qint64 durationSecs,
                                   const QTimeZone &zone, const QDateTime &windowEnd) const;

    // Empty id means UTC. Unknown ids fall back to UTC with a warning.
    static QTimeZone resolveTimeZone(const QByteArray &timeZoneId);

private:
    int m_maxOccurrences;
};

} // namespace core
} // namespace recurring
