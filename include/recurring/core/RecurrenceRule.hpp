#pragma once

#include <optional>
#include <vector>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <QTimeZone>

#include "recurring/core/ScheduleError.hpp"

namespace recurring {
namespace core {

enum class Frequency
{
    Hourly,
    Daily,
    Weekly,
    Monthly,
    Yearly,
};

QString frequencyToString(Frequency frequency);

struct WeekdayRule
{
    int ordinal = 0; // 0 = every such weekday, 2 = second, -1 = last
    Qt::DayOfWeek day = Qt::Monday;

    bool operator==(const WeekdayRule &other) const { return ordinal == other.ordinal && day == other.day; }
};

// Parsed form of an RRULE value. Supports FREQ, INTERVAL, COUNT, UNTIL,
// BYDAY, BYMONTHDAY, BYMONTH and WKST.
struct RecurrenceRule
{
    Frequency frequency = Frequency::Daily;
    int interval = 1;
    std::optional<int> count;
    QDate untilDate;
    QTime untilTime; // invalid for a date-only UNTIL
    bool untilIsUtc = false;
    std::vector<WeekdayRule> byDay;
    std::vector<int> byMonthDay;
    std::vector<int> byMonth;
    Qt::DayOfWeek weekStart = Qt::Monday;

    bool hasUntil() const { return untilDate.isValid(); }
    // Last instant an occurrence may start at. A floating or date-only UNTIL is read in zone.
    QDateTime untilIn(const QTimeZone &zone) const;

    // Canonical RRULE text, parts in a fixed order.
    QString toString() const;
    // "Weekly on Monday, Wednesday, Friday, 12 times"
    QString describe() const;

    static std::optional<RecurrenceRule> parse(const QString &text, ScheduleError *error = nullptr);
};

// Frequency gate followed by a full parse.
bool validateRecurrenceRule(const QString &text, ScheduleError *error = nullptr);

// Replaces any COUNT or UNTIL part with UNTIL=<untilUtc>, leaving the other parts as written.
QString withUntil(const QString &text, const QDateTime &untilUtc);

} // namespace core
} // namespace recurring
