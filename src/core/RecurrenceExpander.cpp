#include "recurring/core/RecurrenceExpander.hpp"

#include <algorithm>

#include "recurring/core/Logging.hpp"

namespace recurring {
namespace core {

namespace {
// Upper bound on consecutive periods examined, for rules that can never match
// (e.g. BYMONTH=2;BYMONTHDAY=30).
constexpr int MAX_PERIODS = 100000;

bool contains(const std::vector<int> &values, int value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

int resolveMonthDay(int monthDay, int daysInMonth)
{
    return monthDay > 0 ? monthDay : daysInMonth + monthDay + 1;
}

void appendWeekdays(std::vector<QDate> &out, const QDate &from, const QDate &to, const WeekdayRule &weekday)
{
    std::vector<QDate> matches;
    for (QDate date = from.addDays((weekday.day - from.dayOfWeek() + 7) % 7); date <= to; date = date.addDays(7)) {
        matches.push_back(date);
    }
    if (weekday.ordinal == 0) {
        out.insert(out.end(), matches.begin(), matches.end());
        return;
    }
    const int total = static_cast<int>(matches.size());
    const int index = weekday.ordinal > 0 ? weekday.ordinal - 1 : total + weekday.ordinal;
    if (index >= 0 && index < total) {
        out.push_back(matches[static_cast<size_t>(index)]);
    }
}

std::vector<QDate> monthDates(int year, int month, const RecurrenceRule &rule, int anchorDay)
{
    const QDate first(year, month, 1);
    const int days = first.daysInMonth();
    const QDate last = first.addDays(days - 1);

    std::vector<QDate> byDayDates;
    for (const WeekdayRule &weekday : rule.byDay) {
        appendWeekdays(byDayDates, first, last, weekday);
    }

    std::vector<QDate> result;
    if (!rule.byMonthDay.empty()) {
        for (int monthDay : rule.byMonthDay) {
            const int day = resolveMonthDay(monthDay, days);
            if (day < 1 || day > days) {
                continue;
            }
            const QDate date(year, month, day);
            if (rule.byDay.empty() || std::find(byDayDates.begin(), byDayDates.end(), date) != byDayDates.end()) {
                result.push_back(date);
            }
        }
    } else if (!rule.byDay.empty()) {
        result = byDayDates;
    } else if (anchorDay <= days) {
        result.push_back(QDate(year, month, anchorDay));
    }
    return result;
}

bool matchesDailyFilters(const QDate &date, const RecurrenceRule &rule)
{
    if (!rule.byMonth.empty() && !contains(rule.byMonth, date.month())) {
        return false;
    }
    if (!rule.byMonthDay.empty()) {
        bool matched = false;
        for (int monthDay : rule.byMonthDay) {
            if (resolveMonthDay(monthDay, date.daysInMonth()) == date.day()) {
                matched = true;
                break;
            }
        }
        if (!matched) {
            return false;
        }
    }
    if (!rule.byDay.empty()) {
        const auto it = std::find_if(rule.byDay.begin(), rule.byDay.end(), [&date](const WeekdayRule &weekday) {
            return weekday.day == date.dayOfWeek();
        });
        if (it == rule.byDay.end()) {
            return false;
        }
    }
    return true;
}

QDateTime wallClock(const QDate &date, const QTime &time, const QTimeZone &zone)
{
    QDateTime dt(date, time, zone);
    if (!dt.isValid()) {
        // Inside a spring-forward gap: use the first valid instant after it.
        dt = QDateTime(date, time.addSecs(3600), zone);
    }
    return dt;
}
} // namespace

RecurrenceExpander::RecurrenceExpander(int maxOccurrences)
    : m_maxOccurrences(maxOccurrences > 0 ? maxOccurrences : 5000)
{
}

int RecurrenceExpander::maxOccurrences() const
{
    return m_maxOccurrences;
}

void RecurrenceExpander::setMaxOccurrences(int maxOccurrences)
{
    if (maxOccurrences > 0) {
        m_maxOccurrences = maxOccurrences;
    }
}

QTimeZone RecurrenceExpander::resolveTimeZone(const QByteArray &timeZoneId)
{
    if (timeZoneId.isEmpty()) {
        return QTimeZone::utc();
    }
    QTimeZone zone(timeZoneId);
    if (!zone.isValid()) {
        qCWarning(lcExpansion) << "Unknown timezone" << timeZoneId << "- expanding in UTC";
        return QTimeZone::utc();
    }
    return zone;
}

std::optional<std::vector<Occurrence>> RecurrenceExpander::expand(const QString &rule, const QDateTime &anchor,
                                                                  qint64 durationSecs, const QByteArray &timeZoneId,
                                                                  const QDateTime &windowEnd,
                                                                  ScheduleError *error) const
{
    const auto parsed = RecurrenceRule::parse(rule, error);
    if (!parsed) {
        return std::nullopt;
    }
    if (!anchor.isValid()) {
        fail(error, ErrorKind::InvalidArgument, QStringLiteral("Anchor start is not a valid date-time"));
        return std::nullopt;
    }
    if (durationSecs <= 0) {
        fail(error, ErrorKind::InvalidArgument, QStringLiteral("Duration must be positive"));
        return std::nullopt;
    }
    return expand(*parsed, anchor, durationSecs, resolveTimeZone(timeZoneId), windowEnd);
}

std::vector<Occurrence> RecurrenceExpander::expand(const RecurrenceRule &rule, const QDateTime &anchor,
                                                   qint64 durationSecs, const QTimeZone &zone,
                                                   const QDateTime &windowEnd) const
{
    std::vector<Occurrence> result;
    if (!anchor.isValid() || durationSecs <= 0) {
        return result;
    }

    QDateTime limit = windowEnd;
    if (rule.hasUntil()) {
        const QDateTime until = rule.untilIn(zone);
        if (!limit.isValid() || until < limit) {
            limit = until;
        }
    }
    if (!limit.isValid() && !rule.count) {
        qCWarning(lcExpansion) << "Refusing to expand an unbounded rule without a window end";
        return result;
    }

    const QDateTime localAnchor = anchor.toTimeZone(zone);
    const QDate anchorDate = localAnchor.date();
    const QTime anchorTime = localAnchor.time();
    const QDate limitDate = limit.isValid() ? limit.toTimeZone(zone).date() : QDate();
    const int step = rule.interval;

    int produced = 0;
    bool done = false;

    // Returns false once expansion must stop.
    auto accept = [&](const QDateTime &start, const QDate &localDate) {
        if (start < anchor) {
            return true;
        }
        if (limit.isValid() && start > limit) {
            return false;
        }
        if (rule.count && produced >= *rule.count) {
            return false;
        }
        if (static_cast<int>(result.size()) >= m_maxOccurrences) {
            qCWarning(lcExpansion) << "Expansion stopped at the cap of" << m_maxOccurrences << "occurrences";
            return false;
        }
        ++produced;
        const QDateTime utcStart = start.toUTC();
        result.push_back({data::TimeRange{utcStart, utcStart.addSecs(durationSecs)}, localDate});
        return true;
    };

    if (rule.frequency == Frequency::Hourly) {
        const QDateTime utcAnchor = anchor.toUTC();
        for (qint64 period = 0; !done && period < MAX_PERIODS * 24LL; ++period) {
            const QDateTime start = utcAnchor.addSecs(period * step * 3600);
            if (limit.isValid() && start > limit) {
                break;
            }
            const QDate localDate = start.toTimeZone(zone).date();
            if (!matchesDailyFilters(localDate, rule)) {
                continue;
            }
            done = !accept(start, localDate);
        }
        return result;
    }

    const QDate weekBase = anchorDate.addDays(-((anchorDate.dayOfWeek() - rule.weekStart + 7) % 7));
    const QDate monthBase(anchorDate.year(), anchorDate.month(), 1);

    for (int period = 0; !done && period < MAX_PERIODS; ++period) {
        QDate periodStart;
        std::vector<QDate> dates;

        switch (rule.frequency) {
        case Frequency::Daily: {
            periodStart = anchorDate.addDays(static_cast<qint64>(period) * step);
            if (matchesDailyFilters(periodStart, rule)) {
                dates.push_back(periodStart);
            }
            break;
        }
        case Frequency::Weekly: {
            periodStart = weekBase.addDays(static_cast<qint64>(period) * step * 7);
            if (rule.byDay.empty()) {
                dates.push_back(periodStart.addDays((anchorDate.dayOfWeek() - rule.weekStart + 7) % 7));
            } else {
                for (const WeekdayRule &weekday : rule.byDay) {
                    dates.push_back(periodStart.addDays((weekday.day - rule.weekStart + 7) % 7));
                }
            }
            if (!rule.byMonth.empty()) {
                dates.erase(std::remove_if(dates.begin(), dates.end(),
                                           [&rule](const QDate &date) { return !contains(rule.byMonth, date.month()); }),
                            dates.end());
            }
            break;
        }
        case Frequency::Monthly: {
            periodStart = monthBase.addMonths(period * step);
            if (rule.byMonth.empty() || contains(rule.byMonth, periodStart.month())) {
                dates = monthDates(periodStart.year(), periodStart.month(), rule, anchorDate.day());
            }
            break;
        }
        case Frequency::Yearly: {
            const int year = anchorDate.year() + period * step;
            periodStart = QDate(year, 1, 1);
            if (!rule.byMonth.empty()) {
                std::vector<int> months = rule.byMonth;
                std::sort(months.begin(), months.end());
                for (int month : months) {
                    const auto found = monthDates(year, month, rule, anchorDate.day());
                    dates.insert(dates.end(), found.begin(), found.end());
                }
            } else if (!rule.byMonthDay.empty()) {
                for (int month = 1; month <= 12; ++month) {
                    const auto found = monthDates(year, month, rule, anchorDate.day());
                    dates.insert(dates.end(), found.begin(), found.end());
                }
            } else if (!rule.byDay.empty()) {
                for (const WeekdayRule &weekday : rule.byDay) {
                    appendWeekdays(dates, periodStart, QDate(year, 12, 31), weekday);
                }
            } else {
                const QDate date(year, anchorDate.month(), anchorDate.day());
                if (date.isValid()) {
                    dates.push_back(date);
                }
            }
            break;
        }
        case Frequency::Hourly:
            break;
        }

        if (limitDate.isValid() && periodStart > limitDate) {
            break;
        }

        std::sort(dates.begin(), dates.end());
        dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
        for (const QDate &date : dates) {
            if (!accept(wallClock(date, anchorTime, zone), date)) {
                done = true;
                break;
            }
        }
    }

    qCDebug(lcExpansion) << "Expanded" << rule.toString() << "to" << result.size() << "occurrences";
    return result;
}

} // namespace core
} // namespace recurring
