#include "recurring/core/RecurrenceRule.hpp"

#include <QLocale>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

namespace recurring {
namespace core {

namespace {
constexpr auto UNTIL_UTC_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto UNTIL_LOCAL_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto UNTIL_DATE_FORMAT = "yyyyMMdd";

const QStringList &dayCodes()
{
    static const QStringList codes = {QStringLiteral("MO"), QStringLiteral("TU"), QStringLiteral("WE"),
                                      QStringLiteral("TH"), QStringLiteral("FR"), QStringLiteral("SA"),
                                      QStringLiteral("SU")};
    return codes;
}

std::optional<Qt::DayOfWeek> dayFromCode(const QString &code)
{
    const int index = dayCodes().indexOf(code);
    if (index < 0) {
        return std::nullopt;
    }
    return static_cast<Qt::DayOfWeek>(index + 1);
}

QString dayCode(Qt::DayOfWeek day)
{
    return dayCodes().value(static_cast<int>(day) - 1);
}

QString dayName(Qt::DayOfWeek day)
{
    return QLocale::c().dayName(static_cast<int>(day), QLocale::LongFormat);
}

QString positionName(int ordinal)
{
    switch (ordinal) {
    case 1:
        return QStringLiteral("1st");
    case 2:
        return QStringLiteral("2nd");
    case 3:
        return QStringLiteral("3rd");
    case -1:
        return QStringLiteral("last");
    case -2:
        return QStringLiteral("2nd to last");
    default:
        return QStringLiteral("%1th").arg(ordinal);
    }
}

QString normalizedRule(const QString &text)
{
    QString rule = text.trimmed().toUpper();
    if (rule.startsWith(QLatin1String("RRULE:"))) {
        rule.remove(0, 6);
    }
    return rule;
}

std::nullopt_t invalid(ScheduleError *error, const QString &message)
{
    fail(error, ErrorKind::InvalidRule, message);
    return std::nullopt;
}

bool parsePositive(const QString &value, int *out)
{
    bool ok = false;
    const int number = value.toInt(&ok);
    if (!ok || number <= 0) {
        return false;
    }
    *out = number;
    return true;
}

template<typename T>
QString joinNumbers(const std::vector<T> &values)
{
    QStringList parts;
    for (const T &value : values) {
        parts << QString::number(value);
    }
    return parts.join(QLatin1Char(','));
}
} // namespace

QString frequencyToString(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Hourly:
        return QStringLiteral("HOURLY");
    case Frequency::Weekly:
        return QStringLiteral("WEEKLY");
    case Frequency::Monthly:
        return QStringLiteral("MONTHLY");
    case Frequency::Yearly:
        return QStringLiteral("YEARLY");
    case Frequency::Daily:
    default:
        return QStringLiteral("DAILY");
    }
}

bool validateRecurrenceRule(const QString &text, ScheduleError *error)
{
    return RecurrenceRule::parse(text, error).has_value();
}

std::optional<RecurrenceRule> RecurrenceRule::parse(const QString &text, ScheduleError *error)
{
    const QString rule = normalizedRule(text);

    static const QRegularExpression freqPattern(QStringLiteral("FREQ=([A-Z]+)"));
    const QRegularExpressionMatch freqMatch = freqPattern.match(rule);
    if (!freqMatch.hasMatch()) {
        return invalid(error, QStringLiteral("Invalid RRULE: missing FREQ"));
    }
    const QString freq = freqMatch.captured(1);
    if (freq == QLatin1String("SECONDLY") || freq == QLatin1String("MINUTELY")) {
        fail(error, ErrorKind::UnsupportedFrequency,
             QStringLiteral("Frequency %1 is not supported; the minimum frequency is HOURLY").arg(freq));
        return std::nullopt;
    }

    RecurrenceRule result;
    if (freq == QLatin1String("HOURLY")) {
        result.frequency = Frequency::Hourly;
    } else if (freq == QLatin1String("DAILY")) {
        result.frequency = Frequency::Daily;
    } else if (freq == QLatin1String("WEEKLY")) {
        result.frequency = Frequency::Weekly;
    } else if (freq == QLatin1String("MONTHLY")) {
        result.frequency = Frequency::Monthly;
    } else if (freq == QLatin1String("YEARLY")) {
        result.frequency = Frequency::Yearly;
    } else {
        return invalid(error, QStringLiteral("Invalid RRULE frequency: %1").arg(freq));
    }

    static const QSet<QString> unsupportedParts = {
        QStringLiteral("BYSETPOS"), QStringLiteral("BYSECOND"), QStringLiteral("BYMINUTE"),
        QStringLiteral("BYHOUR"), QStringLiteral("BYYEARDAY"), QStringLiteral("BYWEEKNO"),
        QStringLiteral("EXRULE"),
    };
    static const QRegularExpression byDayPattern(QStringLiteral("^([+-]?\\d{1,2})?(MO|TU|WE|TH|FR|SA|SU)$"));

    QSet<QString> seen;
    const QStringList parts = rule.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString &rawPart : parts) {
        const QString part = rawPart.trimmed();
        const int eq = part.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            return invalid(error, QStringLiteral("Malformed rule part \"%1\"").arg(part));
        }
        const QString name = part.left(eq).trimmed();
        const QString value = part.mid(eq + 1).trimmed();
        if (seen.contains(name)) {
            return invalid(error, QStringLiteral("Rule part %1 appears more than once").arg(name));
        }
        seen.insert(name);
        if (value.isEmpty()) {
            return invalid(error, QStringLiteral("Rule part %1 has no value").arg(name));
        }

        if (name == QLatin1String("FREQ")) {
            if (value != freq) {
                return invalid(error, QStringLiteral("Invalid RRULE frequency: %1").arg(value));
            }
        } else if (name == QLatin1String("INTERVAL")) {
            if (!parsePositive(value, &result.interval)) {
                return invalid(error, QStringLiteral("INTERVAL must be a positive integer"));
            }
        } else if (name == QLatin1String("COUNT")) {
            int count = 0;
            if (!parsePositive(value, &count)) {
                return invalid(error, QStringLiteral("COUNT must be a positive integer"));
            }
            result.count = count;
        } else if (name == QLatin1String("UNTIL")) {
            result.untilDate = QDate::fromString(value.left(8), QLatin1String(UNTIL_DATE_FORMAT));
            if (!result.untilDate.isValid()) {
                return invalid(error, QStringLiteral("UNTIL is not a valid date: %1").arg(value));
            }
            if (value.size() > 8) {
                const bool utc = value.endsWith(QLatin1Char('Z'));
                const QString local = utc ? value.left(value.size() - 1) : value;
                const QDateTime parsed = QDateTime::fromString(local, QLatin1String(UNTIL_LOCAL_FORMAT));
                if (!parsed.isValid()) {
                    return invalid(error, QStringLiteral("UNTIL is not a valid date-time: %1").arg(value));
                }
                result.untilTime = parsed.time();
                result.untilIsUtc = utc;
            }
        } else if (name == QLatin1String("BYDAY")) {
            for (const QString &token : value.split(QLatin1Char(','))) {
                const QRegularExpressionMatch match = byDayPattern.match(token.trimmed());
                if (!match.hasMatch()) {
                    return invalid(error, QStringLiteral("Invalid BYDAY value: %1").arg(token));
                }
                WeekdayRule weekday;
                weekday.day = *dayFromCode(match.captured(2));
                if (!match.captured(1).isEmpty()) {
                    weekday.ordinal = match.captured(1).toInt();
                    if (weekday.ordinal == 0 || weekday.ordinal > 53 || weekday.ordinal < -53) {
                        return invalid(error, QStringLiteral("Invalid BYDAY ordinal: %1").arg(token));
                    }
                }
                result.byDay.push_back(weekday);
            }
        } else if (name == QLatin1String("BYMONTHDAY")) {
            for (const QString &token : value.split(QLatin1Char(','))) {
                bool ok = false;
                const int day = token.trimmed().toInt(&ok);
                if (!ok || day == 0 || day > 31 || day < -31) {
                    return invalid(error, QStringLiteral("Invalid BYMONTHDAY value: %1").arg(token));
                }
                result.byMonthDay.push_back(day);
            }
        } else if (name == QLatin1String("BYMONTH")) {
            for (const QString &token : value.split(QLatin1Char(','))) {
                bool ok = false;
                const int month = token.trimmed().toInt(&ok);
                if (!ok || month < 1 || month > 12) {
                    return invalid(error, QStringLiteral("Invalid BYMONTH value: %1").arg(token));
                }
                result.byMonth.push_back(month);
            }
        } else if (name == QLatin1String("WKST")) {
            const auto day = dayFromCode(value);
            if (!day) {
                return invalid(error, QStringLiteral("Invalid WKST value: %1").arg(value));
            }
            result.weekStart = *day;
        } else if (unsupportedParts.contains(name)) {
            return invalid(error, QStringLiteral("%1 is not supported").arg(name));
        } else {
            return invalid(error, QStringLiteral("Unknown rule part %1").arg(name));
        }
    }

    if (result.count && result.hasUntil()) {
        return invalid(error, QStringLiteral("COUNT and UNTIL cannot be combined"));
    }
    for (const WeekdayRule &weekday : result.byDay) {
        if (weekday.ordinal == 0) {
            continue;
        }
        if (result.frequency != Frequency::Monthly && result.frequency != Frequency::Yearly) {
            return invalid(error, QStringLiteral("Ordinal BYDAY values require FREQ=MONTHLY or FREQ=YEARLY"));
        }
        if (result.frequency == Frequency::Monthly && (weekday.ordinal > 5 || weekday.ordinal < -5)) {
            return invalid(error, QStringLiteral("Monthly BYDAY ordinals must be within -5..5"));
        }
    }
    if (result.frequency == Frequency::Weekly && !result.byMonthDay.empty()) {
        return invalid(error, QStringLiteral("BYMONTHDAY cannot be used with FREQ=WEEKLY"));
    }
    return result;
}

QDateTime RecurrenceRule::untilIn(const QTimeZone &zone) const
{
    if (!hasUntil()) {
        return {};
    }
    if (untilIsUtc) {
        return QDateTime(untilDate, untilTime, Qt::UTC);
    }
    const QTime time = untilTime.isValid() ? untilTime : QTime(23, 59, 59);
    if (zone.isValid()) {
        return QDateTime(untilDate, time, zone);
    }
    return QDateTime(untilDate, time, Qt::UTC);
}

QString RecurrenceRule::toString() const
{
    QStringList parts;
    parts << QStringLiteral("FREQ=%1").arg(frequencyToString(frequency));
    if (interval != 1) {
        parts << QStringLiteral("INTERVAL=%1").arg(interval);
    }
    if (count) {
        parts << QStringLiteral("COUNT=%1").arg(*count);
    } else if (hasUntil()) {
        QString until;
        if (!untilTime.isValid()) {
            until = untilDate.toString(QLatin1String(UNTIL_DATE_FORMAT));
        } else {
            const QDateTime dt(untilDate, untilTime, Qt::UTC);
            until = dt.toString(QLatin1String(untilIsUtc ? UNTIL_UTC_FORMAT : UNTIL_LOCAL_FORMAT));
        }
        parts << QStringLiteral("UNTIL=%1").arg(until);
    }
    if (!byDay.empty()) {
        QStringList days;
        for (const WeekdayRule &weekday : byDay) {
            days << (weekday.ordinal != 0 ? QString::number(weekday.ordinal) : QString()) + dayCode(weekday.day);
        }
        parts << QStringLiteral("BYDAY=%1").arg(days.join(QLatin1Char(',')));
    }
    if (!byMonthDay.empty()) {
        parts << QStringLiteral("BYMONTHDAY=%1").arg(joinNumbers(byMonthDay));
    }
    if (!byMonth.empty()) {
        parts << QStringLiteral("BYMONTH=%1").arg(joinNumbers(byMonth));
    }
    if (weekStart != Qt::Monday) {
        parts << QStringLiteral("WKST=%1").arg(dayCode(weekStart));
    }
    return parts.join(QLatin1Char(';'));
}

QString RecurrenceRule::describe() const
{
    QString description;
    switch (frequency) {
    case Frequency::Hourly:
        description = interval == 1 ? QStringLiteral("Every hour") : QStringLiteral("Every %1 hours").arg(interval);
        break;
    case Frequency::Daily:
        description = interval == 1 ? QStringLiteral("Every day") : QStringLiteral("Every %1 days").arg(interval);
        break;
    case Frequency::Weekly:
        if (!byDay.empty()) {
            QStringList days;
            for (const WeekdayRule &weekday : byDay) {
                days << dayName(weekday.day);
            }
            const QString joined = days.join(QStringLiteral(", "));
            description = interval == 1 ? QStringLiteral("Weekly on %1").arg(joined)
                                        : QStringLiteral("Every %1 weeks on %2").arg(interval).arg(joined);
        } else {
            description = interval == 1 ? QStringLiteral("Every week") : QStringLiteral("Every %1 weeks").arg(interval);
        }
        break;
    case Frequency::Monthly:
        if (!byDay.empty() && byDay.front().ordinal != 0) {
            const QString target = QStringLiteral("%1 %2").arg(positionName(byDay.front().ordinal),
                                                                dayName(byDay.front().day));
            description = interval == 1 ? QStringLiteral("Monthly on the %1").arg(target)
                                        : QStringLiteral("Every %1 months on the %2").arg(interval).arg(target);
        } else if (!byMonthDay.empty()) {
            const QString days = joinNumbers(byMonthDay).replace(QLatin1Char(','), QStringLiteral(", "));
            description = interval == 1 ? QStringLiteral("Monthly on day %1").arg(days)
                                        : QStringLiteral("Every %1 months on day %2").arg(interval).arg(days);
        } else {
            description = interval == 1 ? QStringLiteral("Every month") : QStringLiteral("Every %1 months").arg(interval);
        }
        break;
    case Frequency::Yearly:
        description = interval == 1 ? QStringLiteral("Every year") : QStringLiteral("Every %1 years").arg(interval);
        break;
    }

    if (count) {
        description += QStringLiteral(", %1 times").arg(*count);
    } else if (hasUntil()) {
        description += QStringLiteral(", until %1").arg(untilDate.toString(Qt::ISODate));
    }
    return description;
}

QString withUntil(const QString &text, const QDateTime &untilUtc)
{
    static const QRegularExpression terminator(QStringLiteral(";?(UNTIL|COUNT)=[^;]*"),
                                               QRegularExpression::CaseInsensitiveOption);
    QString rule = text.trimmed();
    rule.remove(terminator);
    while (rule.contains(QStringLiteral(";;"))) {
        rule.replace(QStringLiteral(";;"), QStringLiteral(";"));
    }
    while (rule.endsWith(QLatin1Char(';'))) {
        rule.chop(1);
    }
    if (rule.startsWith(QLatin1Char(';'))) {
        rule.remove(0, 1);
    }
    return rule + QStringLiteral(";UNTIL=") + untilUtc.toUTC().toString(QLatin1String(UNTIL_UTC_FORMAT));
}

} // namespace core
} // namespace recurring
