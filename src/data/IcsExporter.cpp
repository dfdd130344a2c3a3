#include "recurring/data/IcsExporter.hpp"

#include <QMutexLocker>
#include <QSaveFile>
#include <QStringList>
#include <QTextStream>
#include <QTimeZone>

#include "recurring/core/Logging.hpp"
#include "recurring/data/ScheduleRepository.hpp"

namespace recurring {
namespace data {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto LOCAL_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

QTimeZone seriesZone(const Series &series)
{
    if (series.timeZoneId.isEmpty()) {
        return {};
    }
    QTimeZone zone(series.timeZoneId);
    return zone.isValid() ? zone : QTimeZone();
}

QString formatLocal(const QDateTime &dt, const QTimeZone &zone)
{
    return dt.toTimeZone(zone).toString(QLatin1String(LOCAL_DATE_TIME_FORMAT));
}
} // namespace

IcsExporter::IcsExporter(const ScheduleRepository &repository)
    : m_repository(repository)
{
}

QString IcsExporter::exportGroup(qint64 groupId) const
{
    QMutexLocker locker(&m_repository.rowLock());
    const auto group = m_repository.findGroup(groupId);
    if (!group) {
        return {};
    }

    QString document;
    QTextStream stream(&document);

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Recurring Schedule//EN\n";

    for (const Series &series : m_repository.fetchSeriesForGroup(groupId)) {
        const QTimeZone zone = seriesZone(series);
        QString rule = series.rule;
        if (rule.startsWith(QLatin1String("RRULE:"), Qt::CaseInsensitive)) {
            rule.remove(0, 6);
        }

        stream << "BEGIN:VEVENT\n";
        stream << "UID:series-" << series.id << "@recurring-schedule\n";
        if (series.createdAt.isValid()) {
            stream << "DTSTAMP:" << formatDateTime(series.createdAt) << '\n';
        }
        QString summary = group->displayName;
        if (series.versionNumber > 1) {
            summary += QStringLiteral(" (v%1)").arg(series.versionNumber);
        }
        stream << "SUMMARY:" << encodeText(summary) << '\n';
        if (!group->description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(group->description) << '\n';
        }
        if (zone.isValid()) {
            stream << "DTSTART;TZID=" << QString::fromUtf8(series.timeZoneId) << ':'
                   << formatLocal(series.anchor, zone) << '\n';
        } else {
            stream << "DTSTART:" << formatDateTime(series.anchor) << '\n';
        }
        stream << "DURATION:" << formatDuration(series.durationSecs) << '\n';
        stream << "RRULE:" << rule << '\n';
        const QString excluded = exdates(series);
        if (!excluded.isEmpty()) {
            stream << excluded << '\n';
        }
        if (!group->color.isEmpty()) {
            stream << "COLOR:" << group->color << '\n';
        }
        stream << "X-RECURRING-VERSION:" << series.versionNumber << '\n';
        stream << "X-RECURRING-STATUS:" << seriesStatusToString(series.status).toUpper() << '\n';
        stream << "END:VEVENT\n";
    }

    stream << "END:VCALENDAR\n";
    stream.flush();
    return document;
}

bool IcsExporter::writeGroup(qint64 groupId, const QString &filePath) const
{
    const QString document = exportGroup(groupId);
    if (document.isEmpty()) {
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "Cannot write calendar export" << filePath << file.errorString();
        return false;
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << document;
    stream.flush();
    return file.commit();
}

QString IcsExporter::exdates(const Series &series) const
{
    const QTimeZone zone = seriesZone(series);
    const QTimeZone expansionZone = zone.isValid() ? zone : QTimeZone::utc();
    const QTime startTime = series.anchor.toTimeZone(expansionZone).time();

    QStringList values;
    for (const Instance &instance : m_repository.fetchInstances(series.id)) {
        if (instance.exceptionType != ExceptionType::Cancelled
            && instance.exceptionType != ExceptionType::ConflictSkipped) {
            continue;
        }
        const QDateTime start(instance.occurrenceDate, startTime, expansionZone);
        values << (zone.isValid() ? formatLocal(start, zone) : formatDateTime(start));
    }
    if (values.isEmpty()) {
        return {};
    }
    if (zone.isValid()) {
        return QStringLiteral("EXDATE;TZID=%1:%2").arg(QString::fromUtf8(series.timeZoneId), values.join(QLatin1Char(',')));
    }
    return QStringLiteral("EXDATE:%1").arg(values.join(QLatin1Char(',')));
}

QString IcsExporter::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString IcsExporter::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QString IcsExporter::formatDuration(qint64 seconds)
{
    if (seconds <= 0) {
        return QStringLiteral("PT0S");
    }
    const qint64 days = seconds / 86400;
    const qint64 hours = (seconds % 86400) / 3600;
    const qint64 minutes = (seconds % 3600) / 60;
    const qint64 secs = seconds % 60;

    QString result = QStringLiteral("P");
    if (days > 0) {
        result += QStringLiteral("%1D").arg(days);
    }
    if (hours > 0 || minutes > 0 || secs > 0) {
        result += QLatin1Char('T');
        if (hours > 0) {
            result += QStringLiteral("%1H").arg(hours);
        }
        if (minutes > 0) {
            result += QStringLiteral("%1M").arg(minutes);
        }
        if (secs > 0) {
            result += QStringLiteral("%1S").arg(secs);
        }
    }
    return result;
}

} // namespace data
} // namespace recurring
