#pragma once

#include <QDateTime>
#include <QString>

namespace recurring {
namespace data {

class ScheduleRepository;
struct Series;

// Writes a series group as an iCalendar document, one VEVENT per version.
class IcsExporter
{
public:
    explicit IcsExporter(const ScheduleRepository &repository);

    // Empty string when the group does not exist.
    QString exportGroup(qint64 groupId) const;
    bool writeGroup(qint64 groupId, const QString &filePath) const;

    static QString encodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QString formatDuration(qint64 seconds);

private:
    QString exdates(const Series &series) const;

    const ScheduleRepository &m_repository;
};

} // namespace data
} // namespace recurring
