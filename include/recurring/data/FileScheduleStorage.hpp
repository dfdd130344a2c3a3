#pragma once

#include <QJsonObject>
#include <QString>

#include "recurring/data/InMemoryScheduleRepository.hpp"

namespace recurring {
namespace data {

// Reads and writes the schedule (groups, series, instances) as one JSON document.
class FileScheduleStorage
{
public:
    explicit FileScheduleStorage(QString filePath);
    ~FileScheduleStorage() = default;

    const QString &filePath() const;

    ScheduleSnapshot load() const;
    bool save(const ScheduleSnapshot &snapshot) const;

private:
    static QJsonObject groupToJson(const SeriesGroup &group);
    static SeriesGroup groupFromJson(const QJsonObject &object);
    static QJsonObject seriesToJson(const Series &series);
    static Series seriesFromJson(const QJsonObject &object);
    static QJsonObject instanceToJson(const Instance &instance);
    static Instance instanceFromJson(const QJsonObject &object);

    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);
    static QString formatDate(const QDate &date);
    static QDate parseDate(const QString &value);

    QString m_filePath;
};

} // namespace data
} // namespace recurring
