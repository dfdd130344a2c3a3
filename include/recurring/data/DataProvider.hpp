#pragma once

#include <memory>
#include <QString>

namespace recurring {
namespace data {

class FileScheduleStorage;
class ScheduleRepository;

class DataProvider
{
public:
    // An empty path selects schedule.json under the application data location.
    explicit DataProvider(const QString &filePath = QString());
    ~DataProvider();

    ScheduleRepository &scheduleRepository();
    QString filePath() const;

    static QString defaultFilePath();

private:
    std::shared_ptr<FileScheduleStorage> m_scheduleStorage;
    std::unique_ptr<ScheduleRepository> m_scheduleRepository;
};

} // namespace data
} // namespace recurring
