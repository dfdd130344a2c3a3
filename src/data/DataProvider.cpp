#include "recurring/data/DataProvider.hpp"

#include "recurring/data/FileScheduleRepository.hpp"
#include "recurring/data/FileScheduleStorage.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace recurring {
namespace data {

DataProvider::DataProvider(const QString &filePath)
{
    const QString path = filePath.isEmpty() ? defaultFilePath() : filePath;
    QDir dir = QFileInfo(path).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    m_scheduleStorage = std::make_shared<FileScheduleStorage>(path);
    m_scheduleRepository = std::make_unique<FileScheduleRepository>(m_scheduleStorage);
}

DataProvider::~DataProvider() = default;

ScheduleRepository &DataProvider::scheduleRepository()
{
    return *m_scheduleRepository;
}

QString DataProvider::filePath() const
{
    return m_scheduleStorage->filePath();
}

QString DataProvider::defaultFilePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/recurring-schedule");
    }
    return QDir(storageFolder).filePath(QStringLiteral("schedule.json"));
}

} // namespace data
} // namespace recurring
