#include "recurring/data/FileScheduleRepository.hpp"

#include <QMutexLocker>

#include "recurring/core/Logging.hpp"

namespace recurring {
namespace data {

FileScheduleRepository::FileScheduleRepository(std::shared_ptr<FileScheduleStorage> storage)
    : m_storage(std::move(storage))
{
    if (m_storage) {
        restore(m_storage->load());
    }
}

std::optional<SeriesGroup> FileScheduleRepository::addGroup(SeriesGroup group)
{
    const auto before = rollbackPoint();
    auto stored = InMemoryScheduleRepository::addGroup(std::move(group));
    if (stored && !persist(before)) {
        return std::nullopt;
    }
    return stored;
}

bool FileScheduleRepository::updateGroup(const SeriesGroup &group)
{
    const auto before = rollbackPoint();
    return InMemoryScheduleRepository::updateGroup(group) && persist(before);
}

bool FileScheduleRepository::removeGroup(qint64 id)
{
    const auto before = rollbackPoint();
    return InMemoryScheduleRepository::removeGroup(id) && persist(before);
}

std::optional<Series> FileScheduleRepository::addSeries(Series series)
{
    const auto before = rollbackPoint();
    auto stored = InMemoryScheduleRepository::addSeries(std::move(series));
    if (stored && !persist(before)) {
        return std::nullopt;
    }
    return stored;
}

bool FileScheduleRepository::updateSeries(const Series &series)
{
    const auto before = rollbackPoint();
    return InMemoryScheduleRepository::updateSeries(series) && persist(before);
}

bool FileScheduleRepository::removeSeries(qint64 id, const SeriesDeletionKey &key)
{
    const auto before = rollbackPoint();
    return InMemoryScheduleRepository::removeSeries(id, key) && persist(before);
}

std::optional<Instance> FileScheduleRepository::addInstance(Instance instance)
{
    const auto before = rollbackPoint();
    auto stored = InMemoryScheduleRepository::addInstance(std::move(instance));
    if (stored && !persist(before)) {
        return std::nullopt;
    }
    return stored;
}

bool FileScheduleRepository::updateInstance(const Instance &instance)
{
    const auto before = rollbackPoint();
    return InMemoryScheduleRepository::updateInstance(instance) && persist(before);
}

bool FileScheduleRepository::removeInstance(qint64 id)
{
    const auto before = rollbackPoint();
    return InMemoryScheduleRepository::removeInstance(id) && persist(before);
}

void FileScheduleRepository::beginBatch()
{
    QMutexLocker locker(&rowLock());
    ++m_batchDepth;
}

bool FileScheduleRepository::commitBatch()
{
    QMutexLocker locker(&rowLock());
    if (m_batchDepth > 1 || !m_dirty || !m_storage) {
        return true;
    }
    if (!m_storage->save(snapshot())) {
        qCCritical(lcStorage) << "Schedule changes could not be written to" << m_storage->filePath();
        return false;
    }
    m_dirty = false;
    return true;
}

void FileScheduleRepository::endBatch()
{
    QMutexLocker locker(&rowLock());
    if (m_batchDepth == 0) {
        return;
    }
    if (--m_batchDepth == 0 && m_dirty) {
        // The batch was abandoned and its changes reverted in memory; the file still holds the earlier state.
        qCDebug(lcStorage) << "Discarded uncommitted schedule changes";
        m_dirty = false;
    }
}

std::optional<ScheduleSnapshot> FileScheduleRepository::rollbackPoint() const
{
    if (!m_storage || m_batchDepth > 0) {
        return std::nullopt;
    }
    return snapshot();
}

bool FileScheduleRepository::persist(const std::optional<ScheduleSnapshot> &before)
{
    if (!m_storage) {
        return true;
    }
    if (m_batchDepth > 0) {
        m_dirty = true;
        return true;
    }
    if (m_storage->save(snapshot())) {
        return true;
    }
    qCCritical(lcStorage) << "Schedule changes could not be written to" << m_storage->filePath();
    if (before) {
        restore(*before);
    }
    return false;
}

} // namespace data
} // namespace recurring
