#pragma once

#include <optional>
#include <vector>

#include <QRecursiveMutex>

#include "recurring/data/Instance.hpp"
#include "recurring/data/Series.hpp"
#include "recurring/data/SeriesGroup.hpp"

namespace recurring {
namespace core {
class SeriesManager;
}

namespace data {

// Series rows may only be removed together with their instances and records.
// Only the series manager can construct this key.
class SeriesDeletionKey
{
    friend class core::SeriesManager;
    SeriesDeletionKey() {}
};

class ScheduleRepository
{
public:
    virtual ~ScheduleRepository() = default;

    virtual std::vector<SeriesGroup> fetchGroups() const = 0;
    virtual std::optional<SeriesGroup> findGroup(qint64 id) const = 0;
    // Assigns an id when group.id is 0. Fails if the id is taken.
    virtual std::optional<SeriesGroup> addGroup(SeriesGroup group) = 0;
    virtual bool updateGroup(const SeriesGroup &group) = 0;
    virtual bool removeGroup(qint64 id) = 0;

    virtual std::optional<Series> findSeries(qint64 id) const = 0;
    // Every series, grouped or standalone, ordered by id.
    virtual std::vector<Series> fetchSeries() const = 0;
    virtual std::vector<Series> fetchSeriesForGroup(qint64 groupId) const = 0;
    virtual std::optional<Series> addSeries(Series series) = 0;
    virtual bool updateSeries(const Series &series) = 0;
    // Removes the series and every instance that belongs to it.
    virtual bool removeSeries(qint64 id, const SeriesDeletionKey &key) = 0;

    virtual std::optional<Instance> findInstance(qint64 id) const = 0;
    virtual std::optional<Instance> findInstanceByRecord(const QString &recordType, qint64 recordId) const = 0;
    // Ordered by occurrence date.
    virtual std::vector<Instance> fetchInstances(qint64 seriesId) const = 0;
    // Fails on a duplicate (series, date) or (record type, record id).
    virtual std::optional<Instance> addInstance(Instance instance) = 0;
    virtual bool updateInstance(const Instance &instance) = 0;
    virtual bool removeInstance(qint64 id) = 0;

    // Held across every read-modify-write sequence on series and instance rows,
    // and by readers that need a consistent view.
    virtual QRecursiveMutex &rowLock() const = 0;

    // Mutations between beginBatch() and endBatch() reach the backing store
    // together when commitBatch() is called on the outermost batch. Outside a
    // batch every mutation is stored on its own.
    virtual void beginBatch() {}
    // False when the pending changes could not be stored. Nested batches return true.
    virtual bool commitBatch() { return true; }
    virtual void endBatch() {}
};

// Scope guard for a repository batch. A batch left without commit() stores nothing.
class ScheduleBatch
{
public:
    explicit ScheduleBatch(ScheduleRepository &repository)
        : m_repository(repository)
    {
        m_repository.beginBatch();
    }
    ~ScheduleBatch() { m_repository.endBatch(); }

    ScheduleBatch(const ScheduleBatch &) = delete;
    ScheduleBatch &operator=(const ScheduleBatch &) = delete;

    bool commit() { return m_repository.commitBatch(); }

private:
    ScheduleRepository &m_repository;
};

} // namespace data
} // namespace recurring
