#pragma once

#include <QHash>

#include "recurring/data/ScheduleRepository.hpp"

namespace recurring {
namespace data {

struct ScheduleSnapshot
{
    std::vector<SeriesGroup> groups;
    std::vector<Series> series;
    std::vector<Instance> instances;
};

class InMemoryScheduleRepository : public ScheduleRepository
{
public:
    InMemoryScheduleRepository();
    ~InMemoryScheduleRepository() override;

    std::vector<SeriesGroup> fetchGroups() const override;
    std::optional<SeriesGroup> findGroup(qint64 id) const override;
    std::optional<SeriesGroup> addGroup(SeriesGroup group) override;
    bool updateGroup(const SeriesGroup &group) override;
    bool removeGroup(qint64 id) override;

    std::optional<Series> findSeries(qint64 id) const override;
    std::vector<Series> fetchSeries() const override;
    std::vector<Series> fetchSeriesForGroup(qint64 groupId) const override;
    std::optional<Series> addSeries(Series series) override;
    bool updateSeries(const Series &series) override;
    bool removeSeries(qint64 id, const SeriesDeletionKey &key) override;

    std::optional<Instance> findInstance(qint64 id) const override;
    std::optional<Instance> findInstanceByRecord(const QString &recordType, qint64 recordId) const override;
    std::vector<Instance> fetchInstances(qint64 seriesId) const override;
    std::optional<Instance> addInstance(Instance instance) override;
    bool updateInstance(const Instance &instance) override;
    bool removeInstance(qint64 id) override;

    QRecursiveMutex &rowLock() const override;

    ScheduleSnapshot snapshot() const;
    void restore(const ScheduleSnapshot &snapshot);

protected:
    void removeSeriesRows(qint64 id);

private:
    bool conflictsWithExisting(const Instance &instance) const;

    QHash<qint64, SeriesGroup> m_groups;
    QHash<qint64, Series> m_series;
    QHash<qint64, Instance> m_instances;
    qint64 m_nextGroupId = 1;
    qint64 m_nextSeriesId = 1;
    qint64 m_nextInstanceId = 1;
    mutable QRecursiveMutex m_rowLock;
};

} // namespace data
} // namespace recurring
