#include "recurring/data/InMemoryScheduleRepository.hpp"

#include <QMutexLocker>
#include <algorithm>

namespace recurring {
namespace data {

namespace {
bool sameRecord(const Instance &lhs, const Instance &rhs)
{
    return lhs.recordId.has_value() && rhs.recordId.has_value()
        && *lhs.recordId == *rhs.recordId && lhs.recordType == rhs.recordType;
}
} // namespace

InMemoryScheduleRepository::InMemoryScheduleRepository() = default;
InMemoryScheduleRepository::~InMemoryScheduleRepository() = default;

std::vector<SeriesGroup> InMemoryScheduleRepository::fetchGroups() const
{
    std::vector<SeriesGroup> groups;
    groups.reserve(static_cast<size_t>(m_groups.size()));
    for (const auto &group : m_groups) {
        groups.push_back(group);
    }
    std::sort(groups.begin(), groups.end(), [](const SeriesGroup &lhs, const SeriesGroup &rhs) {
        return lhs.id < rhs.id;
    });
    return groups;
}

std::optional<SeriesGroup> InMemoryScheduleRepository::findGroup(qint64 id) const
{
    if (m_groups.contains(id)) {
        return m_groups.value(id);
    }
    return std::nullopt;
}

std::optional<SeriesGroup> InMemoryScheduleRepository::addGroup(SeriesGroup group)
{
    if (group.id == 0) {
        group.id = m_nextGroupId;
    } else if (m_groups.contains(group.id)) {
        return std::nullopt;
    }
    m_nextGroupId = std::max(m_nextGroupId, group.id + 1);
    m_groups.insert(group.id, group);
    return group;
}

bool InMemoryScheduleRepository::updateGroup(const SeriesGroup &group)
{
    if (!m_groups.contains(group.id)) {
        return false;
    }
    m_groups.insert(group.id, group);
    return true;
}

bool InMemoryScheduleRepository::removeGroup(qint64 id)
{
    if (!m_groups.contains(id)) {
        return false;
    }
    QList<qint64> owned;
    for (const auto &series : m_series) {
        if (series.groupId && *series.groupId == id) {
            owned << series.id;
        }
    }
    for (qint64 seriesId : owned) {
        removeSeriesRows(seriesId);
    }
    m_groups.remove(id);
    return true;
}

std::optional<Series> InMemoryScheduleRepository::findSeries(qint64 id) const
{
    if (m_series.contains(id)) {
        return m_series.value(id);
    }
    return std::nullopt;
}

std::vector<Series> InMemoryScheduleRepository::fetchSeries() const
{
    std::vector<Series> result;
    result.reserve(static_cast<size_t>(m_series.size()));
    for (const auto &series : m_series) {
        result.push_back(series);
    }
    std::sort(result.begin(), result.end(), [](const Series &lhs, const Series &rhs) {
        return lhs.id < rhs.id;
    });
    return result;
}

std::vector<Series> InMemoryScheduleRepository::fetchSeriesForGroup(qint64 groupId) const
{
    std::vector<Series> result;
    for (const auto &series : m_series) {
        if (series.groupId && *series.groupId == groupId) {
            result.push_back(series);
        }
    }
    std::sort(result.begin(), result.end(), [](const Series &lhs, const Series &rhs) {
        return lhs.versionNumber < rhs.versionNumber;
    });
    return result;
}

std::optional<Series> InMemoryScheduleRepository::addSeries(Series series)
{
    if (series.groupId && !m_groups.contains(*series.groupId)) {
        return std::nullopt;
    }
    if (series.id == 0) {
        series.id = m_nextSeriesId;
    } else if (m_series.contains(series.id)) {
        return std::nullopt;
    }
    m_nextSeriesId = std::max(m_nextSeriesId, series.id + 1);
    m_series.insert(series.id, series);
    return series;
}

bool InMemoryScheduleRepository::updateSeries(const Series &series)
{
    if (!m_series.contains(series.id)) {
        return false;
    }
    if (series.groupId && !m_groups.contains(*series.groupId)) {
        return false;
    }
    m_series.insert(series.id, series);
    return true;
}

bool InMemoryScheduleRepository::removeSeries(qint64 id, const SeriesDeletionKey &key)
{
    Q_UNUSED(key)
    if (!m_series.contains(id)) {
        return false;
    }
    removeSeriesRows(id);
    return true;
}

void InMemoryScheduleRepository::removeSeriesRows(qint64 id)
{
    for (auto it = m_instances.begin(); it != m_instances.end();) {
        if (it->seriesId == id) {
            it = m_instances.erase(it);
        } else {
            ++it;
        }
    }
    m_series.remove(id);
}

std::optional<Instance> InMemoryScheduleRepository::findInstance(qint64 id) const
{
    if (m_instances.contains(id)) {
        return m_instances.value(id);
    }
    return std::nullopt;
}

std::optional<Instance> InMemoryScheduleRepository::findInstanceByRecord(const QString &recordType, qint64 recordId) const
{
    for (const auto &instance : m_instances) {
        if (instance.recordId && *instance.recordId == recordId && instance.recordType == recordType) {
            return instance;
        }
    }
    return std::nullopt;
}

std::vector<Instance> InMemoryScheduleRepository::fetchInstances(qint64 seriesId) const
{
    std::vector<Instance> result;
    for (const auto &instance : m_instances) {
        if (instance.seriesId == seriesId) {
            result.push_back(instance);
        }
    }
    std::sort(result.begin(), result.end(), [](const Instance &lhs, const Instance &rhs) {
        if (lhs.occurrenceDate == rhs.occurrenceDate) {
            return lhs.id < rhs.id;
        }
        return lhs.occurrenceDate < rhs.occurrenceDate;
    });
    return result;
}

std::optional<Instance> InMemoryScheduleRepository::addInstance(Instance instance)
{
    if (!m_series.contains(instance.seriesId) || !instance.occurrenceDate.isValid()) {
        return std::nullopt;
    }
    if (instance.id == 0) {
        instance.id = m_nextInstanceId;
    } else if (m_instances.contains(instance.id)) {
        return std::nullopt;
    }
    if (conflictsWithExisting(instance)) {
        return std::nullopt;
    }
    m_nextInstanceId = std::max(m_nextInstanceId, instance.id + 1);
    m_instances.insert(instance.id, instance);
    return instance;
}

bool InMemoryScheduleRepository::updateInstance(const Instance &instance)
{
    if (!m_instances.contains(instance.id) || !m_series.contains(instance.seriesId)) {
        return false;
    }
    if (conflictsWithExisting(instance)) {
        return false;
    }
    m_instances.insert(instance.id, instance);
    return true;
}

bool InMemoryScheduleRepository::removeInstance(qint64 id)
{
    return m_instances.remove(id) > 0;
}

QRecursiveMutex &InMemoryScheduleRepository::rowLock() const
{
    return m_rowLock;
}

ScheduleSnapshot InMemoryScheduleRepository::snapshot() const
{
    QMutexLocker locker(&m_rowLock);
    ScheduleSnapshot result;
    result.groups = fetchGroups();
    result.series = fetchSeries();
    for (const auto &instance : m_instances) {
        result.instances.push_back(instance);
    }
    std::sort(result.instances.begin(), result.instances.end(), [](const Instance &lhs, const Instance &rhs) {
        return lhs.id < rhs.id;
    });
    return result;
}

void InMemoryScheduleRepository::restore(const ScheduleSnapshot &snapshot)
{
    QMutexLocker locker(&m_rowLock);
    m_groups.clear();
    m_series.clear();
    m_instances.clear();
    m_nextGroupId = 1;
    m_nextSeriesId = 1;
    m_nextInstanceId = 1;
    for (const auto &group : snapshot.groups) {
        m_groups.insert(group.id, group);
        m_nextGroupId = std::max(m_nextGroupId, group.id + 1);
    }
    for (const auto &series : snapshot.series) {
        m_series.insert(series.id, series);
        m_nextSeriesId = std::max(m_nextSeriesId, series.id + 1);
    }
    for (const auto &instance : snapshot.instances) {
        m_instances.insert(instance.id, instance);
        m_nextInstanceId = std::max(m_nextInstanceId, instance.id + 1);
    }
}

bool InMemoryScheduleRepository::conflictsWithExisting(const Instance &instance) const
{
    for (const auto &existing : m_instances) {
        if (existing.id == instance.id) {
            continue;
        }
        if (existing.seriesId == instance.seriesId && existing.occurrenceDate == instance.occurrenceDate) {
            return true;
        }
        if (sameRecord(existing, instance)) {
            return true;
        }
    }
    return false;
}

} // namespace data
} // namespace recurring
