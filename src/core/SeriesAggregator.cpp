#include "recurring/core/SeriesAggregator.hpp"

#include <algorithm>

#include <QMutexLocker>

#include "recurring/data/ScheduleRepository.hpp"

namespace recurring {
namespace core {

QString groupStatusToString(GroupStatus status)
{
    switch (status) {
    case GroupStatus::Active:
        return QStringLiteral("active");
    case GroupStatus::NeedsAttention:
        return QStringLiteral("needs_attention");
    case GroupStatus::Ended:
    default:
        return QStringLiteral("ended");
    }
}

SeriesAggregator::SeriesAggregator(const data::ScheduleRepository &repository, int instanceLimit)
    : m_repository(repository)
    , m_instanceLimit(std::max(0, instanceLimit))
{
}

std::optional<GroupSummary> SeriesAggregator::summarize(qint64 groupId, ScheduleError *error) const
{
    QMutexLocker locker(&m_repository.rowLock());
    const auto group = m_repository.findGroup(groupId);
    if (!group) {
        fail(error, ErrorKind::NotFound, QStringLiteral("Group %1 not found").arg(groupId));
        return std::nullopt;
    }
    return buildSummary(*group);
}

std::vector<GroupSummary> SeriesAggregator::summarizeAll() const
{
    QMutexLocker locker(&m_repository.rowLock());
    std::vector<GroupSummary> summaries;
    for (const data::SeriesGroup &group : m_repository.fetchGroups()) {
        summaries.push_back(buildSummary(group));
    }
    return summaries;
}

GroupSummary SeriesAggregator::buildSummary(const data::SeriesGroup &group) const
{
    GroupSummary summary;
    summary.group = group;

    const std::vector<data::Series> versions = m_repository.fetchSeriesForGroup(group.id);
    summary.versionCount = static_cast<int>(versions.size());

    bool anyCurrentActive = false;
    bool anyNeedsAttention = false;
    std::vector<data::Instance> instances;
    for (const data::Series &series : versions) {
        if (summary.recordType.isEmpty()) {
            summary.recordType = series.recordType;
        }
        if (series.effectiveFrom.isValid()
            && (!summary.startedOn.isValid() || series.effectiveFrom < summary.startedOn)) {
            summary.startedOn = series.effectiveFrom;
        }
        if (series.isCurrent()) {
            if (!summary.currentVersion || series.versionNumber > summary.currentVersion->versionNumber) {
                summary.currentVersion = series;
            }
            if (series.status == data::SeriesStatus::Active) {
                anyCurrentActive = true;
            }
        }
        if (series.status == data::SeriesStatus::NeedsAttention) {
            anyNeedsAttention = true;
        }

        for (const data::Instance &instance : m_repository.fetchInstances(series.id)) {
            if (instance.recordId) {
                ++summary.activeInstanceCount;
            }
            if (instance.isException) {
                ++summary.exceptionCount;
            }
            instances.push_back(instance);
        }
    }

    if (anyCurrentActive) {
        summary.status = GroupStatus::Active;
    } else if (anyNeedsAttention) {
        summary.status = GroupStatus::NeedsAttention;
    } else {
        summary.status = GroupStatus::Ended;
    }

    std::stable_sort(instances.begin(), instances.end(), [](const data::Instance &lhs, const data::Instance &rhs) {
        return lhs.occurrenceDate < rhs.occurrenceDate;
    });
    if (static_cast<int>(instances.size()) > m_instanceLimit) {
        instances.resize(static_cast<size_t>(m_instanceLimit));
    }
    summary.instances = std::move(instances);
    return summary;
}

} // namespace core
} // namespace recurring
