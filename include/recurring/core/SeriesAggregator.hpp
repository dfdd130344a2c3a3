#pragma once

#include <optional>
#include <vector>

#include <QDate>

#include "recurring/core/ScheduleError.hpp"
#include "recurring/data/Instance.hpp"
#include "recurring/data/Series.hpp"
#include "recurring/data/SeriesGroup.hpp"

namespace recurring {
namespace data {
class ScheduleRepository;
}

namespace core {

enum class GroupStatus
{
    Active,
    NeedsAttention,
    Ended,
};

QString groupStatusToString(GroupStatus status);

struct GroupSummary
{
    data::SeriesGroup group;
    int versionCount = 0;
    QDate startedOn;
    QString recordType;
    std::optional<data::Series> currentVersion;
    int activeInstanceCount = 0; // instances that still have a record
    int exceptionCount = 0;
    GroupStatus status = GroupStatus::Ended;
    std::vector<data::Instance> instances; // earliest first, capped
};

// Read-only presentation summaries of series groups.
class SeriesAggregator
{
public:
    explicit SeriesAggregator(const data::ScheduleRepository &repository, int instanceLimit = 100);

    std::optional<GroupSummary> summarize(qint64 groupId, ScheduleError *error = nullptr) const;
    std::vector<GroupSummary> summarizeAll() const;

private:
    GroupSummary buildSummary(const data::SeriesGroup &group) const;

    const data::ScheduleRepository &m_repository;
    int m_instanceLimit;
};

} // namespace core
} // namespace recurring
