#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "recurring/core/EngineSettings.hpp"
#include "recurring/core/RecurrenceExpander.hpp"
#include "recurring/core/ScheduleError.hpp"
#include "recurring/core/TemplateValidator.hpp"
#include "recurring/data/ExpansionJobSink.hpp"

namespace recurring {
namespace data {
class EntityStore;
class FieldMetadataSource;
class InMemoryJobQueue;
class ScheduleRepository;
}

namespace core {

struct ExpansionReport
{
    qint64 seriesId = 0;
    int generated = 0;
    int created = 0;
    int conflictSkipped = 0;
    int alreadyPresent = 0;
    int sameDayDropped = 0; // later occurrences on a local date this job already used
    bool skippedInactive = false;
    std::vector<DriftIssue> driftIssues; // non-empty means the series was flagged and not expanded
};

// Materializes queued expansion jobs into records and Instance rows.
class ExpansionWorker
{
public:
    using Clock = std::function<QDateTime()>;

    ExpansionWorker(data::ScheduleRepository &repository, data::EntityStore &store,
                    const data::FieldMetadataSource &metadata, EngineSettings settings = EngineSettings());

    void setClock(Clock clock);

    std::optional<ExpansionReport> process(const data::ExpansionJob &job, ScheduleError *error = nullptr);

    // Processes queued jobs until the queue is empty. Returns the number of jobs that succeeded.
    int drain(data::InMemoryJobQueue &queue);

private:
    data::ScheduleRepository &m_repository;
    data::EntityStore &m_store;
    TemplateValidator m_templates;
    RecurrenceExpander m_expander;
    Clock m_clock;
};

} // namespace core
} // namespace recurring
