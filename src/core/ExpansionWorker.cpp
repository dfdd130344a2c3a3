#include "recurring/core/ExpansionWorker.hpp"

#include <QMutexLocker>
#include <QSet>

#include "recurring/core/Logging.hpp"
#include "recurring/data/EntityStore.hpp"
#include "recurring/data/InMemoryJobQueue.hpp"
#include "recurring/data/ScheduleRepository.hpp"

namespace recurring {
namespace core {

ExpansionWorker::ExpansionWorker(data::ScheduleRepository &repository, data::EntityStore &store,
                                 const data::FieldMetadataSource &metadata, EngineSettings settings)
    : m_repository(repository)
    , m_store(store)
    , m_templates(metadata)
    , m_expander(settings.maxOccurrences)
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
}

void ExpansionWorker::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

std::optional<ExpansionReport> ExpansionWorker::process(const data::ExpansionJob &job, ScheduleError *error)
{
    QMutexLocker locker(&m_repository.rowLock());
    const auto found = m_repository.findSeries(job.seriesId);
    if (!found) {
        fail(error, ErrorKind::NotFound, QStringLiteral("Series %1 not found").arg(job.seriesId));
        return std::nullopt;
    }
    data::Series series = *found;

    ExpansionReport report;
    report.seriesId = series.id;
    if (series.status != data::SeriesStatus::Active) {
        qCInfo(lcExpansion) << "Series" << series.id << "is" << data::seriesStatusToString(series.status)
                            << "- skipping expansion";
        report.skippedInactive = true;
        return report;
    }

    report.driftIssues = m_templates.checkSchemaDrift(series.recordType, series.recordTemplate, series.timeField);
    if (!report.driftIssues.empty()) {
        for (const DriftIssue &issue : report.driftIssues) {
            qCWarning(lcExpansion) << "Series" << series.id << "field" << issue.field << ":" << issue.issue;
        }
        series.status = data::SeriesStatus::NeedsAttention;
        if (!m_repository.updateSeries(series)) {
            fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not flag series %1").arg(series.id));
            return std::nullopt;
        }
        return report;
    }

    const QTimeZone zone = RecurrenceExpander::resolveTimeZone(series.timeZoneId);
    const auto rule = RecurrenceRule::parse(series.rule, error);
    if (!rule) {
        return std::nullopt;
    }
    const std::vector<Occurrence> occurrences =
        m_expander.expand(*rule, series.anchor, series.durationSecs, zone, job.expandUntil);
    report.generated = static_cast<int>(occurrences.size());

    QSet<QDate> existing;
    for (const data::Instance &instance : m_repository.fetchInstances(series.id)) {
        existing.insert(instance.occurrenceDate);
    }
    // An Instance is keyed by its local date, so only the first occurrence of a day can be kept.
    QSet<QDate> seenThisJob;

    for (const Occurrence &occurrence : occurrences) {
        if (occurrence.localDate < series.effectiveFrom
            || (series.effectiveUntil.isValid() && occurrence.localDate > series.effectiveUntil)) {
            continue;
        }
        if (seenThisJob.contains(occurrence.localDate)) {
            ++report.sameDayDropped;
            continue;
        }
        seenThisJob.insert(occurrence.localDate);
        if (existing.contains(occurrence.localDate)) {
            ++report.alreadyPresent;
            continue;
        }

        QVariantMap fields = series.recordTemplate;
        fields.insert(series.timeField, QVariant::fromValue(occurrence.range));

        data::Instance instance;
        instance.seriesId = series.id;
        instance.occurrenceDate = occurrence.localDate;
        instance.recordType = series.recordType;
        instance.createdAt = m_clock();

        QString reason;
        const auto recordId = m_store.createRecord(series.recordType, fields, &reason);
        if (!recordId) {
            qCInfo(lcExpansion) << "Series" << series.id << "occurrence" << occurrence.localDate
                                << "not booked:" << reason;
            instance.isException = true;
            instance.exceptionType = data::ExceptionType::ConflictSkipped;
            instance.exceptionReason = reason;
            instance.exceptionAt = instance.createdAt;
            if (!m_repository.addInstance(instance)) {
                qCWarning(lcExpansion) << "Could not record skipped occurrence" << occurrence.localDate;
                continue;
            }
            ++report.conflictSkipped;
            existing.insert(occurrence.localDate);
            continue;
        }

        instance.recordId = *recordId;
        if (!m_repository.addInstance(instance)) {
            qCWarning(lcExpansion) << "Could not link" << series.recordType << "record" << *recordId
                                   << "to series" << series.id << "- removing it";
            if (!m_store.removeRecord(series.recordType, *recordId)) {
                qCCritical(lcExpansion) << "Unlinked" << series.recordType << "record" << *recordId << "remains";
            }
            continue;
        }
        ++report.created;
        existing.insert(occurrence.localDate);
    }

    const QDate reached = job.expandUntil.toTimeZone(zone).date();
    if (!series.expandedUntil.isValid() || series.expandedUntil < reached) {
        series.expandedUntil = reached;
        if (!m_repository.updateSeries(series)) {
            fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update series %1").arg(series.id));
            return std::nullopt;
        }
    }

    if (report.sameDayDropped > 0) {
        qCWarning(lcExpansion) << "Series" << series.id << "has" << report.sameDayDropped
                               << "occurrences sharing a day with an earlier one; only the first of each day is booked";
    }
    qCInfo(lcExpansion) << "Series" << series.id << "expanded to" << reached << ":" << report.created << "created,"
                        << report.conflictSkipped << "skipped (conflicts)," << report.alreadyPresent
                        << "already present";
    return report;
}

int ExpansionWorker::drain(data::InMemoryJobQueue &queue)
{
    int succeeded = 0;
    while (const auto job = queue.takeNext()) {
        ScheduleError error;
        if (process(*job, &error)) {
            ++succeeded;
        } else {
            qCWarning(lcExpansion) << "Expansion job for series" << job->seriesId << "failed:" << error.toString();
        }
    }
    return succeeded;
}

} // namespace core
} // namespace recurring
