#include "recurring/core/InstanceTracker.hpp"

#include <QMutexLocker>

#include "recurring/core/ChangeSet.hpp"
#include "recurring/core/Logging.hpp"
#include "recurring/data/EntityStore.hpp"
#include "recurring/data/ScheduleRepository.hpp"

namespace recurring {
namespace core {

namespace {
void restoreInstance(data::ScheduleRepository &repository, const data::Instance &instance)
{
    if (!repository.updateInstance(instance)) {
        qCCritical(lcInstances) << "Rollback could not restore instance" << instance.id;
    }
}
} // namespace

InstanceTracker::InstanceTracker(data::ScheduleRepository &repository, data::EntityStore &store,
                                 EngineSettings settings)
    : m_repository(repository)
    , m_store(store)
    , m_settings(std::move(settings))
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
}

InstanceTracker::~InstanceTracker()
{
    if (m_cleanupHookId != 0) {
        m_store.removePreDeleteHook(m_cleanupHookId);
    }
}

void InstanceTracker::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

QDateTime InstanceTracker::now() const
{
    return m_clock();
}

void InstanceTracker::installOrphanCleanup()
{
    if (m_cleanupHookId != 0) {
        return;
    }
    m_cleanupHookId = m_store.addPreDeleteHook([this](const QString &recordType, qint64 recordId) {
        handleRecordRemoved(recordType, recordId);
    });
}

std::optional<CancelResult> InstanceTracker::cancelOccurrence(const QString &recordType, qint64 recordId,
                                                              const QString &reason, const QUuid &actor,
                                                              ScheduleError *error)
{
    QMutexLocker locker(&m_repository.rowLock());
    CancelResult result;
    const auto instance = m_repository.findInstanceByRecord(recordType, recordId);
    const auto record = m_store.findRecord(recordType, recordId);

    if (!instance) {
        if (record) {
            if (!m_store.removeRecord(recordType, recordId)) {
                fail(error, ErrorKind::StoreFailure,
                     QStringLiteral("Could not delete %1 record %2").arg(recordType).arg(recordId));
                return std::nullopt;
            }
            result.recordRemoved = true;
        }
        qCDebug(lcInstances) << "Cancelled" << recordType << recordId << "outside any series";
        return result;
    }

    result.wasMember = true;
    result.seriesId = instance->seriesId;
    result.occurrenceDate = instance->occurrenceDate;

    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    data::Instance cancelled = *instance;
    cancelled.recordId.reset();
    cancelled.isException = true;
    cancelled.exceptionType = data::ExceptionType::Cancelled;
    cancelled.exceptionReason = reason;
    cancelled.exceptionAt = now();
    cancelled.exceptionBy = actor;
    if (!changes.push([this, cancelled] { return m_repository.updateInstance(cancelled); },
                      [this, original = *instance] { restoreInstance(m_repository, original); })) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update instance %1").arg(instance->id));
        return std::nullopt;
    }

    if (record) {
        if (!changes.push([this, record] { return m_store.removeRecord(record->type, record->id); },
                          [this, record] {
                              if (!m_store.restoreRecord(*record)) {
                                  qCCritical(lcInstances) << "Rollback could not restore record" << record->id;
                              }
                          })) {
            fail(error, ErrorKind::StoreFailure,
                 QStringLiteral("Could not delete %1 record %2").arg(recordType).arg(recordId));
            return std::nullopt;
        }
        result.recordRemoved = true;
    }

    if (!batch.commit()) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not store cancellation of instance %1").arg(instance->id));
        return std::nullopt;
    }
    changes.commit();
    qCInfo(lcInstances) << "Cancelled occurrence" << instance->occurrenceDate << "of series" << instance->seriesId;
    return result;
}

std::optional<RescheduleResult> InstanceTracker::rescheduleOccurrence(const QString &recordType, qint64 recordId,
                                                                      const data::TimeRange &newRange,
                                                                      const QUuid &actor, ScheduleError *error)
{
    if (!newRange.isValid()) {
        fail(error, ErrorKind::InvalidArgument, QStringLiteral("New time range must end after it starts"));
        return std::nullopt;
    }

    QMutexLocker locker(&m_repository.rowLock());
    const auto record = m_store.findRecord(recordType, recordId);
    if (!record) {
        fail(error, ErrorKind::NotFound, QStringLiteral("%1 record %2 not found").arg(recordType).arg(recordId));
        return std::nullopt;
    }

    RescheduleResult result;
    const auto instance = m_repository.findInstanceByRecord(recordType, recordId);
    QString timeField = m_settings.defaultTimeField;
    if (instance) {
        if (const auto series = m_repository.findSeries(instance->seriesId)) {
            timeField = series->timeField;
        }
    }
    result.priorRange = data::timeRangeField(record->fields, timeField);

    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    QVariantMap update;
    update.insert(timeField, QVariant::fromValue(newRange));
    QVariantMap previous;
    previous.insert(timeField, record->fields.value(timeField));
    if (!changes.push([this, record, update] { return m_store.setFields(record->type, record->id, update); },
                      [this, record, previous] {
                          if (!m_store.setFields(record->type, record->id, previous)) {
                              qCCritical(lcInstances) << "Rollback could not restore record" << record->id;
                          }
                      })) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update %1 record %2").arg(recordType).arg(recordId));
        return std::nullopt;
    }

    if (instance) {
        result.wasMember = true;
        data::Instance rescheduled = *instance;
        if (result.priorRange) {
            rescheduled.rescheduleHistory.push_back(*result.priorRange);
            rescheduled.originalRange = result.priorRange;
        }
        rescheduled.isException = true;
        rescheduled.exceptionType = data::ExceptionType::Rescheduled;
        rescheduled.exceptionAt = now();
        rescheduled.exceptionBy = actor;
        if (!changes.push([this, rescheduled] { return m_repository.updateInstance(rescheduled); },
                          [this, original = *instance] { restoreInstance(m_repository, original); })) {
            fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update instance %1").arg(instance->id));
            return std::nullopt;
        }
        qCInfo(lcInstances) << "Rescheduled occurrence" << instance->occurrenceDate << "of series"
                            << instance->seriesId << "to" << newRange.toString();
    }

    if (!batch.commit()) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not store reschedule of %1 record %2").arg(recordType).arg(recordId));
        return std::nullopt;
    }
    changes.commit();
    return result;
}

Membership InstanceTracker::membership(const QString &recordType, qint64 recordId) const
{
    QMutexLocker locker(&m_repository.rowLock());
    Membership result;
    const auto instance = m_repository.findInstanceByRecord(recordType, recordId);
    if (!instance) {
        return result;
    }
    result.isMember = true;
    result.instanceId = instance->id;
    result.seriesId = instance->seriesId;
    result.occurrenceDate = instance->occurrenceDate;
    result.isException = instance->isException;
    result.exceptionType = instance->exceptionType;

    const auto series = m_repository.findSeries(instance->seriesId);
    if (series) {
        result.seriesTemplate = series->recordTemplate;
        result.groupId = series->groupId;
        if (series->groupId) {
            if (const auto group = m_repository.findGroup(*series->groupId)) {
                result.groupName = group->displayName;
                result.groupColor = group->color;
            }
        }
    }
    return result;
}

void InstanceTracker::handleRecordRemoved(const QString &recordType, qint64 recordId)
{
    QMutexLocker locker(&m_repository.rowLock());
    const auto instance = m_repository.findInstanceByRecord(recordType, recordId);
    if (!instance) {
        return;
    }
    data::Instance orphaned = *instance;
    orphaned.recordId.reset();
    orphaned.isException = true;
    orphaned.exceptionType = data::ExceptionType::Cancelled;
    orphaned.exceptionReason = QStringLiteral("Entity record deleted directly");
    orphaned.exceptionAt = now();
    if (!m_repository.updateInstance(orphaned)) {
        qCCritical(lcInstances) << "Instance" << instance->id << "of series" << instance->seriesId
                                << "is left pointing at deleted" << recordType << "record" << recordId;
        return;
    }
    qCWarning(lcInstances) << recordType << "record" << recordId << "was deleted directly; occurrence"
                           << instance->occurrenceDate << "of series" << instance->seriesId << "marked cancelled";
}

std::vector<data::Instance> InstanceTracker::findDanglingInstances() const
{
    QMutexLocker locker(&m_repository.rowLock());
    std::vector<data::Instance> dangling;
    for (const data::Series &series : m_repository.fetchSeries()) {
        for (const data::Instance &instance : m_repository.fetchInstances(series.id)) {
            if (!instance.recordId || m_store.findRecord(instance.recordType, *instance.recordId)) {
                continue;
            }
            qCCritical(lcInstances) << "Dangling instance" << instance.id << "of series" << series.id
                                    << "references missing" << instance.recordType << "record" << *instance.recordId;
            dangling.push_back(instance);
        }
    }
    return dangling;
}

} // namespace core
} // namespace recurring
