#include "recurring/core/SeriesManager.hpp"

#include <algorithm>

#include <QMutexLocker>
#include <QRegularExpression>
#include <QTimeZone>

#include "recurring/core/ChangeSet.hpp"
#include "recurring/core/Logging.hpp"
#include "recurring/core/RecurrenceExpander.hpp"
#include "recurring/core/RecurrenceRule.hpp"
#include "recurring/data/EntityStore.hpp"
#include "recurring/data/ExpansionJobSink.hpp"
#include "recurring/data/ScheduleRepository.hpp"

namespace recurring {
namespace core {

namespace {
void restoreSeries(data::ScheduleRepository &repository, const data::Series &series)
{
    if (!repository.updateSeries(series)) {
        qCCritical(lcSeries) << "Rollback could not restore series" << series.id;
    }
}

void restoreInstance(data::ScheduleRepository &repository, const data::Instance &instance)
{
    if (!repository.updateInstance(instance)) {
        qCCritical(lcSeries) << "Rollback could not restore instance" << instance.id;
    }
}

void reinsertInstance(data::ScheduleRepository &repository, const data::Instance &instance)
{
    if (!repository.addInstance(instance)) {
        qCCritical(lcSeries) << "Rollback could not re-insert instance" << instance.id;
    }
}

void dropGroup(data::ScheduleRepository &repository, qint64 id)
{
    if (!repository.removeGroup(id)) {
        qCCritical(lcSeries) << "Rollback could not remove group" << id;
    }
}

void dropSeries(data::ScheduleRepository &repository, qint64 id, const data::SeriesDeletionKey &key)
{
    if (!repository.removeSeries(id, key)) {
        qCCritical(lcSeries) << "Rollback could not remove series" << id;
    }
}

void restoreRecord(data::EntityStore &store, const data::EntityRecord &record)
{
    if (!store.restoreRecord(record)) {
        qCCritical(lcSeries) << "Rollback could not restore" << record.type << "record" << record.id;
    }
}

// Writes the batch before keeping the in-memory changes, so nothing is kept that was not stored.
bool commitChanges(data::ScheduleBatch &batch, ChangeSet &changes, ScheduleError *error)
{
    if (!batch.commit()) {
        return fail(error, ErrorKind::StoreFailure, QStringLiteral("Schedule changes could not be stored"));
    }
    changes.commit();
    return true;
}

QDate localDate(const QDateTime &dt, const QByteArray &timeZoneId)
{
    return dt.toTimeZone(RecurrenceExpander::resolveTimeZone(timeZoneId)).date();
}

// Removes the instance row before the record so the pre-delete hook finds nothing to cancel.
bool removeOccurrence(data::ScheduleRepository &repository, data::EntityStore &store, const data::Instance &instance,
                      ChangeSet &changes, int *recordsDeleted, ScheduleError *error)
{
    if (!changes.push([&repository, id = instance.id] { return repository.removeInstance(id); },
                      [&repository, instance] { reinsertInstance(repository, instance); })) {
        return fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not remove instance %1").arg(instance.id));
    }
    if (!instance.recordId) {
        return true;
    }
    const auto record = store.findRecord(instance.recordType, *instance.recordId);
    if (!record) {
        qCWarning(lcSeries) << "Instance" << instance.id << "points at missing" << instance.recordType << "record"
                            << *instance.recordId;
        return true;
    }
    if (!changes.push([&store, record] { return store.removeRecord(record->type, record->id); },
                      [&store, record] { restoreRecord(store, *record); })) {
        return fail(error, ErrorKind::StoreFailure,
                    QStringLiteral("Could not delete %1 record %2").arg(record->type).arg(record->id));
    }
    if (recordsDeleted) {
        ++*recordsDeleted;
    }
    return true;
}
} // namespace

SeriesManager::SeriesManager(data::ScheduleRepository &repository, data::EntityStore &store,
                             const data::FieldMetadataSource &metadata, data::ExpansionJobSink &jobs,
                             EngineSettings settings)
    : m_repository(repository)
    , m_store(store)
    , m_jobs(jobs)
    , m_templates(metadata)
    , m_settings(std::move(settings))
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
}

SeriesManager::~SeriesManager() = default;

void SeriesManager::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

const EngineSettings &SeriesManager::settings() const
{
    return m_settings;
}

const TemplateValidator &SeriesManager::templateValidator() const
{
    return m_templates;
}

bool SeriesManager::isValidColor(const QString &color)
{
    static const QRegularExpression pattern(QStringLiteral("^#[0-9A-Fa-f]{6}$"));
    return pattern.match(color).hasMatch();
}

QDateTime SeriesManager::now() const
{
    return m_clock();
}

QString SeriesManager::standaloneGroupName(const QVariantMap &recordTemplate) const
{
    if (!m_settings.standaloneNameField.isEmpty()) {
        const QString name = recordTemplate.value(m_settings.standaloneNameField).toString().trimmed();
        if (!name.isEmpty()) {
            return name;
        }
    }
    return m_settings.standaloneGroupName;
}

std::optional<CreateSeriesResult> SeriesManager::createSeries(const CreateSeriesRequest &request,
                                                              ScheduleError *error)
{
    if (request.recordType.trimmed().isEmpty()) {
        fail(error, ErrorKind::MissingField, QStringLiteral("Record type is required"), QStringLiteral("record_type"));
        return std::nullopt;
    }
    if (request.rule.trimmed().isEmpty()) {
        fail(error, ErrorKind::MissingField, QStringLiteral("Recurrence rule is required"), QStringLiteral("rule"));
        return std::nullopt;
    }
    if (!request.anchor.isValid()) {
        fail(error, ErrorKind::MissingField, QStringLiteral("Anchor start is required"), QStringLiteral("anchor"));
        return std::nullopt;
    }
    if (request.durationSecs == 0) {
        fail(error, ErrorKind::MissingField, QStringLiteral("Duration is required"), QStringLiteral("duration"));
        return std::nullopt;
    }
    if (request.durationSecs < 0) {
        fail(error, ErrorKind::InvalidArgument, QStringLiteral("Duration must be positive"), QStringLiteral("duration"));
        return std::nullopt;
    }
    if (!validateRecurrenceRule(request.rule, error)) {
        return std::nullopt;
    }
    if (!request.color.isEmpty() && !isValidColor(request.color)) {
        fail(error, ErrorKind::InvalidArgument, QStringLiteral("Color must be formatted as #RRGGBB"),
             QStringLiteral("color"));
        return std::nullopt;
    }
    const QString timeField = request.timeField.isEmpty() ? m_settings.defaultTimeField : request.timeField;
    if (!m_templates.validate(request.recordType, request.recordTemplate, timeField, error)) {
        return std::nullopt;
    }

    const QDateTime createdAt = now();

    data::SeriesGroup group;
    group.displayName = request.groupName.trimmed();
    if (group.displayName.isEmpty()) {
        group.displayName = standaloneGroupName(request.recordTemplate);
    }
    group.description = request.description;
    group.color = request.color;
    group.createdBy = request.createdBy;
    group.createdAt = createdAt;
    group.updatedAt = createdAt;

    QMutexLocker locker(&m_repository.rowLock());
    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;

    const auto storedGroup = m_repository.addGroup(group);
    if (!storedGroup) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not create series group"));
        return std::nullopt;
    }
    changes.addRevert([this, id = storedGroup->id] { dropGroup(m_repository, id); });

    data::Series series;
    series.groupId = storedGroup->id;
    series.versionNumber = 1;
    series.effectiveFrom = localDate(request.anchor, request.timeZoneId);
    series.recordType = request.recordType;
    series.recordTemplate = request.recordTemplate;
    series.rule = request.rule.trimmed();
    series.anchor = request.anchor.toUTC();
    series.durationSecs = request.durationSecs;
    series.timeZoneId = request.timeZoneId;
    series.timeField = timeField;
    series.status = data::SeriesStatus::Active;
    series.createdBy = request.createdBy;
    series.createdAt = createdAt;

    const auto storedSeries = m_repository.addSeries(series);
    if (!storedSeries) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not create series"));
        return std::nullopt;
    }
    const data::SeriesDeletionKey key;
    changes.addRevert([this, key, id = storedSeries->id] { dropSeries(m_repository, id, key); });

    if (request.expandNow) {
        const data::ExpansionJob job{storedSeries->id, createdAt.addDays(m_settings.horizonDays)};
        if (!m_jobs.enqueue(job)) {
            fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not queue expansion for new series"));
            return std::nullopt;
        }
    }

    if (!commitChanges(batch, changes, error)) {
        return std::nullopt;
    }
    qCInfo(lcSeries) << "Created series" << storedSeries->id << "in group" << storedGroup->id << "with rule"
                     << storedSeries->rule;
    return CreateSeriesResult{storedGroup->id, storedSeries->id};
}

bool SeriesManager::expandInstances(qint64 seriesId, const QDate &until, ScheduleError *error)
{
    if (!until.isValid()) {
        return fail(error, ErrorKind::InvalidArgument, QStringLiteral("Expansion date is not valid"));
    }

    QMutexLocker locker(&m_repository.rowLock());
    const auto series = m_repository.findSeries(seriesId);
    if (!series) {
        return fail(error, ErrorKind::NotFound, QStringLiteral("Series %1 not found").arg(seriesId));
    }

    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    if (!series->expandedUntil.isValid() || series->expandedUntil < until) {
        data::Series raised = *series;
        raised.expandedUntil = until;
        if (!changes.push([this, raised] { return m_repository.updateSeries(raised); },
                          [this, original = *series] { restoreSeries(m_repository, original); })) {
            return fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update series %1").arg(seriesId));
        }
    }

    const QTimeZone zone = RecurrenceExpander::resolveTimeZone(series->timeZoneId);
    const data::ExpansionJob job{seriesId, QDateTime(until, QTime(23, 59, 59), zone).toUTC()};
    if (!m_jobs.enqueue(job)) {
        return fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not queue expansion for series %1").arg(seriesId));
    }
    if (!commitChanges(batch, changes, error)) {
        return false;
    }
    qCDebug(lcSeries) << "Queued expansion of series" << seriesId << "until" << until;
    return true;
}

std::optional<SplitSeriesResult> SeriesManager::splitSeries(const SplitSeriesRequest &request, ScheduleError *error)
{
    if (!request.newAnchor.isValid()) {
        fail(error, ErrorKind::MissingField, QStringLiteral("New anchor start is required"), QStringLiteral("anchor"));
        return std::nullopt;
    }
    if (request.newDurationSecs && *request.newDurationSecs <= 0) {
        fail(error, ErrorKind::InvalidArgument, QStringLiteral("Duration must be positive"), QStringLiteral("duration"));
        return std::nullopt;
    }

    QMutexLocker locker(&m_repository.rowLock());
    const auto found = m_repository.findSeries(request.seriesId);
    if (!found) {
        fail(error, ErrorKind::NotFound, QStringLiteral("Series %1 not found").arg(request.seriesId));
        return std::nullopt;
    }
    const data::Series original = *found;
    if (!original.isCurrent()) {
        fail(error, ErrorKind::InvalidArgument,
             QStringLiteral("Series %1 was already closed on %2").arg(original.id).arg(original.effectiveUntil.toString(Qt::ISODate)));
        return std::nullopt;
    }
    if (!request.splitDate.isValid() || request.splitDate <= original.effectiveFrom) {
        fail(error, ErrorKind::InvalidArgument,
             QStringLiteral("Split date must be after %1").arg(original.effectiveFrom.toString(Qt::ISODate)),
             QStringLiteral("split_date"));
        return std::nullopt;
    }

    QVariantMap merged = original.recordTemplate;
    for (auto it = request.templateDelta.constBegin(); it != request.templateDelta.constEnd(); ++it) {
        merged.insert(it.key(), it.value());
    }
    if (!m_templates.validate(original.recordType, merged, original.timeField, error)) {
        return std::nullopt;
    }

    const QDateTime stamp = now();
    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    data::Series current = original;

    // A standalone series gets a group first so both versions share one identity.
    if (!current.groupId) {
        data::SeriesGroup group;
        group.displayName = standaloneGroupName(original.recordTemplate);
        group.createdBy = request.actor;
        group.createdAt = stamp;
        group.updatedAt = stamp;
        const auto storedGroup = m_repository.addGroup(group);
        if (!storedGroup) {
            fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not create a group for series %1").arg(original.id));
            return std::nullopt;
        }
        changes.addRevert([this, id = storedGroup->id] { dropGroup(m_repository, id); });
        current.groupId = storedGroup->id;
    }
    const qint64 groupId = *current.groupId;

    int nextVersion = 1;
    for (const data::Series &version : m_repository.fetchSeriesForGroup(groupId)) {
        nextVersion = std::max(nextVersion, version.versionNumber + 1);
    }
    nextVersion = std::max(nextVersion, original.versionNumber + 1);

    const QDate lastDay = request.splitDate.addDays(-1);
    const QTimeZone zone = RecurrenceExpander::resolveTimeZone(original.timeZoneId);
    current.effectiveUntil = lastDay;
    current.rule = withUntil(original.rule, QDateTime(lastDay, QTime(23, 59, 59), zone).toUTC());
    if (!changes.push([this, current] { return m_repository.updateSeries(current); },
                      [this, original] { restoreSeries(m_repository, original); })) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not close series %1").arg(original.id));
        return std::nullopt;
    }

    data::Series next;
    next.groupId = groupId;
    next.versionNumber = nextVersion;
    next.effectiveFrom = request.splitDate;
    next.recordType = original.recordType;
    next.recordTemplate = merged;
    next.rule = original.rule;
    next.anchor = request.newAnchor.toUTC();
    next.durationSecs = request.newDurationSecs.value_or(original.durationSecs);
    next.timeZoneId = original.timeZoneId;
    next.timeField = original.timeField;
    next.status = data::SeriesStatus::Active;
    next.expandedUntil = original.expandedUntil;
    next.createdBy = request.actor;
    next.createdAt = stamp;

    const auto storedNext = m_repository.addSeries(next);
    if (!storedNext) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not create version %1").arg(nextVersion));
        return std::nullopt;
    }
    const data::SeriesDeletionKey key;
    changes.addRevert([this, key, id = storedNext->id] { dropSeries(m_repository, id, key); });

    int moved = 0;
    for (const data::Instance &instance : m_repository.fetchInstances(original.id)) {
        if (instance.occurrenceDate < request.splitDate) {
            continue;
        }
        data::Instance repointed = instance;
        repointed.seriesId = storedNext->id;
        if (!changes.push([this, repointed] { return m_repository.updateInstance(repointed); },
                          [this, instance] { restoreInstance(m_repository, instance); })) {
            fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not move instance %1").arg(instance.id));
            return std::nullopt;
        }
        ++moved;
    }

    if (!commitChanges(batch, changes, error)) {
        return std::nullopt;
    }
    qCInfo(lcSeries) << "Split series" << original.id << "at" << request.splitDate << "into version" << nextVersion
                     << "(series" << storedNext->id << ")," << moved << "instances moved";
    return SplitSeriesResult{original.id, storedNext->id, groupId};
}

std::optional<int> SeriesManager::updateTemplate(qint64 seriesId, const QVariantMap &templateDelta, bool skipExceptions,
                                                 const QUuid &actor, ScheduleError *error)
{
    QMutexLocker locker(&m_repository.rowLock());
    const auto found = m_repository.findSeries(seriesId);
    if (!found) {
        fail(error, ErrorKind::NotFound, QStringLiteral("Series %1 not found").arg(seriesId));
        return std::nullopt;
    }
    const data::Series original = *found;

    QVariantMap merged = original.recordTemplate;
    for (auto it = templateDelta.constBegin(); it != templateDelta.constEnd(); ++it) {
        merged.insert(it.key(), it.value());
    }
    if (!m_templates.validate(original.recordType, merged, original.timeField, error)) {
        return std::nullopt;
    }

    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    data::Series updated = original;
    updated.recordTemplate = merged;
    updated.templateUpdatedAt = now();
    updated.templateUpdatedBy = actor;
    if (!changes.push([this, updated] { return m_repository.updateSeries(updated); },
                      [this, original] { restoreSeries(m_repository, original); })) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update series %1").arg(seriesId));
        return std::nullopt;
    }

    QVariantMap fields = merged;
    fields.remove(original.timeField);

    int updatedRecords = 0;
    if (!fields.isEmpty()) {
        for (const data::Instance &instance : m_repository.fetchInstances(seriesId)) {
            if (!instance.recordId || (skipExceptions && instance.isException)) {
                continue;
            }
            const auto record = m_store.findRecord(instance.recordType, *instance.recordId);
            if (!record) {
                qCWarning(lcSeries) << "Skipping missing" << instance.recordType << "record" << *instance.recordId;
                continue;
            }
            QVariantMap previous;
            for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
                previous.insert(it.key(), record->fields.value(it.key()));
            }
            if (!changes.push([this, record, fields] { return m_store.setFields(record->type, record->id, fields); },
                              [this, record, previous] {
                                  if (!m_store.setFields(record->type, record->id, previous)) {
                                      qCCritical(lcSeries) << "Rollback could not restore fields of record" << record->id;
                                  }
                              })) {
                fail(error, ErrorKind::StoreFailure,
                     QStringLiteral("Could not update %1 record %2").arg(record->type).arg(record->id));
                return std::nullopt;
            }
            ++updatedRecords;
        }
    }

    if (!commitChanges(batch, changes, error)) {
        return std::nullopt;
    }
    qCInfo(lcSeries) << "Updated template of series" << seriesId << "and" << updatedRecords << "records";
    return updatedRecords;
}

std::optional<ScheduleUpdateResult> SeriesManager::updateSchedule(qint64 seriesId, const QDateTime &newAnchor,
                                                                  qint64 newDurationSecs, const QString &newRule,
                                                                  ScheduleError *error)
{
    if (!newAnchor.isValid()) {
        fail(error, ErrorKind::MissingField, QStringLiteral("Anchor start is required"), QStringLiteral("anchor"));
        return std::nullopt;
    }
    if (newDurationSecs <= 0) {
        fail(error, ErrorKind::InvalidArgument, QStringLiteral("Duration must be positive"), QStringLiteral("duration"));
        return std::nullopt;
    }
    if (!validateRecurrenceRule(newRule, error)) {
        return std::nullopt;
    }

    QMutexLocker locker(&m_repository.rowLock());
    const auto found = m_repository.findSeries(seriesId);
    if (!found) {
        fail(error, ErrorKind::NotFound, QStringLiteral("Series %1 not found").arg(seriesId));
        return std::nullopt;
    }
    const data::Series original = *found;

    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    ScheduleUpdateResult result;
    for (const data::Instance &instance : m_repository.fetchInstances(seriesId)) {
        if (instance.isException) {
            continue;
        }
        if (!removeOccurrence(m_repository, m_store, instance, changes, &result.entitiesDeleted, error)) {
            return std::nullopt;
        }
    }

    data::Series updated = original;
    updated.anchor = newAnchor.toUTC();
    updated.durationSecs = newDurationSecs;
    updated.rule = newRule.trimmed();
    updated.expandedUntil = QDate();
    updated.effectiveFrom = localDate(newAnchor, original.timeZoneId);
    if (!changes.push([this, updated] { return m_repository.updateSeries(updated); },
                      [this, original] { restoreSeries(m_repository, original); })) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update series %1").arg(seriesId));
        return std::nullopt;
    }

    result.expandUntil = now().addDays(m_settings.horizonDays);
    if (!m_jobs.enqueue({seriesId, result.expandUntil})) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not queue expansion for series %1").arg(seriesId));
        return std::nullopt;
    }

    if (!commitChanges(batch, changes, error)) {
        return std::nullopt;
    }
    qCInfo(lcSeries) << "Replaced schedule of series" << seriesId << "-" << result.entitiesDeleted << "records deleted";
    return result;
}

bool SeriesManager::removeSeriesSteps(const data::Series &series, ChangeSet &changes, int *recordsDeleted,
                                      ScheduleError *error)
{
    for (const data::Instance &instance : m_repository.fetchInstances(series.id)) {
        if (!removeOccurrence(m_repository, m_store, instance, changes, recordsDeleted, error)) {
            return false;
        }
    }
    const data::SeriesDeletionKey key;
    if (!changes.push([this, key, id = series.id] { return m_repository.removeSeries(id, key); },
                      [this, series] {
                          if (!m_repository.addSeries(series)) {
                              qCCritical(lcSeries) << "Rollback could not re-insert series" << series.id;
                          }
                      })) {
        return fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not delete series %1").arg(series.id));
    }
    return true;
}

std::optional<int> SeriesManager::deleteSeries(qint64 seriesId, ScheduleError *error)
{
    QMutexLocker locker(&m_repository.rowLock());
    const auto series = m_repository.findSeries(seriesId);
    if (!series) {
        fail(error, ErrorKind::NotFound, QStringLiteral("Series %1 not found").arg(seriesId));
        return std::nullopt;
    }

    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    int recordsDeleted = 0;
    if (!removeSeriesSteps(*series, changes, &recordsDeleted, error)) {
        return std::nullopt;
    }

    if (series->groupId && m_repository.fetchSeriesForGroup(*series->groupId).empty()) {
        const auto group = m_repository.findGroup(*series->groupId);
        if (group && !changes.push([this, id = group->id] { return m_repository.removeGroup(id); },
                                   [this, group] {
                                       if (!m_repository.addGroup(*group)) {
                                           qCCritical(lcSeries) << "Rollback could not re-insert group" << group->id;
                                       }
                                   })) {
            fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not delete group %1").arg(group->id));
            return std::nullopt;
        }
    }

    if (!commitChanges(batch, changes, error)) {
        return std::nullopt;
    }
    qCInfo(lcSeries) << "Deleted series" << seriesId << "and" << recordsDeleted << "records";
    return recordsDeleted;
}

std::optional<int> SeriesManager::deleteGroup(qint64 groupId, ScheduleError *error)
{
    QMutexLocker locker(&m_repository.rowLock());
    const auto group = m_repository.findGroup(groupId);
    if (!group) {
        fail(error, ErrorKind::NotFound, QStringLiteral("Group %1 not found").arg(groupId));
        return std::nullopt;
    }

    data::ScheduleBatch batch(m_repository);
    ChangeSet changes;
    int recordsDeleted = 0;
    for (const data::Series &series : m_repository.fetchSeriesForGroup(groupId)) {
        if (!removeSeriesSteps(series, changes, &recordsDeleted, error)) {
            return std::nullopt;
        }
    }
    if (!changes.push([this, groupId] { return m_repository.removeGroup(groupId); },
                      [this, group] {
                          if (!m_repository.addGroup(*group)) {
                              qCCritical(lcSeries) << "Rollback could not re-insert group" << group->id;
                          }
                      })) {
        fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not delete group %1").arg(groupId));
        return std::nullopt;
    }

    if (!commitChanges(batch, changes, error)) {
        return std::nullopt;
    }
    qCInfo(lcSeries) << "Deleted group" << groupId << "and" << recordsDeleted << "records";
    return recordsDeleted;
}

bool SeriesManager::updateGroupInfo(qint64 groupId, const QString &displayName, const QString &description,
                                    const QString &color, ScheduleError *error)
{
    if (!color.isEmpty() && !isValidColor(color)) {
        return fail(error, ErrorKind::InvalidArgument, QStringLiteral("Color must be formatted as #RRGGBB"),
                    QStringLiteral("color"));
    }

    QMutexLocker locker(&m_repository.rowLock());
    auto group = m_repository.findGroup(groupId);
    if (!group) {
        return fail(error, ErrorKind::NotFound, QStringLiteral("Group %1 not found").arg(groupId));
    }
    const QString name = displayName.trimmed();
    if (!name.isEmpty()) {
        group->displayName = name;
    }
    group->description = description;
    group->color = color;
    group->updatedAt = now();
    if (!m_repository.updateGroup(*group)) {
        return fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update group %1").arg(groupId));
    }
    return true;
}

bool SeriesManager::setSeriesStatus(qint64 seriesId, data::SeriesStatus status, ScheduleError *error)
{
    QMutexLocker locker(&m_repository.rowLock());
    auto series = m_repository.findSeries(seriesId);
    if (!series) {
        return fail(error, ErrorKind::NotFound, QStringLiteral("Series %1 not found").arg(seriesId));
    }
    if (series->status == status) {
        return true;
    }
    const data::SeriesStatus previous = series->status;
    series->status = status;
    if (!m_repository.updateSeries(*series)) {
        return fail(error, ErrorKind::StoreFailure, QStringLiteral("Could not update series %1").arg(seriesId));
    }
    qCInfo(lcSeries) << "Series" << seriesId << "status" << data::seriesStatusToString(previous) << "->"
                     << data::seriesStatusToString(status);
    return true;
}

} // namespace core
} // namespace recurring
