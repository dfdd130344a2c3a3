#pragma once

#include <QDateTime>
#include <QStringList>
#include <QTimeZone>

#include "recurring/core/EngineSettings.hpp"
#include "recurring/core/ExpansionWorker.hpp"
#include "recurring/core/InstanceTracker.hpp"
#include "recurring/core/SeriesManager.hpp"
#include "recurring/data/InMemoryEntityStore.hpp"
#include "recurring/data/InMemoryFieldMetadata.hpp"
#include "recurring/data/InMemoryJobQueue.hpp"
#include "recurring/data/InMemoryScheduleRepository.hpp"

namespace testing {

inline QDateTime utc(int year, int month, int day, int hour = 0, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

inline recurring::data::TimeRange range(const QDateTime &start, qint64 durationSecs)
{
    return {start, start.addSecs(durationSecs)};
}

// Refuses updates of one chosen instance, to fail an operation part way through.
class RefusingScheduleRepository : public recurring::data::InMemoryScheduleRepository
{
public:
    void refuseInstanceUpdate(qint64 instanceId) { m_refusedInstance = instanceId; }

    bool updateInstance(const recurring::data::Instance &instance) override
    {
        if (instance.id == m_refusedInstance) {
            return false;
        }
        return InMemoryScheduleRepository::updateInstance(instance);
    }

private:
    qint64 m_refusedInstance = 0;
};

// Refuses to delete one chosen record.
class RefusingEntityStore : public recurring::data::InMemoryEntityStore
{
public:
    void refuseRemoval(qint64 recordId) { m_refusedRecord = recordId; }

    bool removeRecord(const QString &type, qint64 id) override
    {
        if (id == m_refusedRecord) {
            return false;
        }
        return InMemoryEntityStore::removeRecord(type, id);
    }

private:
    qint64 m_refusedRecord = 0;
};

// Bookings of a resource, with the usual exclusion constraint on (resource_id, time_slot).
struct ScheduleFixture
{
    ScheduleFixture()
        : manager(repository, store, metadata, jobs, settings)
        , tracker(repository, store, settings)
        , worker(repository, store, metadata, settings)
    {
        metadata.setFields(QStringLiteral("booking"),
                           {{QStringLiteral("id"), false},
                            {QStringLiteral("title"), true, true},
                            {QStringLiteral("resource_id"), true, true},
                            {QStringLiteral("notes")},
                            {QStringLiteral("display_name")},
                            {QStringLiteral("purpose")},
                            {QStringLiteral("time_slot"), true, true},
                            {QStringLiteral("created_by"), false}});
        store.addExclusionConstraint(QStringLiteral("booking"), QStringLiteral("resource_id"),
                                     QStringLiteral("time_slot"));
        manager.setClock([] { return now(); });
        tracker.setClock([] { return now(); });
        worker.setClock([] { return now(); });
        tracker.installOrphanCleanup();
    }

    static QDateTime now() { return utc(2026, 1, 1, 8); }

    // Monday, Wednesday and Friday at 09:00 UTC for one hour, starting Monday 2026-01-05.
    static recurring::core::CreateSeriesRequest weeklyRequest()
    {
        recurring::core::CreateSeriesRequest request;
        request.groupName = QStringLiteral("Team standup");
        request.recordType = QStringLiteral("booking");
        request.recordTemplate = {{QStringLiteral("title"), QStringLiteral("Standup")},
                                  {QStringLiteral("resource_id"), 7}};
        request.rule = QStringLiteral("FREQ=WEEKLY;BYDAY=MO,WE,FR");
        request.anchor = utc(2026, 1, 5, 9);
        request.durationSecs = 3600;
        request.expandNow = false;
        return request;
    }

    // Creates the series and materializes it through the worker up to `until`.
    recurring::core::CreateSeriesResult createExpanded(const recurring::core::CreateSeriesRequest &request,
                                                       const QDate &until)
    {
        const auto created = manager.createSeries(request);
        if (!created) {
            return {};
        }
        if (!manager.expandInstances(created->seriesId, until)) {
            return {};
        }
        worker.drain(jobs);
        return *created;
    }

    // One line per group, series, instance and booking, for comparing whole states.
    QStringList state() const
    {
        using namespace recurring::data;
        QStringList lines;
        for (const SeriesGroup &group : repository.fetchGroups()) {
            lines << QStringLiteral("group %1 %2 %3").arg(group.id).arg(group.displayName, group.color);
        }
        for (const Series &series : repository.fetchSeries()) {
            lines << QStringLiteral("series %1 group %2 v%3 %4..%5 %6 %7 until %8")
                         .arg(series.id)
                         .arg(series.groupId.value_or(0))
                         .arg(series.versionNumber)
                         .arg(series.effectiveFrom.toString(Qt::ISODate), series.effectiveUntil.toString(Qt::ISODate),
                              series.rule, seriesStatusToString(series.status),
                              series.expandedUntil.toString(Qt::ISODate));
            for (const Instance &instance : repository.fetchInstances(series.id)) {
                lines << QStringLiteral("instance %1 of %2 on %3 record %4 %5")
                             .arg(instance.id)
                             .arg(instance.seriesId)
                             .arg(instance.occurrenceDate.toString(Qt::ISODate))
                             .arg(instance.recordId.value_or(0))
                             .arg(exceptionTypeToString(instance.exceptionType));
            }
        }
        for (const EntityRecord &record : store.fetchRecords(QStringLiteral("booking"))) {
            const auto slot = timeRangeField(record.fields, QStringLiteral("time_slot"));
            lines << QStringLiteral("booking %1 %2 %3")
                         .arg(record.id)
                         .arg(record.fields.value(QStringLiteral("title")).toString(),
                              slot ? slot->toString() : QString());
        }
        return lines;
    }

    recurring::core::EngineSettings settings;
    RefusingScheduleRepository repository;
    RefusingEntityStore store;
    recurring::data::InMemoryFieldMetadata metadata;
    recurring::data::InMemoryJobQueue jobs;
    recurring::core::SeriesManager manager;
    recurring::core::InstanceTracker tracker;
    recurring::core::ExpansionWorker worker;
};

} // namespace testing
