#pragma once

#include <functional>
#include <optional>

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <QVariantMap>

#include "recurring/core/EngineSettings.hpp"
#include "recurring/core/ScheduleError.hpp"
#include "recurring/core/TemplateValidator.hpp"
#include "recurring/data/Series.hpp"

namespace recurring {
namespace data {
class EntityStore;
class ExpansionJobSink;
class FieldMetadataSource;
class ScheduleRepository;
struct SeriesGroup;
}

namespace core {

class ChangeSet;

struct CreateSeriesRequest
{
    QString groupName;
    QString description;
    QString color;
    QString recordType;
    QVariantMap recordTemplate;
    QString rule;
    QDateTime anchor;
    qint64 durationSecs = 0;
    QByteArray timeZoneId;
    QString timeField; // empty selects the configured default
    bool expandNow = true;
    QUuid createdBy;
};

struct CreateSeriesResult
{
    qint64 groupId = 0;
    qint64 seriesId = 0;
};

struct SplitSeriesRequest
{
    qint64 seriesId = 0;
    QDate splitDate;
    QDateTime newAnchor;
    std::optional<qint64> newDurationSecs;
    QVariantMap templateDelta;
    QUuid actor;
};

struct SplitSeriesResult
{
    qint64 oldSeriesId = 0;
    qint64 newSeriesId = 0;
    qint64 groupId = 0;
};

struct ScheduleUpdateResult
{
    int entitiesDeleted = 0;
    QDateTime expandUntil;
};

// Owns the lifecycle of groups and series versions.
//
// Every mutating call runs under the repository row lock and inside a
// ChangeSet, so a failure at any step leaves the repository and the entity
// store exactly as they were.
class SeriesManager
{
public:
    using Clock = std::function<QDateTime()>;

    SeriesManager(data::ScheduleRepository &repository, data::EntityStore &store,
                  const data::FieldMetadataSource &metadata, data::ExpansionJobSink &jobs,
                  EngineSettings settings = EngineSettings());
    ~SeriesManager();

    void setClock(Clock clock);
    const EngineSettings &settings() const;
    const TemplateValidator &templateValidator() const;

    std::optional<CreateSeriesResult> createSeries(const CreateSeriesRequest &request, ScheduleError *error = nullptr);

    // Raises the high-water mark to the end of `until` and queues the work.
    bool expandInstances(qint64 seriesId, const QDate &until, ScheduleError *error = nullptr);

    // "Edit this and future".
    std::optional<SplitSeriesResult> splitSeries(const SplitSeriesRequest &request, ScheduleError *error = nullptr);

    // "Edit all". Returns the number of records that received the new fields.
    std::optional<int> updateTemplate(qint64 seriesId, const QVariantMap &templateDelta, bool skipExceptions = true,
                                      const QUuid &actor = QUuid(), ScheduleError *error = nullptr);

    // Replaces anchor, duration and rule. Drops every non-exception occurrence.
    std::optional<ScheduleUpdateResult> updateSchedule(qint64 seriesId, const QDateTime &newAnchor,
                                                       qint64 newDurationSecs, const QString &newRule,
                                                       ScheduleError *error = nullptr);

    // Both return the number of records deleted.
    std::optional<int> deleteSeries(qint64 seriesId, ScheduleError *error = nullptr);
    std::optional<int> deleteGroup(qint64 groupId, ScheduleError *error = nullptr);

    // A blank name keeps the current one. Description and color are replaced.
    bool updateGroupInfo(qint64 groupId, const QString &displayName, const QString &description,
                         const QString &color, ScheduleError *error = nullptr);

    bool setSeriesStatus(qint64 seriesId, data::SeriesStatus status, ScheduleError *error = nullptr);

    static bool isValidColor(const QString &color);

private:
    bool removeSeriesSteps(const data::Series &series, ChangeSet &changes, int *recordsDeleted,
                           ScheduleError *error);
    QString standaloneGroupName(const QVariantMap &recordTemplate) const;
    QDateTime now() const;

    data::ScheduleRepository &m_repository;
    data::EntityStore &m_store;
    data::ExpansionJobSink &m_jobs;
    TemplateValidator m_templates;
    EngineSettings m_settings;
    Clock m_clock;
};

} // namespace core
} // namespace recurring
