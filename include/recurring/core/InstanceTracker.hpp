#pragma once

#include <functional>
#include <optional>
#include <vector>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <QVariantMap>

#include "recurring/core/EngineSettings.hpp"
#include "recurring/core/ScheduleError.hpp"
#include "recurring/data/Instance.hpp"

namespace recurring {
namespace data {
class EntityStore;
class ScheduleRepository;
}

namespace core {

struct CancelResult
{
    bool wasMember = false;
    bool recordRemoved = false;
    std::optional<qint64> seriesId;
    QDate occurrenceDate;
};

struct RescheduleResult
{
    bool wasMember = false;
    std::optional<data::TimeRange> priorRange;
};

struct Membership
{
    bool isMember = false;
    std::optional<qint64> instanceId;
    std::optional<qint64> seriesId;
    std::optional<qint64> groupId;
    QString groupName;
    QString groupColor;
    QDate occurrenceDate;
    bool isException = false;
    data::ExceptionType exceptionType = data::ExceptionType::None;
    QVariantMap seriesTemplate;
};

// Keeps each Instance consistent with the concrete record it points at.
class InstanceTracker
{
public:
    using Clock = std::function<QDateTime()>;

    InstanceTracker(data::ScheduleRepository &repository, data::EntityStore &store,
                    EngineSettings settings = EngineSettings());
    ~InstanceTracker();

    void setClock(Clock clock);

    // Registers handleRecordRemoved() as a pre-delete hook on the entity store.
    // The hook is removed again when the tracker is destroyed.
    void installOrphanCleanup();

    std::optional<CancelResult> cancelOccurrence(const QString &recordType, qint64 recordId,
                                                 const QString &reason = QString(), const QUuid &actor = QUuid(),
                                                 ScheduleError *error = nullptr);

    std::optional<RescheduleResult> rescheduleOccurrence(const QString &recordType, qint64 recordId,
                                                         const data::TimeRange &newRange,
                                                         const QUuid &actor = QUuid(),
                                                         ScheduleError *error = nullptr);

    Membership membership(const QString &recordType, qint64 recordId) const;

    // Marks the owning Instance cancelled when its record is deleted behind our back.
    void handleRecordRemoved(const QString &recordType, qint64 recordId);

    // Instances whose record no longer exists. Each one is logged as critical.
    std::vector<data::Instance> findDanglingInstances() const;

private:
    QDateTime now() const;

    data::ScheduleRepository &m_repository;
    data::EntityStore &m_store;
    EngineSettings m_settings;
    Clock m_clock;
    int m_cleanupHookId = 0;
};

} // namespace core
} // namespace recurring
