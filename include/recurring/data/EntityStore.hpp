#pragma once

#include <functional>
#include <optional>

#include <QString>
#include <QVariant>
#include <QVariantMap>

#include "recurring/data/TimeRange.hpp"

namespace recurring {
namespace data {

// A concrete record of some type, addressed by (type, id).
struct EntityRecord
{
    QString type;
    qint64 id = 0;
    QVariantMap fields; // time ranges are stored as QVariant::fromValue<TimeRange>
};

// Generic record store that holds the bookings a series materializes.
class EntityStore
{
public:
    using PreDeleteHook = std::function<void(const QString &type, qint64 id)>;

    virtual ~EntityStore() = default;

    virtual std::optional<EntityRecord> findRecord(const QString &type, qint64 id) const = 0;
    // Returns the new id, or nullopt with a reason when the store refuses the record.
    virtual std::optional<qint64> createRecord(const QString &type, const QVariantMap &fields,
                                               QString *errorString = nullptr) = 0;
    // Overwrites only the given fields.
    virtual bool setFields(const QString &type, qint64 id, const QVariantMap &fields) = 0;
    // Runs every pre-delete hook before the record disappears.
    virtual bool removeRecord(const QString &type, qint64 id) = 0;
    // Puts back a record removed earlier, keeping its id. Hooks are not run.
    virtual bool restoreRecord(const EntityRecord &record) = 0;

    // First record of the given type whose scope field equals scopeValue and
    // whose time field overlaps range.
    virtual std::optional<EntityRecord> findOverlapping(const QString &type, const QString &scopeField,
                                                        const QVariant &scopeValue, const QString &timeField,
                                                        const TimeRange &range) const = 0;

    // Returns a handle for removePreDeleteHook(), or 0 when the hook is empty.
    virtual int addPreDeleteHook(PreDeleteHook hook) = 0;
    virtual void removePreDeleteHook(int hookId) = 0;
};

// Reads a TimeRange out of a record field, accepting both the native value and its text form.
std::optional<TimeRange> timeRangeField(const QVariantMap &fields, const QString &name);

} // namespace data
} // namespace recurring
