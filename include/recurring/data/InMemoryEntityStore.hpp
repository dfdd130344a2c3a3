#pragma once

#include <vector>

#include <QHash>
#include <QPair>

#include "recurring/data/EntityStore.hpp"

namespace recurring {
namespace data {

class InMemoryEntityStore : public EntityStore
{
public:
    InMemoryEntityStore();
    ~InMemoryEntityStore() override;

    std::optional<EntityRecord> findRecord(const QString &type, qint64 id) const override;
    std::optional<qint64> createRecord(const QString &type, const QVariantMap &fields,
                                       QString *errorString = nullptr) override;
    bool setFields(const QString &type, qint64 id, const QVariantMap &fields) override;
    bool removeRecord(const QString &type, qint64 id) override;
    bool restoreRecord(const EntityRecord &record) override;

    std::optional<EntityRecord> findOverlapping(const QString &type, const QString &scopeField,
                                                const QVariant &scopeValue, const QString &timeField,
                                                const TimeRange &range) const override;

    int addPreDeleteHook(PreDeleteHook hook) override;
    void removePreDeleteHook(int hookId) override;

    // Refuses new records of this type whose time field overlaps another record
    // with the same scope value, like an exclusion constraint would.
    void addExclusionConstraint(const QString &type, const QString &scopeField, const QString &timeField);

    std::vector<EntityRecord> fetchRecords(const QString &type) const;
    int count(const QString &type) const;

private:
    struct Exclusion
    {
        QString type;
        QString scopeField;
        QString timeField;
    };

    using Key = QPair<QString, qint64>;

    QHash<Key, EntityRecord> m_records;
    std::vector<Exclusion> m_exclusions;
    std::vector<QPair<int, PreDeleteHook>> m_hooks;
    qint64 m_nextId = 1;
    int m_nextHookId = 1;
};

} // namespace data
} // namespace recurring
