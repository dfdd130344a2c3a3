#include "recurring/data/InMemoryEntityStore.hpp"

#include <algorithm>

namespace recurring {
namespace data {

InMemoryEntityStore::InMemoryEntityStore() = default;
InMemoryEntityStore::~InMemoryEntityStore() = default;

std::optional<EntityRecord> InMemoryEntityStore::findRecord(const QString &type, qint64 id) const
{
    const auto it = m_records.constFind(qMakePair(type, id));
    if (it == m_records.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<qint64> InMemoryEntityStore::createRecord(const QString &type, const QVariantMap &fields,
                                                        QString *errorString)
{
    if (type.isEmpty()) {
        if (errorString) {
            *errorString = QStringLiteral("Record type is empty");
        }
        return std::nullopt;
    }

    for (const Exclusion &exclusion : m_exclusions) {
        if (exclusion.type != type) {
            continue;
        }
        const auto range = timeRangeField(fields, exclusion.timeField);
        if (!range) {
            continue;
        }
        const auto clash = findOverlapping(type, exclusion.scopeField, fields.value(exclusion.scopeField),
                                           exclusion.timeField, *range);
        if (clash) {
            if (errorString) {
                *errorString = QStringLiteral("Overlaps %1 #%2 on %3").arg(type).arg(clash->id).arg(exclusion.scopeField);
            }
            return std::nullopt;
        }
    }

    EntityRecord record;
    record.type = type;
    record.id = m_nextId++;
    record.fields = fields;
    m_records.insert(qMakePair(type, record.id), record);
    return record.id;
}

bool InMemoryEntityStore::setFields(const QString &type, qint64 id, const QVariantMap &fields)
{
    auto it = m_records.find(qMakePair(type, id));
    if (it == m_records.end()) {
        return false;
    }
    for (auto field = fields.constBegin(); field != fields.constEnd(); ++field) {
        it->fields.insert(field.key(), field.value());
    }
    return true;
}

bool InMemoryEntityStore::removeRecord(const QString &type, qint64 id)
{
    const Key key = qMakePair(type, id);
    if (!m_records.contains(key)) {
        return false;
    }
    // Copied so a hook may unregister itself.
    const auto hooks = m_hooks;
    for (const auto &hook : hooks) {
        hook.second(type, id);
    }
    return m_records.remove(key) > 0;
}

bool InMemoryEntityStore::restoreRecord(const EntityRecord &record)
{
    const Key key = qMakePair(record.type, record.id);
    if (record.id <= 0 || m_records.contains(key)) {
        return false;
    }
    m_records.insert(key, record);
    m_nextId = std::max(m_nextId, record.id + 1);
    return true;
}

std::optional<EntityRecord> InMemoryEntityStore::findOverlapping(const QString &type, const QString &scopeField,
                                                                 const QVariant &scopeValue, const QString &timeField,
                                                                 const TimeRange &range) const
{
    std::optional<EntityRecord> found;
    for (const EntityRecord &record : m_records) {
        if (record.type != type) {
            continue;
        }
        if (!scopeField.isEmpty() && record.fields.value(scopeField) != scopeValue) {
            continue;
        }
        const auto existing = timeRangeField(record.fields, timeField);
        if (!existing || !existing->overlaps(range)) {
            continue;
        }
        if (!found || record.id < found->id) {
            found = record;
        }
    }
    return found;
}

int InMemoryEntityStore::addPreDeleteHook(PreDeleteHook hook)
{
    if (!hook) {
        return 0;
    }
    const int hookId = m_nextHookId++;
    m_hooks.push_back(qMakePair(hookId, std::move(hook)));
    return hookId;
}

void InMemoryEntityStore::removePreDeleteHook(int hookId)
{
    m_hooks.erase(std::remove_if(m_hooks.begin(), m_hooks.end(),
                                 [hookId](const QPair<int, PreDeleteHook> &hook) { return hook.first == hookId; }),
                  m_hooks.end());
}

void InMemoryEntityStore::addExclusionConstraint(const QString &type, const QString &scopeField,
                                                 const QString &timeField)
{
    m_exclusions.push_back({type, scopeField, timeField});
}

std::vector<EntityRecord> InMemoryEntityStore::fetchRecords(const QString &type) const
{
    std::vector<EntityRecord> result;
    for (const EntityRecord &record : m_records) {
        if (record.type == type) {
            result.push_back(record);
        }
    }
    std::sort(result.begin(), result.end(), [](const EntityRecord &lhs, const EntityRecord &rhs) {
        return lhs.id < rhs.id;
    });
    return result;
}

int InMemoryEntityStore::count(const QString &type) const
{
    return static_cast<int>(fetchRecords(type).size());
}

} // namespace data
} // namespace recurring
