#pragma once

#include <optional>
#include <vector>

#include <QString>
#include <QVariant>

#include "recurring/data/TimeRange.hpp"

namespace recurring {
namespace data {
class EntityStore;
}

namespace core {

struct ConflictPreview
{
    int index = 0; // position in the candidate list, 0-based
    data::TimeRange range;
    bool conflict = false;
    std::optional<qint64> conflictingRecordId;
    QString conflictingDisplay; // display_name of the record, or "#<id>"
};

// Advisory overlap check of candidate ranges against booked records. Never writes.
class ConflictDetector
{
public:
    explicit ConflictDetector(const data::EntityStore &store);

    std::vector<ConflictPreview> previewConflicts(const QString &recordType, const QString &scopeField,
                                                  const QVariant &scopeValue, const QString &timeField,
                                                  const std::vector<data::TimeRange> &ranges) const;

    static bool anyConflict(const std::vector<ConflictPreview> &previews);

private:
    const data::EntityStore &m_store;
};

} // namespace core
} // namespace recurring
