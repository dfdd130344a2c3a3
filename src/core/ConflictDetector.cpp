#include "recurring/core/ConflictDetector.hpp"

#include <algorithm>

#include "recurring/data/EntityStore.hpp"

namespace recurring {
namespace core {

ConflictDetector::ConflictDetector(const data::EntityStore &store)
    : m_store(store)
{
}

std::vector<ConflictPreview> ConflictDetector::previewConflicts(const QString &recordType, const QString &scopeField,
                                                                const QVariant &scopeValue, const QString &timeField,
                                                                const std::vector<data::TimeRange> &ranges) const
{
    std::vector<ConflictPreview> previews;
    previews.reserve(ranges.size());
    int index = 0;
    for (const data::TimeRange &range : ranges) {
        ConflictPreview preview;
        preview.index = index++;
        preview.range = range;
        if (range.isValid()) {
            const auto clash = m_store.findOverlapping(recordType, scopeField, scopeValue, timeField, range);
            if (clash) {
                preview.conflict = true;
                preview.conflictingRecordId = clash->id;
                const QString name = clash->fields.value(QStringLiteral("display_name")).toString();
                preview.conflictingDisplay = name.isEmpty() ? QStringLiteral("#%1").arg(clash->id) : name;
            }
        }
        previews.push_back(preview);
    }
    return previews;
}

bool ConflictDetector::anyConflict(const std::vector<ConflictPreview> &previews)
{
    return std::any_of(previews.begin(), previews.end(), [](const ConflictPreview &preview) {
        return preview.conflict;
    });
}

} // namespace core
} // namespace recurring
