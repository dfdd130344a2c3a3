#include "recurring/data/EntityStore.hpp"

namespace recurring {
namespace data {

std::optional<TimeRange> timeRangeField(const QVariantMap &fields, const QString &name)
{
    const auto it = fields.constFind(name);
    if (it == fields.constEnd()) {
        return std::nullopt;
    }
    TimeRange range;
    if (it->userType() == qMetaTypeId<TimeRange>()) {
        range = it->value<TimeRange>();
    } else {
        range = TimeRange::fromString(it->toString());
    }
    if (!range.isValid()) {
        return std::nullopt;
    }
    return range;
}

} // namespace data
} // namespace recurring
