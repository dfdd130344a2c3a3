#include "recurring/data/InMemoryFieldMetadata.hpp"

#include <algorithm>

namespace recurring {
namespace data {

std::optional<std::vector<FieldInfo>> InMemoryFieldMetadata::fieldsFor(const QString &recordType) const
{
    const auto it = m_fields.constFind(recordType);
    if (it == m_fields.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

void InMemoryFieldMetadata::setFields(const QString &recordType, std::vector<FieldInfo> fields)
{
    m_fields.insert(recordType, std::move(fields));
}

void InMemoryFieldMetadata::removeField(const QString &recordType, const QString &fieldName)
{
    auto it = m_fields.find(recordType);
    if (it == m_fields.end()) {
        return;
    }
    auto &fields = *it;
    fields.erase(std::remove_if(fields.begin(), fields.end(),
                                [&fieldName](const FieldInfo &info) { return info.name == fieldName; }),
                 fields.end());
}

} // namespace data
} // namespace recurring
