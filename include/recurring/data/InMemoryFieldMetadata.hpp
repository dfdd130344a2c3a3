#pragma once

#include <QHash>

#include "recurring/data/FieldMetadataSource.hpp"

namespace recurring {
namespace data {

class InMemoryFieldMetadata : public FieldMetadataSource
{
public:
    InMemoryFieldMetadata() = default;
    ~InMemoryFieldMetadata() override = default;

    std::optional<std::vector<FieldInfo>> fieldsFor(const QString &recordType) const override;

    void setFields(const QString &recordType, std::vector<FieldInfo> fields);
    void removeField(const QString &recordType, const QString &fieldName);

private:
    QHash<QString, std::vector<FieldInfo>> m_fields;
};

} // namespace data
} // namespace recurring
