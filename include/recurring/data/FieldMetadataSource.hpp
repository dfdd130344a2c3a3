#pragma once

#include <optional>
#include <vector>

#include <QString>

namespace recurring {
namespace data {

struct FieldInfo
{
    QString name;
    bool editable = true; // shown on the edit form
    bool required = false;
};

class FieldMetadataSource
{
public:
    virtual ~FieldMetadataSource() = default;

    // nullopt when the record type is unknown.
    virtual std::optional<std::vector<FieldInfo>> fieldsFor(const QString &recordType) const = 0;
};

} // namespace data
} // namespace recurring
