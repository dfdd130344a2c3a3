#pragma once

#include <optional>
#include <vector>

#include <QString>
#include <QStringList>
#include <QVariantMap>

#include "recurring/core/ScheduleError.hpp"

namespace recurring {
namespace data {
class FieldMetadataSource;
}

namespace core {

struct DriftIssue
{
    QString field;
    QString issue;
};

// Checks record templates against the editable fields of their record type.
class TemplateValidator
{
public:
    explicit TemplateValidator(const data::FieldMetadataSource &metadata);

    // Editable fields of the record type minus identity and audit columns.
    // nullopt for an unknown record type.
    std::optional<QStringList> allowedFields(const QString &recordType) const;

    // The time field is supplied by expansion and always skipped.
    bool validate(const QString &recordType, const QVariantMap &recordTemplate, const QString &timeField,
                  ScheduleError *error = nullptr) const;

    // Advisory. An unknown record type reports every template field as gone.
    std::vector<DriftIssue> checkSchemaDrift(const QString &recordType, const QVariantMap &recordTemplate,
                                             const QString &timeField) const;

    static const QStringList &deniedFields();

private:
    const data::FieldMetadataSource &m_metadata;
};

} // namespace core
} // namespace recurring
