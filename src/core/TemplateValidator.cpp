#include "recurring/core/TemplateValidator.hpp"

#include <QSet>

#include "recurring/data/FieldMetadataSource.hpp"

namespace recurring {
namespace core {

TemplateValidator::TemplateValidator(const data::FieldMetadataSource &metadata)
    : m_metadata(metadata)
{
}

const QStringList &TemplateValidator::deniedFields()
{
    static const QStringList denied = {QStringLiteral("id"), QStringLiteral("created_at"),
                                       QStringLiteral("created_by"), QStringLiteral("updated_at"),
                                       QStringLiteral("updated_by")};
    return denied;
}

std::optional<QStringList> TemplateValidator::allowedFields(const QString &recordType) const
{
    const auto fields = m_metadata.fieldsFor(recordType);
    if (!fields) {
        return std::nullopt;
    }
    QStringList allowed;
    for (const data::FieldInfo &info : *fields) {
        if (info.editable && !deniedFields().contains(info.name)) {
            allowed << info.name;
        }
    }
    return allowed;
}

bool TemplateValidator::validate(const QString &recordType, const QVariantMap &recordTemplate,
                                 const QString &timeField, ScheduleError *error) const
{
    const auto allowed = allowedFields(recordType);
    if (!allowed) {
        return fail(error, ErrorKind::NotFound, QStringLiteral("Record type \"%1\" not found").arg(recordType));
    }

    for (auto it = recordTemplate.constBegin(); it != recordTemplate.constEnd(); ++it) {
        const QString &field = it.key();
        if (field == timeField) {
            continue;
        }
        if (!allowed->contains(field)) {
            fail(error, ErrorKind::DisallowedField,
                 QStringLiteral("Template field \"%1\" is not allowed for entity %2. Allowed fields: %3")
                     .arg(field, recordType, allowed->join(QStringLiteral(", "))),
                 field);
            if (error) {
                error->allowedFields = *allowed;
            }
            return false;
        }
    }
    return true;
}

std::vector<DriftIssue> TemplateValidator::checkSchemaDrift(const QString &recordType,
                                                            const QVariantMap &recordTemplate,
                                                            const QString &timeField) const
{
    std::vector<DriftIssue> issues;
    const auto fields = m_metadata.fieldsFor(recordType).value_or(std::vector<data::FieldInfo>());

    QSet<QString> current;
    for (const data::FieldInfo &info : fields) {
        current.insert(info.name);
        if (info.required && info.name != timeField && !deniedFields().contains(info.name)
            && !recordTemplate.contains(info.name)) {
            issues.push_back({info.name, QStringLiteral("Required field missing from template")});
        }
    }
    for (auto it = recordTemplate.constBegin(); it != recordTemplate.constEnd(); ++it) {
        if (it.key() != timeField && !current.contains(it.key())) {
            issues.push_back({it.key(), QStringLiteral("Field no longer exists in entity schema")});
        }
    }
    return issues;
}

} // namespace core
} // namespace recurring
