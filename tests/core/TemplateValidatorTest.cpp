#include <QtTest/QtTest>

#include "recurring/core/TemplateValidator.hpp"
#include "recurring/data/InMemoryFieldMetadata.hpp"

using namespace recurring::core;
using namespace recurring::data;

class TemplateValidatorTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void allowedFieldsDropAuditColumns();
    void acceptsEditableFields();
    void rejectsDisallowedFieldByName();
    void unknownRecordType();
    void timeFieldIsSkipped();
    void reportsSchemaDrift();

private:
    InMemoryFieldMetadata m_metadata;
};

void TemplateValidatorTest::init()
{
    m_metadata.setFields(QStringLiteral("booking"), {{QStringLiteral("id")},
                                                     {QStringLiteral("title"), true, true},
                                                     {QStringLiteral("resource_id"), true, true},
                                                     {QStringLiteral("notes")},
                                                     {QStringLiteral("internal_rank"), false},
                                                     {QStringLiteral("updated_by")}});
}

void TemplateValidatorTest::allowedFieldsDropAuditColumns()
{
    TemplateValidator validator(m_metadata);
    const auto allowed = validator.allowedFields(QStringLiteral("booking"));
    QVERIFY(allowed.has_value());
    QCOMPARE(*allowed, (QStringList{QStringLiteral("title"), QStringLiteral("resource_id"), QStringLiteral("notes")}));
}

void TemplateValidatorTest::acceptsEditableFields()
{
    TemplateValidator validator(m_metadata);
    const QVariantMap recordTemplate = {{QStringLiteral("title"), QStringLiteral("Yoga")},
                                        {QStringLiteral("resource_id"), 3}};
    QVERIFY(validator.validate(QStringLiteral("booking"), recordTemplate, QStringLiteral("time_slot")));
}

void TemplateValidatorTest::rejectsDisallowedFieldByName()
{
    TemplateValidator validator(m_metadata);
    const QVariantMap recordTemplate = {{QStringLiteral("title"), QStringLiteral("Yoga")},
                                        {QStringLiteral("internal_rank"), 1}};
    ScheduleError error;
    QVERIFY(!validator.validate(QStringLiteral("booking"), recordTemplate, QStringLiteral("time_slot"), &error));
    QCOMPARE(error.kind, ErrorKind::DisallowedField);
    QCOMPARE(error.field, QStringLiteral("internal_rank"));
    QVERIFY(error.message.contains(QStringLiteral("\"internal_rank\"")));
    QVERIFY(error.message.contains(QStringLiteral("booking")));
    QVERIFY(error.allowedFields.contains(QStringLiteral("title")));
    QVERIFY(!error.allowedFields.contains(QStringLiteral("internal_rank")));

    error = ScheduleError();
    QVERIFY(!validator.validate(QStringLiteral("booking"), {{QStringLiteral("updated_by"), 1}},
                                QStringLiteral("time_slot"), &error));
    QCOMPARE(error.field, QStringLiteral("updated_by"));
}

void TemplateValidatorTest::unknownRecordType()
{
    TemplateValidator validator(m_metadata);
    ScheduleError error;
    QVERIFY(!validator.validate(QStringLiteral("invoice"), {}, QStringLiteral("time_slot"), &error));
    QCOMPARE(error.kind, ErrorKind::NotFound);
    QVERIFY(!validator.allowedFields(QStringLiteral("invoice")).has_value());
}

void TemplateValidatorTest::timeFieldIsSkipped()
{
    TemplateValidator validator(m_metadata);
    const QVariantMap recordTemplate = {{QStringLiteral("title"), QStringLiteral("Yoga")},
                                        {QStringLiteral("slot"), QStringLiteral("ignored")}};
    QVERIFY(validator.validate(QStringLiteral("booking"), recordTemplate, QStringLiteral("slot")));
}

void TemplateValidatorTest::reportsSchemaDrift()
{
    TemplateValidator validator(m_metadata);
    const QVariantMap recordTemplate = {{QStringLiteral("title"), QStringLiteral("Yoga")},
                                        {QStringLiteral("notes"), QStringLiteral("Bring a mat")}};
    QVERIFY(validator.checkSchemaDrift(QStringLiteral("booking"),
                                       {{QStringLiteral("title"), 1}, {QStringLiteral("resource_id"), 2}},
                                       QStringLiteral("time_slot"))
                .empty());

    m_metadata.removeField(QStringLiteral("booking"), QStringLiteral("notes"));
    const auto issues = validator.checkSchemaDrift(QStringLiteral("booking"), recordTemplate,
                                                   QStringLiteral("time_slot"));
    QCOMPARE(issues.size(), static_cast<std::size_t>(2));

    bool missingRequired = false;
    bool removedField = false;
    for (const DriftIssue &issue : issues) {
        if (issue.field == QLatin1String("resource_id")) {
            missingRequired = issue.issue == QLatin1String("Required field missing from template");
        } else if (issue.field == QLatin1String("notes")) {
            removedField = issue.issue == QLatin1String("Field no longer exists in entity schema");
        }
    }
    QVERIFY(missingRequired);
    QVERIFY(removedField);
}

QTEST_GUILESS_MAIN(TemplateValidatorTest)
#include "TemplateValidatorTest.moc"
