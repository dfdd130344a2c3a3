#include "recurring/data/FileScheduleStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

#include "recurring/core/Logging.hpp"

namespace recurring {
namespace data {

namespace {
constexpr int FORMAT_VERSION = 1;
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

QString idToString(const QUuid &id)
{
    if (id.isNull()) {
        return {};
    }
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseId(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    return QUuid(QStringLiteral("{%1}").arg(value));
}
} // namespace

FileScheduleStorage::FileScheduleStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileScheduleStorage::filePath() const
{
    return m_filePath;
}

ScheduleSnapshot FileScheduleStorage::load() const
{
    ScheduleSnapshot snapshot;

    QFile file(m_filePath);
    if (!file.exists()) {
        return snapshot;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStorage) << "Cannot open schedule file" << m_filePath << file.errorString();
        return snapshot;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcStorage) << "Ignoring malformed schedule file" << m_filePath << parseError.errorString();
        return snapshot;
    }

    const QJsonObject root = document.object();
    const int version = root.value(QStringLiteral("version")).toInt(FORMAT_VERSION);
    if (version > FORMAT_VERSION) {
        qCWarning(lcStorage) << "Schedule file" << m_filePath << "has newer format" << version;
    }

    for (const QJsonValue &value : root.value(QStringLiteral("groups")).toArray()) {
        snapshot.groups.push_back(groupFromJson(value.toObject()));
    }
    for (const QJsonValue &value : root.value(QStringLiteral("series")).toArray()) {
        snapshot.series.push_back(seriesFromJson(value.toObject()));
    }
    for (const QJsonValue &value : root.value(QStringLiteral("instances")).toArray()) {
        snapshot.instances.push_back(instanceFromJson(value.toObject()));
    }
    qCDebug(lcStorage) << "Loaded" << snapshot.groups.size() << "groups," << snapshot.series.size()
                       << "series," << snapshot.instances.size() << "instances from" << m_filePath;
    return snapshot;
}

bool FileScheduleStorage::save(const ScheduleSnapshot &snapshot) const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QJsonArray groups;
    for (const SeriesGroup &group : snapshot.groups) {
        groups.append(groupToJson(group));
    }
    QJsonArray series;
    for (const Series &entry : snapshot.series) {
        series.append(seriesToJson(entry));
    }
    QJsonArray instances;
    for (const Instance &instance : snapshot.instances) {
        instances.append(instanceToJson(instance));
    }

    QJsonObject root;
    root.insert(QStringLiteral("version"), FORMAT_VERSION);
    root.insert(QStringLiteral("groups"), groups);
    root.insert(QStringLiteral("series"), series);
    root.insert(QStringLiteral("instances"), instances);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcStorage) << "Cannot write schedule file" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCWarning(lcStorage) << "Failed to commit schedule file" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

QJsonObject FileScheduleStorage::groupToJson(const SeriesGroup &group)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), group.id);
    object.insert(QStringLiteral("display_name"), group.displayName);
    if (!group.description.isEmpty()) {
        object.insert(QStringLiteral("description"), group.description);
    }
    if (!group.color.isEmpty()) {
        object.insert(QStringLiteral("color"), group.color);
    }
    object.insert(QStringLiteral("created_by"), idToString(group.createdBy));
    object.insert(QStringLiteral("created_at"), formatDateTime(group.createdAt));
    object.insert(QStringLiteral("updated_at"), formatDateTime(group.updatedAt));
    return object;
}

SeriesGroup FileScheduleStorage::groupFromJson(const QJsonObject &object)
{
    SeriesGroup group;
    group.id = object.value(QStringLiteral("id")).toVariant().toLongLong();
    group.displayName = object.value(QStringLiteral("display_name")).toString();
    group.description = object.value(QStringLiteral("description")).toString();
    group.color = object.value(QStringLiteral("color")).toString();
    group.createdBy = parseId(object.value(QStringLiteral("created_by")).toString());
    group.createdAt = parseDateTime(object.value(QStringLiteral("created_at")).toString());
    group.updatedAt = parseDateTime(object.value(QStringLiteral("updated_at")).toString());
    return group;
}

QJsonObject FileScheduleStorage::seriesToJson(const Series &series)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), series.id);
    if (series.groupId) {
        object.insert(QStringLiteral("group_id"), *series.groupId);
    }
    object.insert(QStringLiteral("version_number"), series.versionNumber);
    object.insert(QStringLiteral("effective_from"), formatDate(series.effectiveFrom));
    if (series.effectiveUntil.isValid()) {
        object.insert(QStringLiteral("effective_until"), formatDate(series.effectiveUntil));
    }
    object.insert(QStringLiteral("record_type"), series.recordType);
    object.insert(QStringLiteral("template"), QJsonObject::fromVariantMap(series.recordTemplate));
    object.insert(QStringLiteral("rrule"), series.rule);
    object.insert(QStringLiteral("dtstart"), formatDateTime(series.anchor));
    object.insert(QStringLiteral("duration_secs"), series.durationSecs);
    if (!series.timeZoneId.isEmpty()) {
        object.insert(QStringLiteral("timezone"), QString::fromUtf8(series.timeZoneId));
    }
    object.insert(QStringLiteral("time_field"), series.timeField);
    object.insert(QStringLiteral("status"), seriesStatusToString(series.status));
    if (series.expandedUntil.isValid()) {
        object.insert(QStringLiteral("expanded_until"), formatDate(series.expandedUntil));
    }
    object.insert(QStringLiteral("created_by"), idToString(series.createdBy));
    object.insert(QStringLiteral("created_at"), formatDateTime(series.createdAt));
    if (series.templateUpdatedAt.isValid()) {
        object.insert(QStringLiteral("template_updated_at"), formatDateTime(series.templateUpdatedAt));
        object.insert(QStringLiteral("template_updated_by"), idToString(series.templateUpdatedBy));
    }
    return object;
}

Series FileScheduleStorage::seriesFromJson(const QJsonObject &object)
{
    Series series;
    series.id = object.value(QStringLiteral("id")).toVariant().toLongLong();
    if (object.contains(QStringLiteral("group_id"))) {
        series.groupId = object.value(QStringLiteral("group_id")).toVariant().toLongLong();
    }
    series.versionNumber = object.value(QStringLiteral("version_number")).toInt(1);
    series.effectiveFrom = parseDate(object.value(QStringLiteral("effective_from")).toString());
    series.effectiveUntil = parseDate(object.value(QStringLiteral("effective_until")).toString());
    series.recordType = object.value(QStringLiteral("record_type")).toString();
    series.recordTemplate = object.value(QStringLiteral("template")).toObject().toVariantMap();
    series.rule = object.value(QStringLiteral("rrule")).toString();
    series.anchor = parseDateTime(object.value(QStringLiteral("dtstart")).toString());
    series.durationSecs = object.value(QStringLiteral("duration_secs")).toVariant().toLongLong();
    series.timeZoneId = object.value(QStringLiteral("timezone")).toString().toUtf8();
    series.timeField = object.value(QStringLiteral("time_field")).toString(QStringLiteral("time_slot"));
    series.status = seriesStatusFromString(object.value(QStringLiteral("status")).toString())
                        .value_or(SeriesStatus::Active);
    series.expandedUntil = parseDate(object.value(QStringLiteral("expanded_until")).toString());
    series.createdBy = parseId(object.value(QStringLiteral("created_by")).toString());
    series.createdAt = parseDateTime(object.value(QStringLiteral("created_at")).toString());
    series.templateUpdatedAt = parseDateTime(object.value(QStringLiteral("template_updated_at")).toString());
    series.templateUpdatedBy = parseId(object.value(QStringLiteral("template_updated_by")).toString());
    return series;
}

QJsonObject FileScheduleStorage::instanceToJson(const Instance &instance)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), instance.id);
    object.insert(QStringLiteral("series_id"), instance.seriesId);
    object.insert(QStringLiteral("occurrence_date"), formatDate(instance.occurrenceDate));
    object.insert(QStringLiteral("record_type"), instance.recordType);
    if (instance.recordId) {
        object.insert(QStringLiteral("record_id"), *instance.recordId);
    }
    object.insert(QStringLiteral("is_exception"), instance.isException);
    object.insert(QStringLiteral("exception_type"), exceptionTypeToString(instance.exceptionType));
    if (instance.originalRange) {
        object.insert(QStringLiteral("original_range"), instance.originalRange->toString());
    }
    if (!instance.rescheduleHistory.empty()) {
        QJsonArray history;
        for (const TimeRange &range : instance.rescheduleHistory) {
            history.append(range.toString());
        }
        object.insert(QStringLiteral("reschedule_history"), history);
    }
    if (!instance.exceptionReason.isEmpty()) {
        object.insert(QStringLiteral("exception_reason"), instance.exceptionReason);
    }
    if (instance.exceptionAt.isValid()) {
        object.insert(QStringLiteral("exception_at"), formatDateTime(instance.exceptionAt));
        object.insert(QStringLiteral("exception_by"), idToString(instance.exceptionBy));
    }
    object.insert(QStringLiteral("created_at"), formatDateTime(instance.createdAt));
    return object;
}

Instance FileScheduleStorage::instanceFromJson(const QJsonObject &object)
{
    Instance instance;
    instance.id = object.value(QStringLiteral("id")).toVariant().toLongLong();
    instance.seriesId = object.value(QStringLiteral("series_id")).toVariant().toLongLong();
    instance.occurrenceDate = parseDate(object.value(QStringLiteral("occurrence_date")).toString());
    instance.recordType = object.value(QStringLiteral("record_type")).toString();
    if (object.contains(QStringLiteral("record_id"))) {
        instance.recordId = object.value(QStringLiteral("record_id")).toVariant().toLongLong();
    }
    instance.isException = object.value(QStringLiteral("is_exception")).toBool();
    instance.exceptionType = exceptionTypeFromString(object.value(QStringLiteral("exception_type")).toString())
                                 .value_or(ExceptionType::None);
    if (object.contains(QStringLiteral("original_range"))) {
        const TimeRange range = TimeRange::fromString(object.value(QStringLiteral("original_range")).toString());
        if (range.isValid()) {
            instance.originalRange = range;
        }
    }
    for (const QJsonValue &value : object.value(QStringLiteral("reschedule_history")).toArray()) {
        const TimeRange range = TimeRange::fromString(value.toString());
        if (range.isValid()) {
            instance.rescheduleHistory.push_back(range);
        }
    }
    instance.exceptionReason = object.value(QStringLiteral("exception_reason")).toString();
    instance.exceptionAt = parseDateTime(object.value(QStringLiteral("exception_at")).toString());
    instance.exceptionBy = parseId(object.value(QStringLiteral("exception_by")).toString());
    instance.createdAt = parseDateTime(object.value(QStringLiteral("created_at")).toString());
    return instance;
}

QString FileScheduleStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(Qt::ISODate);
}

QDateTime FileScheduleStorage::parseDateTime(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODate);
    if (dt.isValid() && dt.timeSpec() != Qt::UTC) {
        dt = dt.toUTC();
    }
    return dt;
}

QString FileScheduleStorage::formatDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(DATE_FORMAT));
}

QDate FileScheduleStorage::parseDate(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    return QDate::fromString(value, QLatin1String(DATE_FORMAT));
}

} // namespace data
} // namespace recurring
