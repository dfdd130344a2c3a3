#include <QtTest/QtTest>

#include "recurring/data/InMemoryEntityStore.hpp"
#include "recurring/data/InMemoryFieldMetadata.hpp"
#include "recurring/data/InMemoryJobQueue.hpp"

using namespace recurring::data;

namespace {

TimeRange slot(int hour, int hours = 1)
{
    const QDateTime start(QDate(2026, 1, 5), QTime(hour, 0), Qt::UTC);
    return {start, start.addSecs(hours * 3600)};
}

QVariantMap booking(int resource, const TimeRange &range)
{
    return {{QStringLiteral("resource_id"), resource}, {QStringLiteral("time_slot"), QVariant::fromValue(range)}};
}

} // namespace

class EntityStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void createFindAndUpdate();
    void exclusionConstraintRefusesOverlap();
    void removeRunsHooksFirst();
    void restoreKeepsId();
    void removedHookIsNotCalled();
    void fieldMetadata();
    void jobQueue();
};

void EntityStoreTest::createFindAndUpdate()
{
    InMemoryEntityStore store;
    const auto id = store.createRecord(QStringLiteral("booking"), booking(7, slot(9)));
    QVERIFY(id.has_value());

    const auto record = store.findRecord(QStringLiteral("booking"), *id);
    QVERIFY(record.has_value());
    QCOMPARE(*timeRangeField(record->fields, QStringLiteral("time_slot")), slot(9));
    QVERIFY(!store.findRecord(QStringLiteral("room"), *id).has_value());

    QVERIFY(store.setFields(QStringLiteral("booking"), *id, {{QStringLiteral("title"), QStringLiteral("Yoga")}}));
    const auto updated = store.findRecord(QStringLiteral("booking"), *id);
    QCOMPARE(updated->fields.value(QStringLiteral("title")).toString(), QStringLiteral("Yoga"));
    QCOMPARE(updated->fields.value(QStringLiteral("resource_id")).toInt(), 7);
    QVERIFY(!store.setFields(QStringLiteral("booking"), 999, {}));
}

void EntityStoreTest::exclusionConstraintRefusesOverlap()
{
    InMemoryEntityStore store;
    store.addExclusionConstraint(QStringLiteral("booking"), QStringLiteral("resource_id"), QStringLiteral("time_slot"));

    const auto first = store.createRecord(QStringLiteral("booking"), booking(7, slot(9)));
    QVERIFY(first.has_value());
    QVERIFY(store.createRecord(QStringLiteral("booking"), booking(7, slot(10))).has_value());
    QVERIFY(store.createRecord(QStringLiteral("booking"), booking(8, slot(9))).has_value());

    QString reason;
    QVERIFY(!store.createRecord(QStringLiteral("booking"), booking(7, slot(8, 2)), &reason).has_value());
    QCOMPARE(reason, QStringLiteral("Overlaps booking #%1 on resource_id").arg(*first));
    QCOMPARE(store.count(QStringLiteral("booking")), 3);
}

void EntityStoreTest::removeRunsHooksFirst()
{
    InMemoryEntityStore store;
    const auto id = store.createRecord(QStringLiteral("booking"), booking(7, slot(9)));

    bool recordVisible = false;
    store.addPreDeleteHook([&store, &recordVisible](const QString &type, qint64 recordId) {
        recordVisible = store.findRecord(type, recordId).has_value();
    });
    QVERIFY(store.removeRecord(QStringLiteral("booking"), *id));
    QVERIFY(recordVisible);
    QVERIFY(!store.findRecord(QStringLiteral("booking"), *id).has_value());
    QVERIFY(!store.removeRecord(QStringLiteral("booking"), *id));
}

void EntityStoreTest::restoreKeepsId()
{
    InMemoryEntityStore store;
    const auto id = store.createRecord(QStringLiteral("booking"), booking(7, slot(9)));
    const EntityRecord saved = *store.findRecord(QStringLiteral("booking"), *id);

    int hookCalls = 0;
    store.addPreDeleteHook([&hookCalls](const QString &, qint64) { ++hookCalls; });
    QVERIFY(store.removeRecord(QStringLiteral("booking"), *id));
    QVERIFY(store.restoreRecord(saved));
    QVERIFY(!store.restoreRecord(saved));
    QCOMPARE(hookCalls, 1);
    QCOMPARE(store.findRecord(QStringLiteral("booking"), *id)->id, *id);

    const auto next = store.createRecord(QStringLiteral("booking"), booking(8, slot(9)));
    QVERIFY(*next > *id);
}

void EntityStoreTest::fieldMetadata()
{
    InMemoryFieldMetadata metadata;
    QVERIFY(!metadata.fieldsFor(QStringLiteral("booking")).has_value());

    metadata.setFields(QStringLiteral("booking"), {{QStringLiteral("title")}, {QStringLiteral("notes")}});
    metadata.removeField(QStringLiteral("booking"), QStringLiteral("title"));
    const auto fields = metadata.fieldsFor(QStringLiteral("booking"));
    QVERIFY(fields.has_value());
    QCOMPARE(fields->size(), static_cast<std::size_t>(1));
    QCOMPARE(fields->front().name, QStringLiteral("notes"));
}

void EntityStoreTest::jobQueue()
{
    InMemoryJobQueue queue;
    const QDateTime until(QDate(2026, 4, 1), QTime(0, 0), Qt::UTC);
    QVERIFY(queue.enqueue({1, until}));
    QVERIFY(queue.enqueue({2, until}));
    QVERIFY(!queue.enqueue({0, until}));
    QVERIFY(!queue.enqueue({3, QDateTime()}));

    queue.setRejecting(true);
    QVERIFY(!queue.enqueue({3, until}));
    queue.setRejecting(false);

    QCOMPARE(queue.size(), 2);
    QCOMPARE(queue.takeNext()->seriesId, static_cast<qint64>(1));
    QCOMPARE(queue.takeNext()->seriesId, static_cast<qint64>(2));
    QVERIFY(!queue.takeNext().has_value());
}

void EntityStoreTest::removedHookIsNotCalled()
{
    InMemoryEntityStore store;
    int first = 0;
    int second = 0;
    const int firstId = store.addPreDeleteHook([&first](const QString &, qint64) { ++first; });
    const int secondId = store.addPreDeleteHook([&second](const QString &, qint64) { ++second; });
    QVERIFY(firstId != 0);
    QVERIFY(secondId != firstId);
    QCOMPARE(store.addPreDeleteHook(EntityStore::PreDeleteHook()), 0);

    store.removePreDeleteHook(firstId);
    const auto id = store.createRecord(QStringLiteral("booking"), booking(7, slot(9)));
    QVERIFY(store.removeRecord(QStringLiteral("booking"), *id));
    QCOMPARE(first, 0);
    QCOMPARE(second, 1);
}

QTEST_GUILESS_MAIN(EntityStoreTest)
#include "EntityStoreTest.moc"
