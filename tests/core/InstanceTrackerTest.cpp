#include <QtTest/QtTest>

#include "core/ScheduleFixture.hpp"

using namespace recurring::core;
using namespace recurring::data;
using testing::ScheduleFixture;
using testing::utc;

class InstanceTrackerTest : public QObject
{
    Q_OBJECT

private slots:
    void cancelMemberOccurrence();
    void cancelTwiceSucceeds();
    void cancelStandaloneRecord();
    void rescheduleKeepsHistory();
    void rescheduleStandaloneRecord();
    void rescheduleRejectsBadInput();
    void membership();
    void directDeleteCancelsInstance();
    void findsDanglingInstances();
    void destroyedTrackerStopsCleanup();
};

void InstanceTrackerTest::cancelMemberOccurrence()
{
    ScheduleFixture fixture;
    const auto created = fixture.createExpanded(ScheduleFixture::weeklyRequest(), QDate(2026, 1, 16));
    const Instance target = fixture.repository.fetchInstances(created.seriesId)[1];
    const QUuid actor = QUuid::createUuid();

    const auto result = fixture.tracker.cancelOccurrence(QStringLiteral("booking"), *target.recordId,
                                                         QStringLiteral("Public holiday"), actor);
    QVERIFY(result.has_value());
    QVERIFY(result->wasMember);
    QVERIFY(result->recordRemoved);
    QCOMPARE(*result->seriesId, created.seriesId);
    QCOMPARE(result->occurrenceDate, QDate(2026, 1, 7));

    const auto cancelled = fixture.repository.findInstance(target.id);
    QVERIFY(cancelled.has_value());
    QVERIFY(!cancelled->recordId.has_value());
    QVERIFY(cancelled->isException);
    QCOMPARE(cancelled->exceptionType, ExceptionType::Cancelled);
    QCOMPARE(cancelled->exceptionReason, QStringLiteral("Public holiday"));
    QCOMPARE(cancelled->exceptionAt, ScheduleFixture::now());
    QCOMPARE(cancelled->exceptionBy, actor);
    QVERIFY(!fixture.store.findRecord(QStringLiteral("booking"), *target.recordId).has_value());
    QCOMPARE(fixture.store.count(QStringLiteral("booking")), 5);
}

void InstanceTrackerTest::cancelTwiceSucceeds()
{
    ScheduleFixture fixture;
    const auto created = fixture.createExpanded(ScheduleFixture::weeklyRequest(), QDate(2026, 1, 16));
    const qint64 recordId = *fixture.repository.fetchInstances(created.seriesId).front().recordId;

    QVERIFY(fixture.tracker.cancelOccurrence(QStringLiteral("booking"), recordId));
    const auto again = fixture.tracker.cancelOccurrence(QStringLiteral("booking"), recordId);
    QVERIFY(again.has_value());
    QVERIFY(!again->wasMember);
    QVERIFY(!again->recordRemoved);
    QCOMPARE(fixture.repository.fetchInstances(created.seriesId).size(), static_cast<std::size_t>(6));
}

void InstanceTrackerTest::cancelStandaloneRecord()
{
    ScheduleFixture fixture;
    const auto recordId = fixture.store.createRecord(QStringLiteral("booking"),
                                                     {{QStringLiteral("title"), QStringLiteral("One-off")}});
    QVERIFY(recordId.has_value());

    const auto result = fixture.tracker.cancelOccurrence(QStringLiteral("booking"), *recordId);
    QVERIFY(result.has_value());
    QVERIFY(!result->wasMember);
    QVERIFY(result->recordRemoved);
    QCOMPARE(fixture.store.count(QStringLiteral("booking")), 0);
}

void InstanceTrackerTest::rescheduleKeepsHistory()
{
    ScheduleFixture fixture;
    const auto created = fixture.createExpanded(ScheduleFixture::weeklyRequest(), QDate(2026, 1, 16));
    const Instance target = fixture.repository.fetchInstances(created.seriesId)[1];
    const TimeRange scheduled{utc(2026, 1, 7, 9), utc(2026, 1, 7, 10)};
    const TimeRange first{utc(2026, 1, 7, 14), utc(2026, 1, 7, 15)};
    const TimeRange second{utc(2026, 1, 8, 9), utc(2026, 1, 8, 10)};

    const auto moved = fixture.tracker.rescheduleOccurrence(QStringLiteral("booking"), *target.recordId, first);
    QVERIFY(moved.has_value());
    QVERIFY(moved->wasMember);
    QCOMPARE(*moved->priorRange, scheduled);

    const auto movedAgain = fixture.tracker.rescheduleOccurrence(QStringLiteral("booking"), *target.recordId, second);
    QVERIFY(movedAgain.has_value());
    QCOMPARE(*movedAgain->priorRange, first);

    const auto instance = fixture.repository.findInstance(target.id);
    QCOMPARE(instance->exceptionType, ExceptionType::Rescheduled);
    QVERIFY(instance->isException);
    QCOMPARE(instance->rescheduleHistory.size(), static_cast<std::size_t>(2));
    QCOMPARE(instance->rescheduleHistory[0], scheduled);
    QCOMPARE(instance->rescheduleHistory[1], first);
    QCOMPARE(*instance->originalRange, first);
    QCOMPARE(*instance->recordId, *target.recordId);
    QCOMPARE(instance->occurrenceDate, QDate(2026, 1, 7));

    const auto record = fixture.store.findRecord(QStringLiteral("booking"), *target.recordId);
    QCOMPARE(*timeRangeField(record->fields, QStringLiteral("time_slot")), second);
}

void InstanceTrackerTest::rescheduleStandaloneRecord()
{
    ScheduleFixture fixture;
    const auto recordId = fixture.store.createRecord(QStringLiteral("booking"),
                                                     {{QStringLiteral("title"), QStringLiteral("One-off")}});
    const TimeRange slot{utc(2026, 2, 2, 9), utc(2026, 2, 2, 10)};

    const auto result = fixture.tracker.rescheduleOccurrence(QStringLiteral("booking"), *recordId, slot);
    QVERIFY(result.has_value());
    QVERIFY(!result->wasMember);
    QVERIFY(!result->priorRange.has_value());
    const auto record = fixture.store.findRecord(QStringLiteral("booking"), *recordId);
    QCOMPARE(*timeRangeField(record->fields, QStringLiteral("time_slot")), slot);
}

void InstanceTrackerTest::rescheduleRejectsBadInput()
{
    ScheduleFixture fixture;
    ScheduleError error;
    QVERIFY(!fixture.tracker.rescheduleOccurrence(QStringLiteral("booking"), 1,
                                                  {utc(2026, 1, 7, 10), utc(2026, 1, 7, 9)}, QUuid(), &error));
    QCOMPARE(error.kind, ErrorKind::InvalidArgument);

    QVERIFY(!fixture.tracker.rescheduleOccurrence(QStringLiteral("booking"), 42,
                                                  {utc(2026, 1, 7, 9), utc(2026, 1, 7, 10)}, QUuid(), &error));
    QCOMPARE(error.kind, ErrorKind::NotFound);
}

void InstanceTrackerTest::membership()
{
    ScheduleFixture fixture;
    CreateSeriesRequest request = ScheduleFixture::weeklyRequest();
    request.color = QStringLiteral("#FF8800");
    const auto created = fixture.createExpanded(request, QDate(2026, 1, 16));
    const Instance target = fixture.repository.fetchInstances(created.seriesId).front();

    const Membership member = fixture.tracker.membership(QStringLiteral("booking"), *target.recordId);
    QVERIFY(member.isMember);
    QCOMPARE(*member.instanceId, target.id);
    QCOMPARE(*member.seriesId, created.seriesId);
    QCOMPARE(*member.groupId, created.groupId);
    QCOMPARE(member.groupName, QStringLiteral("Team standup"));
    QCOMPARE(member.groupColor, QStringLiteral("#FF8800"));
    QCOMPARE(member.occurrenceDate, QDate(2026, 1, 5));
    QVERIFY(!member.isException);
    QCOMPARE(member.seriesTemplate.value(QStringLiteral("title")).toString(), QStringLiteral("Standup"));

    const Membership stranger = fixture.tracker.membership(QStringLiteral("booking"), 999);
    QVERIFY(!stranger.isMember);
    QVERIFY(!stranger.seriesId.has_value());
}

void InstanceTrackerTest::directDeleteCancelsInstance()
{
    ScheduleFixture fixture;
    const auto created = fixture.createExpanded(ScheduleFixture::weeklyRequest(), QDate(2026, 1, 16));
    const Instance target = fixture.repository.fetchInstances(created.seriesId)[2];

    QVERIFY(fixture.store.removeRecord(QStringLiteral("booking"), *target.recordId));

    const auto instance = fixture.repository.findInstance(target.id);
    QVERIFY(instance.has_value());
    QVERIFY(!instance->recordId.has_value());
    QCOMPARE(instance->exceptionType, ExceptionType::Cancelled);
    QCOMPARE(instance->exceptionReason, QStringLiteral("Entity record deleted directly"));
    QVERIFY(fixture.tracker.findDanglingInstances().empty());
}

void InstanceTrackerTest::findsDanglingInstances()
{
    ScheduleFixture fixture;
    const auto created = fixture.createExpanded(ScheduleFixture::weeklyRequest(), QDate(2026, 1, 16));

    Instance broken;
    broken.seriesId = created.seriesId;
    broken.occurrenceDate = QDate(2026, 1, 19);
    broken.recordType = QStringLiteral("booking");
    broken.recordId = 999;
    QVERIFY(fixture.repository.addInstance(broken));

    QTest::ignoreMessage(QtCriticalMsg, QRegularExpression(QStringLiteral("^Dangling instance")));
    const auto dangling = fixture.tracker.findDanglingInstances();
    QCOMPARE(dangling.size(), static_cast<std::size_t>(1));
    QCOMPARE(dangling.front().occurrenceDate, QDate(2026, 1, 19));
}

void InstanceTrackerTest::destroyedTrackerStopsCleanup()
{
    InMemoryScheduleRepository repository;
    InMemoryEntityStore store;
    const auto recordId = store.createRecord(QStringLiteral("booking"), {{QStringLiteral("title"), QStringLiteral("Yoga")}});
    QVERIFY(recordId.has_value());

    Series series;
    series.effectiveFrom = QDate(2026, 1, 5);
    series.recordType = QStringLiteral("booking");
    series.rule = QStringLiteral("FREQ=WEEKLY");
    series.anchor = utc(2026, 1, 5, 9);
    series.durationSecs = 3600;
    const auto storedSeries = repository.addSeries(series);
    QVERIFY(storedSeries.has_value());

    Instance instance;
    instance.seriesId = storedSeries->id;
    instance.occurrenceDate = QDate(2026, 1, 5);
    instance.recordType = QStringLiteral("booking");
    instance.recordId = *recordId;
    const auto linked = repository.addInstance(instance);
    QVERIFY(linked.has_value());

    {
        InstanceTracker tracker(repository, store);
        tracker.installOrphanCleanup();
        tracker.installOrphanCleanup();
    }

    QVERIFY(store.removeRecord(QStringLiteral("booking"), *recordId));
    const auto untouched = repository.findInstance(linked->id);
    QVERIFY(untouched.has_value());
    QCOMPARE(*untouched->recordId, *recordId);
    QVERIFY(!untouched->isException);
}

QTEST_GUILESS_MAIN(InstanceTrackerTest)
#include "InstanceTrackerTest.moc"
