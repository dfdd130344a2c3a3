#include <QtTest/QtTest>

#include <vector>

#include "recurring/core/ChangeCommand.hpp"
#include "recurring/core/ChangeSet.hpp"

namespace {

class CounterCommand : public recurring::core::ChangeCommand
{
public:
    CounterCommand(int delta, int &value)
        : m_delta(delta)
        , m_value(value)
    {
    }

    bool apply() override
    {
        m_value += m_delta;
        return true;
    }
    void revert() override { m_value -= m_delta; }

private:
    int m_delta;
    int &m_value;
};

} // namespace

class ChangeSetTest : public QObject
{
    Q_OBJECT

private slots:
    void commitKeepsChanges();
    void rollbackRevertsNewestFirst();
    void failedCommandIsNotRecorded();
    void destructorRollsBackUncommitted();
};

void ChangeSetTest::commitKeepsChanges()
{
    int value = 0;
    {
        recurring::core::ChangeSet changes;
        QVERIFY(changes.push(std::make_unique<CounterCommand>(5, value)));
        QVERIFY(changes.push(std::make_unique<CounterCommand>(2, value)));
        QCOMPARE(changes.count(), static_cast<std::size_t>(2));
        changes.commit();
        QVERIFY(changes.isCommitted());
    }
    QCOMPARE(value, 7);
}

void ChangeSetTest::rollbackRevertsNewestFirst()
{
    std::vector<int> order;
    recurring::core::ChangeSet changes;
    changes.push([] { return true; }, [&order] { order.push_back(1); });
    changes.addRevert([&order] { order.push_back(2); });
    changes.push([] { return true; }, [&order] { order.push_back(3); });

    changes.rollback();
    QCOMPARE(order, (std::vector<int>{3, 2, 1}));
    QCOMPARE(changes.count(), static_cast<std::size_t>(0));
}

void ChangeSetTest::failedCommandIsNotRecorded()
{
    bool reverted = false;
    recurring::core::ChangeSet changes;
    QVERIFY(!changes.push([] { return false; }, [&reverted] { reverted = true; }));
    QCOMPARE(changes.count(), static_cast<std::size_t>(0));
    changes.rollback();
    QVERIFY(!reverted);
}

void ChangeSetTest::destructorRollsBackUncommitted()
{
    int value = 10;
    {
        recurring::core::ChangeSet changes;
        changes.push(std::make_unique<CounterCommand>(3, value));
        QCOMPARE(value, 13);
    }
    QCOMPARE(value, 10);
}

QTEST_GUILESS_MAIN(ChangeSetTest)
#include "ChangeSetTest.moc"
