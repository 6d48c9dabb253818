// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>

#include "sensor/sensorwindowmanager.h"

using namespace DragSense;

namespace {

/**
 * @brief Bookkeeping shared between the fake factory and its windows
 */
struct FakeWindowLedger
{
    int alive = 0;
    int created = 0;
    int placements = 0;
    int failAt = -1;            ///< Index of the create() call that fails; -1 never
    SensorWindowFactory::CallbackSink lastSink;
};

class FakeSensorWindow : public ISensorWindow
{
public:
    FakeSensorWindow(const QString& id, FakeWindowLedger* ledger)
        : m_id(id)
        , m_ledger(ledger)
    {
        ++m_ledger->alive;
    }
    ~FakeSensorWindow() override
    {
        --m_ledger->alive;
    }

    QString sensorId() const override
    {
        return m_id;
    }
    void place(const QRect&, const MonitorDescriptor&) override
    {
        ++m_ledger->placements;
    }
    void setTint(const QColor&) override
    {
    }

private:
    QString m_id;
    FakeWindowLedger* m_ledger;
};

class FakeSensorWindowFactory : public SensorWindowFactory
{
public:
    explicit FakeSensorWindowFactory(FakeWindowLedger* ledger)
        : m_ledger(ledger)
    {
    }

    std::unique_ptr<ISensorWindow> create(const QString& sensorId, const QRect&, const MonitorDescriptor&,
                                          CallbackSink sink, QString* errorMessage) override
    {
        if (m_ledger->created == m_ledger->failAt) {
            *errorMessage = QStringLiteral("refused");
            return nullptr;
        }
        ++m_ledger->created;
        m_ledger->lastSink = sink;
        return std::make_unique<FakeSensorWindow>(sensorId, m_ledger);
    }

private:
    FakeWindowLedger* m_ledger;
};

QVector<MonitorDescriptor> singleMonitor()
{
    MonitorDescriptor monitor;
    monitor.id = QStringLiteral("DP-1");
    monitor.widthPx = 1920;
    monitor.heightPx = 1080;
    return {monitor};
}

} // anonymous namespace

/**
 * @brief Unit tests for SensorWindowManager
 *
 * Tests cover:
 * - Window count equals the layout's count while armed, zero while idle
 * - Rollback when creating a window fails part-way
 * - Windows are moved, not recreated
 * - Closing grace period before the windows go away
 * - Callbacks from window sinks reach callbackReceived()
 */
class TestSensorWindowManager : public QObject
{
    Q_OBJECT

private:
    std::unique_ptr<SensorWindowManager> makeManager(FakeWindowLedger* ledger, const GridLayout& layout)
    {
        auto manager = std::make_unique<SensorWindowManager>(std::make_unique<FakeSensorWindowFactory>(ledger));
        manager->setMonitorProvider(&singleMonitor);
        manager->setLayout(layout);
        return manager;
    }

private Q_SLOTS:
    void arm_createsLayoutCount_data()
    {
        QTest::addColumn<int>("gridSize");
        QTest::addColumn<int>("expected");

        QTest::newRow("frame") << 0 << 4;
        QTest::newRow("grid 3") << 3 << 8;
        QTest::newRow("grid 5") << 5 << 24;
    }

    void arm_createsLayoutCount()
    {
        QFETCH(int, gridSize);
        QFETCH(int, expected);

        FakeWindowLedger ledger;
        const GridLayout layout = gridSize == 0 ? GridLayout::frame(80, 15, 50) : GridLayout::sparseGrid(gridSize, 30, 60);
        auto manager = makeManager(&ledger, layout);
        QSignalSpy armedSpy(manager.get(), &SensorWindowManager::armed);

        QVERIFY(manager->arm(QPointF(960, 540)).ok());
        QVERIFY(manager->state() == SensorWindowManager::State::Armed);
        QCOMPARE(manager->windowCount(), expected);
        QCOMPARE(ledger.alive, expected);
        QCOMPARE(armedSpy.count(), 1);
        QCOMPARE(manager->currentPlan().size(), expected);

        manager->abort();
        QCOMPARE(ledger.alive, 0);
        QVERIFY(manager->state() == SensorWindowManager::State::Idle);
    }

    void arm_failureRollsBack()
    {
        FakeWindowLedger ledger;
        ledger.failAt = 5;
        auto manager = makeManager(&ledger, GridLayout::sparseGrid(3, 30, 60));
        QSignalSpy failedSpy(manager.get(), &SensorWindowManager::windowCreationFailed);

        const OperationResult result = manager->arm(QPointF(960, 540));
        QVERIFY(!result.ok());
        QVERIFY(result.code == ErrorCode::WindowCreationFailed);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(ledger.alive, 0);
        QCOMPARE(manager->windowCount(), 0);
        QVERIFY(manager->state() == SensorWindowManager::State::Idle);
    }

    void arm_noMonitorsFails()
    {
        FakeWindowLedger ledger;
        auto manager = makeManager(&ledger, GridLayout::defaultLayout());
        manager->setMonitorProvider([] {
            return QVector<MonitorDescriptor>();
        });

        QVERIFY(!manager->arm(QPointF(0, 0)).ok());
        QCOMPARE(ledger.created, 0);
    }

    void moveTo_reusesWindows()
    {
        FakeWindowLedger ledger;
        auto manager = makeManager(&ledger, GridLayout::frame(80, 15, 50));
        QVERIFY(manager->arm(QPointF(500, 500)).ok());
        const QVector<SensorWindowSpec> before = manager->currentPlan();

        QSignalSpy movedSpy(manager.get(), &SensorWindowManager::moved);
        manager->moveTo(QPointF(900, 300));

        QCOMPARE(ledger.created, 4);
        QCOMPARE(ledger.placements, 4);
        QCOMPARE(movedSpy.count(), 1);
        QVERIFY(manager->currentPlan() != before);
    }

    void moveTo_ignoredWhileIdle()
    {
        FakeWindowLedger ledger;
        auto manager = makeManager(&ledger, GridLayout::frame(80, 15, 50));
        manager->moveTo(QPointF(10, 10));
        QCOMPARE(ledger.created, 0);
        QCOMPARE(ledger.placements, 0);
    }

    void disarm_keepsWindowsForGracePeriod()
    {
        FakeWindowLedger ledger;
        auto manager = makeManager(&ledger, GridLayout::frame(80, 15, 50));
        manager->setDropGraceMs(50);
        QSignalSpy closedSpy(manager.get(), &SensorWindowManager::closed);
        QVERIFY(manager->arm(QPointF(500, 500)).ok());

        manager->disarm();
        QVERIFY(manager->state() == SensorWindowManager::State::Closing);
        QCOMPARE(ledger.alive, 4);

        // A late drop still reaches the host
        QSignalSpy callbackSpy(manager.get(), &SensorWindowManager::callbackReceived);
        DragCallbackEvent drop;
        drop.kind = DragCallbackKind::DroppedFile;
        drop.filePath = QStringLiteral("/tmp/late.txt");
        ledger.lastSink(drop);
        QCOMPARE(callbackSpy.count(), 1);

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(ledger.alive, 0);
        QVERIFY(manager->state() == SensorWindowManager::State::Idle);
    }

    void rearm_whileClosingReplacesWindows()
    {
        FakeWindowLedger ledger;
        auto manager = makeManager(&ledger, GridLayout::frame(80, 15, 50));
        manager->setDropGraceMs(1000);
        QVERIFY(manager->arm(QPointF(500, 500)).ok());
        manager->disarm();

        QVERIFY(manager->arm(QPointF(600, 600)).ok());
        QCOMPARE(ledger.alive, 4);
        QVERIFY(manager->state() == SensorWindowManager::State::Armed);
    }

    void sink_outlivingManagerIsHarmless()
    {
        FakeWindowLedger ledger;
        {
            auto manager = makeManager(&ledger, GridLayout::frame(80, 15, 50));
            QVERIFY(manager->arm(QPointF(500, 500)).ok());
        }
        QCOMPARE(ledger.alive, 0);
        ledger.lastSink(DragCallbackEvent());
    }
};

QTEST_MAIN(TestSensorWindowManager)
#include "test_sensor_window_manager.moc"
