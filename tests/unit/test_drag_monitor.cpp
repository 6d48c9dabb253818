// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>

#include "core/constants.h"
#include "sensor/dragmonitor.h"
#include "sensor/sensorbackend.h"

using namespace DragSense;

namespace {

/**
 * @brief Backend recording requests; outcomes are raised by the test
 */
class FakeSensorBackend : public ISensorBackend
{
public:
    void arm(const QPointF& logicalCenter) override
    {
        armCalls.append(logicalCenter);
        if (armSynchronously) {
            Q_EMIT armed({});
        }
    }
    void moveTo(const QPointF& logicalCenter) override
    {
        moveCalls.append(logicalCenter);
    }
    void disarm() override
    {
        ++disarmCalls;
    }
    void abort() override
    {
        ++abortCalls;
    }
    bool requiresGuiThread() const override
    {
        return false;
    }

    void deliver(DragCallbackKind kind, const QString& path, const QString& window)
    {
        DragCallbackEvent callback;
        callback.kind = kind;
        callback.filePath = path;
        callback.x = 460;
        callback.y = 435;
        callback.timestamp = 1.0;
        callback.originatingSensorWindow = window;
        Q_EMIT callbackReceived(callback);
    }

    bool armSynchronously = true;
    QVector<QPointF> armCalls;
    QVector<QPointF> moveCalls;
    int disarmCalls = 0;
    int abortCalls = 0;
};

PointerSample sample(PointerKind kind, PointerButton button, qreal x, qreal y)
{
    PointerSample s;
    s.kind = kind;
    s.button = button;
    s.x = x;
    s.y = y;
    return s;
}

} // anonymous namespace

/**
 * @brief Unit tests for DragMonitor
 *
 * Tests cover:
 * - Press/move/release drives arm/moveTo/disarm
 * - A plain click produces no drag events
 * - Button mask filtering
 * - Arm failure and backend termination become status events
 * - Callbacks outside an episode are dropped
 * - A press while the previous episode closes arms after teardown
 */
class TestDragMonitor : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<DragEvent>();
        qRegisterMetaType<ErrorCode>();
    }

    void dragAcrossSensor_emitsHoverThenDrop()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);
        QSignalSpy eventSpy(&monitor, &DragMonitor::dragEvent);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 500, 500));
        QCOMPARE(backend->armCalls.size(), 1);
        QCOMPARE(backend->armCalls.first(), QPointF(500, 500));
        QVERIFY(monitor.phase() == DragMonitor::Phase::Armed);

        for (int i = 1; i <= 5; ++i) {
            monitor.handleSample(sample(PointerKind::Move, PointerButton::None, 500 + i * 10, 500));
        }
        QCOMPARE(backend->moveCalls.size(), 5);
        QCOMPARE(backend->moveCalls.last(), QPointF(550, 500));

        backend->deliver(DragCallbackKind::HoveredFile, QStringLiteral("/home/user/a.txt"), QStringLiteral("w1"));
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Left, 550, 500));
        QVERIFY(monitor.phase() == DragMonitor::Phase::Closing);
        QCOMPARE(backend->disarmCalls, 1);

        // XDND drop lands after the release
        backend->deliver(DragCallbackKind::DroppedFile, QStringLiteral("/home/user/a.txt"), QStringLiteral("w1"));
        Q_EMIT backend->disarmed();
        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);

        QCOMPARE(eventSpy.count(), 2);
        const DragEvent hover = eventSpy.at(0).at(0).value<DragEvent>();
        const DragEvent drop = eventSpy.at(1).at(0).value<DragEvent>();
        QCOMPARE(hover.eventType, QString(EventTypes::HoveredFile));
        QCOMPARE(drop.eventType, QString(EventTypes::DroppedFile));
        QCOMPARE(drop.filePath, QStringLiteral("/home/user/a.txt"));
        QCOMPARE(hover.episodeId, drop.episodeId);
        QVERIFY(drop.episodeId != 0);
    }

    void click_producesNoDragEvents()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);
        QSignalSpy eventSpy(&monitor, &DragMonitor::dragEvent);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Left, 10, 10));
        Q_EMIT backend->disarmed();

        QCOMPARE(backend->armCalls.size(), 1);
        QCOMPARE(backend->disarmCalls, 1);
        QCOMPARE(eventSpy.count(), 0);
        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);
    }

    void buttonMask_filtersPresses()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);
        monitor.setButtonMask(buttonMaskBit(PointerButton::Left));

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Right, 10, 10));
        QCOMPARE(backend->armCalls.size(), 0);
        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        QCOMPARE(backend->armCalls.size(), 1);
    }

    void release_ofOtherButtonIsIgnored()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        monitor.handleSample(sample(PointerKind::Down, PointerButton::Right, 10, 10));
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Right, 10, 10));
        QCOMPARE(backend->armCalls.size(), 1);
        QCOMPARE(backend->disarmCalls, 0);
        QVERIFY(monitor.phase() == DragMonitor::Phase::Armed);
    }

    void releaseBeforeReady_stillCloses()
    {
        auto* backend = new FakeSensorBackend;
        backend->armSynchronously = false;
        DragMonitor monitor(backend);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        QVERIFY(monitor.phase() == DragMonitor::Phase::Arming);
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Left, 10, 10));
        QVERIFY(monitor.phase() == DragMonitor::Phase::Closing);

        Q_EMIT backend->armed({});
        QVERIFY(monitor.phase() == DragMonitor::Phase::Closing);
        Q_EMIT backend->disarmed();
        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);
    }

    void armFailed_emitsStatusEvent()
    {
        auto* backend = new FakeSensorBackend;
        backend->armSynchronously = false;
        DragMonitor monitor(backend);
        QSignalSpy eventSpy(&monitor, &DragMonitor::dragEvent);
        QSignalSpy errorSpy(&monitor, &DragMonitor::errorOccurred);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        Q_EMIT backend->armFailed(QStringLiteral("compositor refused"));

        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);
        QCOMPARE(errorSpy.count(), 1);
        QVERIFY(errorSpy.at(0).at(0).value<ErrorCode>() == ErrorCode::WindowCreationFailed);
        QCOMPARE(eventSpy.count(), 1);
        QCOMPARE(eventSpy.at(0).at(0).value<DragEvent>().eventType, QString(EventTypes::WindowCreationFailed));

        // Monitor keeps running: the next press arms again
        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 20, 20));
        QCOMPARE(backend->armCalls.size(), 2);
    }

    void terminated_emitsStatusAndSignal()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);
        QSignalSpy eventSpy(&monitor, &DragMonitor::dragEvent);
        QSignalSpy terminatedSpy(&monitor, &DragMonitor::terminated);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        Q_EMIT backend->terminated(QStringLiteral("helper crashed"));

        QCOMPARE(terminatedSpy.count(), 1);
        QCOMPARE(eventSpy.count(), 1);
        QCOMPARE(eventSpy.at(0).at(0).value<DragEvent>().eventType, QString(EventTypes::MonitorTerminated));
        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);
    }

    void pressWhileClosing_armsAfterDisarmed()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);
        QSignalSpy eventSpy(&monitor, &DragMonitor::dragEvent);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Left, 10, 10));
        const quint64 firstEpisode = monitor.episodes().current()->episodeId;
        QVERIFY(monitor.phase() == DragMonitor::Phase::Closing);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 40, 40));
        monitor.handleSample(sample(PointerKind::Move, PointerButton::None, 60, 45));
        QCOMPARE(backend->armCalls.size(), 1);
        QVERIFY(monitor.phase() == DragMonitor::Phase::Closing);

        // Late drop still belongs to the first episode
        backend->deliver(DragCallbackKind::DroppedFile, QStringLiteral("/tmp/late.txt"), QStringLiteral("w1"));
        QCOMPARE(eventSpy.count(), 1);
        QCOMPARE(eventSpy.at(0).at(0).value<DragEvent>().episodeId, firstEpisode);

        Q_EMIT backend->disarmed();
        QCOMPARE(backend->armCalls.size(), 2);
        QCOMPARE(backend->armCalls.last(), QPointF(60, 45));
        QVERIFY(monitor.phase() == DragMonitor::Phase::Armed);
        QVERIFY(monitor.episodes().current()->episodeId != firstEpisode);

        backend->deliver(DragCallbackKind::DroppedFile, QStringLiteral("/tmp/second.txt"), QStringLiteral("w2"));
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Left, 60, 45));
        QCOMPARE(backend->disarmCalls, 2);
        QCOMPARE(eventSpy.count(), 2);
        QCOMPARE(eventSpy.at(1).at(0).value<DragEvent>().filePath, QStringLiteral("/tmp/second.txt"));
    }

    void clickWhileClosing_isCancelledByItsRelease()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Left, 10, 10));
        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 20, 20));
        monitor.handleSample(sample(PointerKind::Up, PointerButton::Left, 20, 20));
        Q_EMIT backend->disarmed();

        QCOMPARE(backend->armCalls.size(), 1);
        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);
    }

    void callbackOutsideEpisode_isDropped()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);
        QSignalSpy eventSpy(&monitor, &DragMonitor::dragEvent);

        backend->deliver(DragCallbackKind::DroppedFile, QStringLiteral("/stray"), QStringLiteral("w"));
        QCOMPARE(eventSpy.count(), 0);
    }

    void abort_tearsDownWithoutEvents()
    {
        auto* backend = new FakeSensorBackend;
        DragMonitor monitor(backend);
        QSignalSpy eventSpy(&monitor, &DragMonitor::dragEvent);

        monitor.handleSample(sample(PointerKind::Down, PointerButton::Left, 10, 10));
        monitor.abort();
        QCOMPARE(backend->abortCalls, 1);
        QVERIFY(monitor.phase() == DragMonitor::Phase::Idle);
        QCOMPARE(eventSpy.count(), 0);

        // Idle abort is a no-op
        monitor.abort();
        QCOMPARE(backend->abortCalls, 1);
    }
};

QTEST_GUILESS_MAIN(TestDragMonitor)
#include "test_drag_monitor.moc"
