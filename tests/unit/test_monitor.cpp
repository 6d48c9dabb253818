// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>

#include "core/constants.h"
#include "core/pointersource.h"
#include "sensor/monitor.h"
#include "sensor/sensorbackend.h"

using namespace DragSense;

namespace {

/**
 * @brief Pointer hook driven by the test instead of the display server
 */
class FakePointerSource : public PointerSource
{
public:
    ~FakePointerSource() override
    {
        shutdown();
    }

    void push(PointerKind kind, PointerButton button, qreal x, qreal y)
    {
        PointerSample sample;
        sample.kind = kind;
        sample.button = button;
        sample.x = x;
        sample.y = y;
        sample.timestamp = currentTimestamp();
        deliver(sample);
    }

    bool denyInstall = false;
    int installCount = 0;
    int uninstallCount = 0;

protected:
    OperationResult install() override
    {
        if (denyInstall) {
            return OperationResult::failure(ErrorCode::PermissionDenied, QStringLiteral("input access denied"));
        }
        ++installCount;
        return OperationResult::success();
    }
    void uninstall() override
    {
        ++uninstallCount;
    }
};

class FakeSensorBackend : public ISensorBackend
{
public:
    void arm(const QPointF&) override
    {
        ++armCalls;
        Q_EMIT armed({});
    }
    void moveTo(const QPointF&) override
    {
    }
    void disarm() override
    {
        Q_EMIT disarmed();
    }
    void abort() override
    {
    }
    bool requiresGuiThread() const override
    {
        return true;
    }

    void drop(const QString& path)
    {
        DragCallbackEvent callback;
        callback.kind = DragCallbackKind::DroppedFile;
        callback.filePath = path;
        callback.originatingSensorWindow = QStringLiteral("SensorWindow-r0c1");
        Q_EMIT callbackReceived(callback);
    }

    int armCalls = 0;
};

QVector<MonitorDescriptor> hiDpiMonitor()
{
    MonitorDescriptor monitor;
    monitor.id = QStringLiteral("eDP-1");
    monitor.widthPx = 2880;
    monitor.heightPx = 1800;
    monitor.scaleFactor = 2.0;
    return {monitor};
}

} // anonymous namespace

/**
 * @brief Unit tests for the Monitor facade
 *
 * Tests cover:
 * - Pointer monitoring lifecycle, idempotence and hook refusal
 * - Pointer events carry physical coordinates
 * - No delivery after stop or listener removal
 * - Drag monitoring end to end through a fake sensor backend
 * - Backend termination stops drag monitoring with a status event
 * - simulateDragEvent ordering and argument validation
 * - configureDragMonitor validation
 * - Two monitors in one process keep separate state
 */
class TestMonitor : public QObject
{
    Q_OBJECT

private:
    struct Fixture
    {
        std::unique_ptr<Monitor> monitor;
        FakePointerSource* source = nullptr;
        FakeSensorBackend* backend = nullptr;
    };

    Fixture makeFixture()
    {
        Fixture fixture;
        fixture.monitor = std::make_unique<Monitor>();
        auto source = std::make_unique<FakePointerSource>();
        fixture.source = source.get();
        fixture.monitor->setPointerSource(std::move(source));
        fixture.monitor->setMonitors(hiDpiMonitor());
        return fixture;
    }

private Q_SLOTS:
    void pointer_startStopIsIdempotent()
    {
        Fixture f = makeFixture();
        QSignalSpy changedSpy(f.monitor.get(), &Monitor::pointerMonitoringChanged);

        QVERIFY(f.monitor->startPointerMonitor().ok());
        QVERIFY(f.monitor->startPointerMonitor().ok());
        QVERIFY(f.monitor->isPointerMonitoring());
        QCOMPARE(f.source->installCount, 1);
        QCOMPARE(changedSpy.count(), 1);

        QVERIFY(f.monitor->stopPointerMonitor().ok());
        QVERIFY(f.monitor->stopPointerMonitor().ok());
        QVERIFY(!f.monitor->isPointerMonitoring());
        QCOMPARE(f.source->uninstallCount, 1);
        QCOMPARE(changedSpy.count(), 2);
    }

    void pointer_installDeniedReportsPermission()
    {
        Fixture f = makeFixture();
        f.source->denyInstall = true;
        QSignalSpy errorSpy(f.monitor.get(), &Monitor::monitorError);

        const OperationResult result = f.monitor->startPointerMonitor();
        QVERIFY(result.code == ErrorCode::PermissionDenied);
        QVERIFY(!f.monitor->isPointerMonitoring());
        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(errorSpy.at(0).at(0).toInt(), static_cast<int>(ErrorCode::PermissionDenied));
    }

    void pointer_eventsArePhysical()
    {
        Fixture f = makeFixture();
        QVector<PointerEvent> received;
        f.monitor->onPointerEvent([&received](const PointerEvent& event) {
            received.append(event);
        });

        QVERIFY(f.monitor->startPointerMonitor().ok());
        f.source->push(PointerKind::Move, PointerButton::None, 100, 50);
        f.source->push(PointerKind::Down, PointerButton::Left, 100, 50);

        QTRY_COMPARE(received.size(), 2);
        QCOMPARE(received.at(0).eventType, QString(EventTypes::MouseMove));
        QCOMPARE(received.at(0).x, 200.0);
        QCOMPARE(received.at(0).y, 100.0);
        QCOMPARE(received.at(1).eventType, QString(EventTypes::MouseDown));
        QCOMPARE(received.at(1).button, 1);
    }

    void pointer_noDeliveryAfterStop()
    {
        Fixture f = makeFixture();
        int received = 0;
        f.monitor->onPointerEvent([&received](const PointerEvent&) {
            ++received;
        });

        QVERIFY(f.monitor->startPointerMonitor().ok());
        QVERIFY(f.monitor->stopPointerMonitor().ok());
        f.source->push(PointerKind::Move, PointerButton::None, 1, 1);
        QTest::qWait(50);
        QCOMPARE(received, 0);
    }

    void pointer_removedListenerGetsNothing()
    {
        Fixture f = makeFixture();
        int received = 0;
        const EventBus::Handle handle = f.monitor->onPointerEvent([&received](const PointerEvent&) {
            ++received;
        });
        QVERIFY(f.monitor->startPointerMonitor().ok());

        QVERIFY(f.monitor->removePointerEventListener(handle));
        QVERIFY(!f.monitor->removePointerEventListener(handle));
        f.source->push(PointerKind::Move, PointerButton::None, 1, 1);
        QTest::qWait(50);
        QCOMPARE(received, 0);
    }

    void monitors_areIndependent()
    {
        Fixture first = makeFixture();
        int firstReceived = 0;
        first.monitor->onPointerEvent([&firstReceived](const PointerEvent&) {
            ++firstReceived;
        });
        QVERIFY(first.monitor->startPointerMonitor().ok());

        {
            Fixture second = makeFixture();
            int secondReceived = 0;
            second.monitor->onPointerEvent([&secondReceived](const PointerEvent&) {
                ++secondReceived;
            });
            QVERIFY(!second.monitor->isPointerMonitoring());

            first.source->push(PointerKind::Move, PointerButton::None, 10, 10);
            QTRY_COMPARE(firstReceived, 1);
            QTest::qWait(50);
            QCOMPARE(secondReceived, 0);
        }

        // Destroying the second monitor leaves the first running
        QVERIFY(first.monitor->isPointerMonitoring());
        first.source->push(PointerKind::Move, PointerButton::None, 20, 20);
        QTRY_COMPARE(firstReceived, 2);
    }

    void drag_endToEnd()
    {
        Fixture f = makeFixture();
        FakeSensorBackend* backend = nullptr;
        f.monitor->setSensorBackendFactory([&backend]() -> ISensorBackend* {
            backend = new FakeSensorBackend;
            return backend;
        });
        QVector<DragEvent> received;
        f.monitor->onDragEvent([&received](const DragEvent& event) {
            received.append(event);
        });

        QVERIFY(f.monitor->startDragMonitor().ok());
        QVERIFY(f.monitor->startDragMonitor().ok());
        QVERIFY(f.monitor->isDragMonitoring());
        QVERIFY(backend);
        // Pointer monitoring is independent of drag monitoring
        QVERIFY(!f.monitor->isPointerMonitoring());

        f.source->push(PointerKind::Down, PointerButton::Left, 400, 400);
        QTRY_COMPARE(backend->armCalls, 1);
        backend->drop(QStringLiteral("/home/user/photo.jpg"));

        QTRY_COMPARE(received.size(), 1);
        QCOMPARE(received.first().eventType, QString(EventTypes::DroppedFile));
        QCOMPARE(received.first().filePath, QStringLiteral("/home/user/photo.jpg"));

        QVERIFY(f.monitor->stopDragMonitor().ok());
        QVERIFY(f.monitor->stopDragMonitor().ok());
        QVERIFY(!f.monitor->isDragMonitoring());
        QCOMPARE(f.source->subscriberCount(), 0);
    }

    void drag_missingBackendIsHelperUnavailable()
    {
        Fixture f = makeFixture();
        f.monitor->setSensorBackendFactory([]() -> ISensorBackend* {
            return nullptr;
        });

        const OperationResult result = f.monitor->startDragMonitor();
        QVERIFY(result.code == ErrorCode::HelperUnavailable);
        QVERIFY(!f.monitor->isDragMonitoring());
    }

    void drag_backendTerminationStopsMonitoring()
    {
        Fixture f = makeFixture();
        FakeSensorBackend* backend = nullptr;
        f.monitor->setSensorBackendFactory([&backend]() -> ISensorBackend* {
            backend = new FakeSensorBackend;
            return backend;
        });
        QVector<DragEvent> received;
        f.monitor->onDragEvent([&received](const DragEvent& event) {
            received.append(event);
        });
        QSignalSpy changedSpy(f.monitor.get(), &Monitor::dragMonitoringChanged);
        QSignalSpy errorSpy(f.monitor.get(), &Monitor::monitorError);

        QVERIFY(f.monitor->startDragMonitor().ok());
        Q_EMIT backend->terminated(QStringLiteral("helper exited with code 139"));

        QTRY_VERIFY(!f.monitor->isDragMonitoring());
        QTRY_COMPARE(received.size(), 1);
        QCOMPARE(received.first().eventType, QString(EventTypes::MonitorTerminated));
        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(errorSpy.at(0).at(0).toInt(), static_cast<int>(ErrorCode::MonitorTerminatedUnexpectedly));
        QCOMPARE(changedSpy.count(), 2);
    }

    void simulate_deliversInOrder()
    {
        Fixture f = makeFixture();
        QVector<DragEvent> received;
        f.monitor->onDragEvent([&received](const DragEvent& event) {
            received.append(event);
        });

        const QStringList paths{QStringLiteral("/a.txt"), QStringLiteral("/b.jpg")};
        QVERIFY(f.monitor->simulateDragEvent(paths).ok());

        QTRY_COMPARE(received.size(), 2);
        QCOMPARE(received.at(0).filePath, QStringLiteral("/a.txt"));
        QCOMPARE(received.at(1).filePath, QStringLiteral("/b.jpg"));
        for (const DragEvent& event : std::as_const(received)) {
            QCOMPARE(event.eventType, QString(EventTypes::DroppedFile));
            QCOMPARE(event.episodeId, quint64(0));
            QVERIFY(event.timestamp > 0);
        }
    }

    void simulate_rejectsBadArguments()
    {
        Fixture f = makeFixture();
        int received = 0;
        f.monitor->onDragEvent([&received](const DragEvent&) {
            ++received;
        });

        QVERIFY(f.monitor->simulateDragEvent(QStringList()).code == ErrorCode::InvalidArgument);
        QVERIFY(f.monitor->simulateDragEvent(QVariant(QStringLiteral("/a.txt"))).code == ErrorCode::InvalidArgument);
        QVERIFY(f.monitor->simulateDragEvent(QVariant(42)).code == ErrorCode::InvalidArgument);
        QVERIFY(f.monitor->simulateDragEvent(QVariant(QVariantList{QStringLiteral("/a"), 7})).code
                == ErrorCode::InvalidArgument);
        QVERIFY(f.monitor->simulateDragEvent(QVariant(QVariantList{QStringLiteral("/a")})).ok());

        QTRY_COMPARE(received, 1);
    }

    void configure_validatesLocator()
    {
        Fixture f = makeFixture();
        QVERIFY(f.monitor->configureDragMonitor(QString()).code == ErrorCode::InvalidArgument);
        QVERIFY(f.monitor->configureDragMonitor(QStringLiteral("/nonexistent/dragsense-sensor-helper")).code
                == ErrorCode::HelperUnavailable);
        QVERIFY(f.monitor->helperPath().isEmpty());
    }
};

QTEST_MAIN(TestMonitor)
#include "test_monitor.moc"
