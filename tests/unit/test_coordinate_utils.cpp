// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QVector>

#include "core/coordinateutils.h"

using namespace DragSense;

namespace {

MonitorDescriptor makeMonitor(const QString& id, int x, int y, int widthPx, int heightPx, qreal scale)
{
    MonitorDescriptor monitor;
    monitor.id = id;
    monitor.originX = x;
    monitor.originY = y;
    monitor.widthPx = widthPx;
    monitor.heightPx = heightPx;
    monitor.scaleFactor = scale;
    return monitor;
}

} // anonymous namespace

/**
 * @brief Unit tests for CoordinateUtils
 *
 * Tests cover:
 * - Scaling relative to the monitor origin
 * - Monitor selection on multi-monitor desktops
 * - Clamping of points outside every monitor
 * - Pass-through with no monitors
 * - Logical/physical round trips used for window placement
 */
class TestCoordinateUtils : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void normalize_scalesFromOrigin()
    {
        const QVector<MonitorDescriptor> monitors{makeMonitor(QStringLiteral("eDP-1"), 0, 0, 2880, 1800, 2.0)};

        const CoordinateUtils::NormalizedPoint point = CoordinateUtils::normalize(100, 50, monitors);
        QCOMPARE(point.x, 200.0);
        QCOMPARE(point.y, 100.0);
        QCOMPARE(point.monitorId, QStringLiteral("eDP-1"));
    }

    void normalize_picksContainingMonitor()
    {
        // Left 1920x1080 at scale 1, right 2560x1440 physical at scale 2 (1280x720 logical)
        const QVector<MonitorDescriptor> monitors{
            makeMonitor(QStringLiteral("DP-1"), 0, 0, 1920, 1080, 1.0),
            makeMonitor(QStringLiteral("DP-2"), 1920, 0, 2560, 1440, 2.0),
        };

        const CoordinateUtils::NormalizedPoint left = CoordinateUtils::normalize(1919, 10, monitors);
        QCOMPARE(left.monitorId, QStringLiteral("DP-1"));
        QCOMPARE(left.x, 1919.0);

        const CoordinateUtils::NormalizedPoint right = CoordinateUtils::normalize(1920 + 100, 10, monitors);
        QCOMPARE(right.monitorId, QStringLiteral("DP-2"));
        QCOMPARE(right.x, 1920.0 + 200.0);
        QCOMPARE(right.y, 20.0);
    }

    void normalize_clampsToNearestMonitor()
    {
        const QVector<MonitorDescriptor> monitors{
            makeMonitor(QStringLiteral("DP-1"), 0, 0, 1920, 1080, 1.0),
            makeMonitor(QStringLiteral("DP-2"), 1920, 0, 1920, 1080, 1.0),
        };

        // Below DP-2
        const CoordinateUtils::NormalizedPoint below = CoordinateUtils::normalize(2500, 5000, monitors);
        QCOMPARE(below.monitorId, QStringLiteral("DP-2"));
        QCOMPARE(below.x, 2500.0);
        QCOMPARE(below.y, 1079.0);

        // Left of everything
        const CoordinateUtils::NormalizedPoint left = CoordinateUtils::normalize(-40, 300, monitors);
        QCOMPARE(left.monitorId, QStringLiteral("DP-1"));
        QCOMPARE(left.x, 0.0);
        QCOMPARE(left.y, 300.0);
    }

    void normalize_noMonitorsPassesThrough()
    {
        const CoordinateUtils::NormalizedPoint point = CoordinateUtils::normalize(12.5, -3, {});
        QCOMPARE(point.x, 12.5);
        QCOMPARE(point.y, -3.0);
        QVERIFY(point.monitorId.isEmpty());
    }

    void monitorIndex_emptyListIsMinusOne()
    {
        QCOMPARE(CoordinateUtils::monitorIndexForLogical(QPointF(0, 0), {}), -1);
        QCOMPARE(CoordinateUtils::monitorIndexForPhysical(QPointF(0, 0), {}), -1);
    }

    void monitorIndex_boundaryIsHalfOpen()
    {
        const QVector<MonitorDescriptor> monitors{
            makeMonitor(QStringLiteral("DP-1"), 0, 0, 1920, 1080, 1.0),
            makeMonitor(QStringLiteral("DP-2"), 1920, 0, 1920, 1080, 1.0),
        };
        QCOMPARE(CoordinateUtils::monitorIndexForLogical(QPointF(1920, 0), monitors), 1);
        QCOMPARE(CoordinateUtils::monitorIndexForLogical(QPointF(1919.9, 0), monitors), 0);
    }

    void physicalToLogical_roundTripsPoints()
    {
        const MonitorDescriptor monitor = makeMonitor(QStringLiteral("DP-3"), 1920, 0, 3840, 2160, 1.5);
        const QPointF logical(2100, 400);
        const QPointF physical = CoordinateUtils::logicalToPhysical(logical, monitor);
        QCOMPARE(physical, QPointF(1920 + 180 * 1.5, 600));
        QCOMPARE(CoordinateUtils::physicalToLogical(physical, monitor), logical);
    }

    void physicalToLogical_rectNeverShrinksCoverage()
    {
        const MonitorDescriptor monitor = makeMonitor(QStringLiteral("DP-1"), 0, 0, 3000, 2000, 2.0);

        const QRect logical = CoordinateUtils::physicalToLogical(QRect(460, 435, 15, 80), monitor);
        QCOMPARE(logical.topLeft(), QPoint(230, 217));
        QCOMPARE(logical.width(), 8);
        QCOMPARE(logical.height(), 40);

        // Sub-pixel rects still get a window
        const QRect tiny = CoordinateUtils::physicalToLogical(QRect(10, 10, 1, 1), monitor);
        QCOMPARE(tiny.size(), QSize(1, 1));
    }
};

QTEST_GUILESS_MAIN(TestCoordinateUtils)
#include "test_coordinate_utils.moc"
