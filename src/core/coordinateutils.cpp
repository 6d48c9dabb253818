// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "coordinateutils.h"
#include "logging.h"
#include <QtMath>
#include <limits>

namespace DragSense {

namespace CoordinateUtils {

namespace {

// Half-open containment: [left, left + width) x [top, top + height)
bool containsHalfOpen(const QRectF& rect, const QPointF& point)
{
    return point.x() >= rect.left() && point.x() < rect.left() + rect.width() && point.y() >= rect.top()
        && point.y() < rect.top() + rect.height();
}

qreal squaredDistance(const QRectF& rect, const QPointF& point)
{
    const qreal dx = qMax(qMax(rect.left() - point.x(), 0.0), point.x() - (rect.left() + rect.width()));
    const qreal dy = qMax(qMax(rect.top() - point.y(), 0.0), point.y() - (rect.top() + rect.height()));
    return dx * dx + dy * dy;
}

template <typename BoundsFn>
int pickMonitor(const QPointF& point, const QVector<MonitorDescriptor>& monitors, BoundsFn bounds)
{
    int nearest = -1;
    qreal nearestDistance = std::numeric_limits<qreal>::max();
    for (int i = 0; i < monitors.size(); ++i) {
        const QRectF rect = bounds(monitors.at(i));
        if (containsHalfOpen(rect, point)) {
            return i;
        }
        const qreal distance = squaredDistance(rect, point);
        if (distance < nearestDistance) {
            nearestDistance = distance;
            nearest = i;
        }
    }
    return nearest;
}

} // anonymous namespace

int monitorIndexForLogical(const QPointF& logical, const QVector<MonitorDescriptor>& monitors)
{
    return pickMonitor(logical, monitors, [](const MonitorDescriptor& m) {
        return m.logicalBounds();
    });
}

int monitorIndexForPhysical(const QPointF& physical, const QVector<MonitorDescriptor>& monitors)
{
    return pickMonitor(physical, monitors, [](const MonitorDescriptor& m) {
        return QRectF(m.physicalBounds());
    });
}

QPointF logicalToPhysical(const QPointF& logical, const MonitorDescriptor& monitor)
{
    return QPointF(monitor.originX + (logical.x() - monitor.originX) * monitor.scaleFactor,
                   monitor.originY + (logical.y() - monitor.originY) * monitor.scaleFactor);
}

QPointF physicalToLogical(const QPointF& physical, const MonitorDescriptor& monitor)
{
    return QPointF(monitor.originX + (physical.x() - monitor.originX) / monitor.scaleFactor,
                   monitor.originY + (physical.y() - monitor.originY) / monitor.scaleFactor);
}

QRect physicalToLogical(const QRect& physical, const MonitorDescriptor& monitor)
{
    const QPointF topLeft = physicalToLogical(QPointF(physical.topLeft()), monitor);
    const int width = qCeil(physical.width() / monitor.scaleFactor);
    const int height = qCeil(physical.height() / monitor.scaleFactor);
    return QRect(qFloor(topLeft.x()), qFloor(topLeft.y()), qMax(1, width), qMax(1, height));
}

NormalizedPoint normalize(qreal rawX, qreal rawY, const QVector<MonitorDescriptor>& monitors)
{
    const int index = monitorIndexForLogical(QPointF(rawX, rawY), monitors);
    if (index < 0) {
        return NormalizedPoint{rawX, rawY, QString()};
    }

    const MonitorDescriptor& monitor = monitors.at(index);
    const QRect physicalBounds = monitor.physicalBounds();
    QPointF physical = logicalToPhysical(QPointF(rawX, rawY), monitor);

    // Outside every monitor: snap onto the nearest one's edge
    const qreal maxX = physicalBounds.left() + physicalBounds.width() - 1;
    const qreal maxY = physicalBounds.top() + physicalBounds.height() - 1;
    if (physical.x() < physicalBounds.left() || physical.x() > maxX || physical.y() < physicalBounds.top()
        || physical.y() > maxY) {
        qCDebug(lcCore) << "Point" << rawX << rawY << "outside all monitors, clamping to" << monitor.id;
        physical.setX(qBound(qreal(physicalBounds.left()), physical.x(), maxX));
        physical.setY(qBound(qreal(physicalBounds.top()), physical.y(), maxY));
    }

    return NormalizedPoint{physical.x(), physical.y(), monitor.id};
}

} // namespace CoordinateUtils

} // namespace DragSense
