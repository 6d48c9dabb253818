// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "types.h"
#include <QPointF>
#include <QRect>
#include <QVector>

namespace DragSense {

/**
 * @brief Logical/physical coordinate conversion across monitors
 *
 * All monitors share one desktop coordinate space whose origin is the
 * monitor origin; a logical offset from the origin multiplied by the
 * monitor's scale factor gives the physical offset.
 */
namespace CoordinateUtils {

/**
 * @brief Physical position of a raw pointer sample
 */
struct DRAGSENSE_EXPORT NormalizedPoint
{
    qreal x = 0;
    qreal y = 0;
    QString monitorId;

    QPointF toPointF() const
    {
        return QPointF(x, y);
    }
};

/**
 * @brief Convert a logical desktop point into physical pixels
 *
 * Picks the monitor whose logical bounds contain the point. When none does
 * (stale coordinates around a hot-plug), the point is clamped to the nearest
 * monitor's edge. With no monitors at all the point passes through unchanged.
 *
 * @param rawX Logical X
 * @param rawY Logical Y
 * @param monitors Current monitor snapshot
 */
DRAGSENSE_EXPORT NormalizedPoint normalize(qreal rawX, qreal rawY, const QVector<MonitorDescriptor>& monitors);

/**
 * @brief Monitor whose logical bounds contain @p logical, or the nearest one
 * @return Index into @p monitors, -1 when the list is empty
 */
DRAGSENSE_EXPORT int monitorIndexForLogical(const QPointF& logical, const QVector<MonitorDescriptor>& monitors);

/**
 * @brief Monitor whose physical bounds contain @p physical, or the nearest one
 * @return Index into @p monitors, -1 when the list is empty
 */
DRAGSENSE_EXPORT int monitorIndexForPhysical(const QPointF& physical, const QVector<MonitorDescriptor>& monitors);

DRAGSENSE_EXPORT QPointF logicalToPhysical(const QPointF& logical, const MonitorDescriptor& monitor);
DRAGSENSE_EXPORT QPointF physicalToLogical(const QPointF& physical, const MonitorDescriptor& monitor);

/**
 * @brief Logical geometry for a physical rect on @p monitor
 *
 * Size is rounded up so the logical window never covers fewer physical
 * pixels than planned.
 */
DRAGSENSE_EXPORT QRect physicalToLogical(const QRect& physical, const MonitorDescriptor& monitor);

} // namespace CoordinateUtils

} // namespace DragSense
