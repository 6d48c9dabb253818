// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "types.h"
#include <QPoint>
#include <QRect>
#include <QString>
#include <QVector>
#include <optional>

namespace DragSense {

/**
 * @brief Shape of the sensor window constellation around the pointer
 *
 * Two layouts are built in:
 * - SparseGrid: gridSize x gridSize cells of cellSize px, centers pitch px
 *   apart, with the center cell omitted (5x5 gives 24 windows)
 * - Frame: four strips (top, bottom, left, right) of stripLength x
 *   stripThickness px, each gap px away from the center
 */
struct DRAGSENSE_EXPORT GridLayout
{
    enum class Kind {
        SparseGrid,
        Frame
    };

    Kind kind = Kind::Frame;

    // SparseGrid
    int gridSize = 0;
    int cellSize = 0;
    int pitch = 0;

    // Frame
    int stripLength = 0;
    int stripThickness = 0;
    int gap = 0;

    /**
     * @brief Number of sensor windows every plan() for this layout returns
     */
    int windowCount() const;

    QString name() const;

    bool isValid() const;

    static GridLayout sparseGrid(int gridSize, int cellSize, int pitch);
    static GridLayout frame(int stripLength, int stripThickness, int gap);

    /// Built-in layout by name ("frame" or "grid") with default dimensions
    static std::optional<GridLayout> fromName(const QString& name);

    /// The layout used when nothing is configured
    static GridLayout defaultLayout();
};

/**
 * @brief Sensor window placement around a center point
 */
namespace SensorGrid {

/**
 * @brief Unclamped rectangles of @p layout around @p center
 *
 * Row-major order; for Frame the order is top, bottom, left, right.
 */
DRAGSENSE_EXPORT QVector<SensorWindowSpec> candidates(const QPoint& center, const GridLayout& layout);

/**
 * @brief Move (and if needed shrink) @p rect so it lies inside @p bounds
 *
 * X is corrected before Y. Never drops the rectangle.
 *
 * @param clamped Set to true when the rect had to change
 */
DRAGSENSE_EXPORT QRect clampInto(const QRect& rect, const QRect& bounds, bool* clamped);

/**
 * @brief Plan the sensor windows for one episode
 *
 * @param center Physical pointer position
 * @param monitor Monitor the pointer is on
 * @param layout Layout to apply
 * @return Exactly layout.windowCount() specs, each inside monitor.physicalBounds()
 */
DRAGSENSE_EXPORT QVector<SensorWindowSpec> plan(const QPoint& center, const MonitorDescriptor& monitor,
                                                const GridLayout& layout);

} // namespace SensorGrid

} // namespace DragSense
