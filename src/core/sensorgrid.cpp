// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sensorgrid.h"
#include "constants.h"
#include "logging.h"

namespace DragSense {

// ═══════════════════════════════════════════════════════════════════════════════
// GridLayout
// ═══════════════════════════════════════════════════════════════════════════════

int GridLayout::windowCount() const
{
    switch (kind) {
    case Kind::SparseGrid:
        return gridSize * gridSize - 1;
    case Kind::Frame:
        return 4;
    }
    return 0;
}

QString GridLayout::name() const
{
    return kind == Kind::Frame ? QString(LayoutNames::Frame) : QString(LayoutNames::SparseGrid);
}

bool GridLayout::isValid() const
{
    switch (kind) {
    case Kind::SparseGrid:
        // Odd size so the center cell is well defined; cells must not overlap
        return gridSize >= 3 && (gridSize % 2) == 1 && cellSize > 0 && pitch >= cellSize;
    case Kind::Frame:
        return stripLength > 0 && stripThickness > 0 && gap >= 0;
    }
    return false;
}

GridLayout GridLayout::sparseGrid(int gridSize, int cellSize, int pitch)
{
    GridLayout layout;
    layout.kind = Kind::SparseGrid;
    layout.gridSize = gridSize;
    layout.cellSize = cellSize;
    layout.pitch = pitch;
    return layout;
}

GridLayout GridLayout::frame(int stripLength, int stripThickness, int gap)
{
    GridLayout layout;
    layout.kind = Kind::Frame;
    layout.stripLength = stripLength;
    layout.stripThickness = stripThickness;
    layout.gap = gap;
    return layout;
}

std::optional<GridLayout> GridLayout::fromName(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == LayoutNames::Frame || normalized == QLatin1String("4-frame")) {
        return frame(Defaults::FrameStripLength, Defaults::FrameStripThickness, Defaults::FrameGap);
    }
    if (normalized == LayoutNames::SparseGrid || normalized == QLatin1String("sparse-grid")) {
        return sparseGrid(Defaults::GridSize, Defaults::GridCellSize, Defaults::GridPitch);
    }
    return std::nullopt;
}

GridLayout GridLayout::defaultLayout()
{
    return frame(Defaults::FrameStripLength, Defaults::FrameStripThickness, Defaults::FrameGap);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Planning
// ═══════════════════════════════════════════════════════════════════════════════

namespace SensorGrid {

QVector<SensorWindowSpec> candidates(const QPoint& center, const GridLayout& layout)
{
    QVector<SensorWindowSpec> specs;
    specs.reserve(layout.windowCount());

    const int cx = center.x();
    const int cy = center.y();

    if (layout.kind == GridLayout::Kind::Frame) {
        const int length = layout.stripLength;
        const int thickness = layout.stripThickness;
        const int gap = layout.gap;
        // Slots of the surrounding 3x3 cells: QPoint(column, row)
        specs.append({QPoint(1, 0), QRect(cx - length / 2, cy - gap - thickness, length, thickness), false});
        specs.append({QPoint(1, 2), QRect(cx - length / 2, cy + gap, length, thickness), false});
        specs.append({QPoint(0, 1), QRect(cx - gap - thickness, cy - length / 2, thickness, length), false});
        specs.append({QPoint(2, 1), QRect(cx + gap, cy - length / 2, thickness, length), false});
        return specs;
    }

    const int half = layout.gridSize / 2;
    for (int row = 0; row < layout.gridSize; ++row) {
        for (int col = 0; col < layout.gridSize; ++col) {
            if (row == half && col == half) {
                continue;
            }
            const int cellCenterX = cx + (col - half) * layout.pitch;
            const int cellCenterY = cy + (row - half) * layout.pitch;
            const QRect rect(cellCenterX - layout.cellSize / 2, cellCenterY - layout.cellSize / 2, layout.cellSize,
                             layout.cellSize);
            specs.append({QPoint(col, row), rect, false});
        }
    }
    return specs;
}

QRect clampInto(const QRect& rect, const QRect& bounds, bool* clamped)
{
    QRect result = rect;
    bool changed = false;

    // X first
    if (result.width() > bounds.width()) {
        result.setWidth(bounds.width());
        changed = true;
    }
    if (result.x() < bounds.x()) {
        result.moveLeft(bounds.x());
        changed = true;
    } else if (result.x() + result.width() > bounds.x() + bounds.width()) {
        result.moveLeft(bounds.x() + bounds.width() - result.width());
        changed = true;
    }

    // Then Y, with X already settled
    if (result.height() > bounds.height()) {
        result.setHeight(bounds.height());
        changed = true;
    }
    if (result.y() < bounds.y()) {
        result.moveTop(bounds.y());
        changed = true;
    } else if (result.y() + result.height() > bounds.y() + bounds.height()) {
        result.moveTop(bounds.y() + bounds.height() - result.height());
        changed = true;
    }

    if (clamped) {
        *clamped = changed;
    }
    return result;
}

QVector<SensorWindowSpec> plan(const QPoint& center, const MonitorDescriptor& monitor, const GridLayout& layout)
{
    if (!layout.isValid()) {
        qCWarning(lcGrid) << "Refusing to plan invalid layout" << layout.name();
        return {};
    }

    QVector<SensorWindowSpec> specs = candidates(center, layout);
    const QRect bounds = monitor.physicalBounds();
    if (bounds.isEmpty()) {
        qCWarning(lcGrid) << "Monitor" << monitor.id << "has empty bounds, sensor windows left unclamped";
        return specs;
    }

    int clampedCount = 0;
    for (SensorWindowSpec& spec : specs) {
        spec.rect = clampInto(spec.rect, bounds, &spec.clamped);
        if (spec.clamped) {
            ++clampedCount;
        }
    }

    if (clampedCount > 0) {
        qCDebug(lcGrid) << "Clamped" << clampedCount << "of" << specs.size() << "sensor windows into" << monitor.id;
    }
    return specs;
}

} // namespace SensorGrid

} // namespace DragSense
