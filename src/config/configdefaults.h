// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsenseconfig.h"  // Generated from dragsense.kcfg via KConfigXT

#include <QString>

namespace DragSense {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated DragSenseConfig class. The .kcfg file is the
 * single source of truth for defaults; this class only exposes them.
 *
 * Usage:
 *   int size = ConfigDefaults::gridSize();  // Returns 5 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Sensor Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static QString layout() { return instance().defaultLayoutValue(); }
    static int gridSize() { return instance().defaultGridSizeValue(); }
    static int gridCellSize() { return instance().defaultGridCellSizeValue(); }
    static int gridPitch() { return instance().defaultGridPitchValue(); }
    static int frameStripLength() { return instance().defaultFrameStripLengthValue(); }
    static int frameStripThickness() { return instance().defaultFrameStripThicknessValue(); }
    static int frameGap() { return instance().defaultFrameGapValue(); }
    static int buttonMask() { return instance().defaultButtonMaskValue(); }
    static bool themeSensorWindows() { return instance().defaultThemeSensorWindowsValue(); }
    static int dropGraceMs() { return instance().defaultDropGraceMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Helper Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static QString helperPath() { return instance().defaultPathValue(); }
    static int helperShutdownTimeoutMs() { return instance().defaultShutdownTimeoutMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Daemon Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static bool autostartPointer() { return instance().defaultAutostartPointerValue(); }
    static bool autostartKeyboard() { return instance().defaultAutostartKeyboardValue(); }
    static bool autostartDrag() { return instance().defaultAutostartDragValue(); }

private:
    // Lazily-initialized singleton instance
    static DragSenseConfig& instance()
    {
        static DragSenseConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace DragSense
