// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace DragSense {

/**
 * @brief Structural constants for core module files that can't depend on config
 *
 * User-configurable values live in dragsense.kcfg and are exposed through
 * ConfigDefaults. The values here mirror those defaults for code paths
 * (tests, the helper's fallback layout) that run without a config object.
 */
namespace Defaults {
// Four-window frame layout
constexpr int FrameStripLength = 80;
constexpr int FrameStripThickness = 15;
constexpr int FrameGap = 50;

// Sparse grid layout (N x N, center cell omitted)
constexpr int GridSize = 5;
constexpr int GridCellSize = 30;
constexpr int GridPitch = 60;

// Left | Middle | Right
constexpr int ButtonMask = 7;

// Time the helper gets to acknowledge a shutdown before it is terminated
constexpr int HelperShutdownTimeoutMs = 1000;
}

/**
 * @brief Event type names carried in PointerEvent/DragEvent/KeyboardEvent payloads
 */
namespace EventTypes {
// Pointer
inline constexpr QLatin1String MouseMove{"mousemove"};
inline constexpr QLatin1String MouseDown{"mousedown"};
inline constexpr QLatin1String MouseUp{"mouseup"};
inline constexpr QLatin1String Wheel{"wheel"};

// Keyboard
inline constexpr QLatin1String KeyDown{"keydown"};
inline constexpr QLatin1String KeyUp{"keyup"};

// Drag
inline constexpr QLatin1String HoveredFile{"hovered_file"};
inline constexpr QLatin1String DroppedFile{"dropped_file"};
inline constexpr QLatin1String HoverCancelled{"hovered_file_cancelled"};

// Drag monitor status
inline constexpr QLatin1String WindowCreationFailed{"window_creation_failed"};
inline constexpr QLatin1String MonitorTerminated{"monitor_terminated"};

// Helper control lines
inline constexpr QLatin1String Ready{"ready"};
inline constexpr QLatin1String Error{"error"};
inline constexpr QLatin1String ShutdownAck{"shutdown_ack"};
}

/**
 * @brief Modifier names reported in KeyboardEvent::modifiers, in reporting order
 */
namespace ModifierNames {
inline constexpr QLatin1String Shift{"shift"};
inline constexpr QLatin1String Control{"control"};
inline constexpr QLatin1String Alt{"alt"};
inline constexpr QLatin1String Meta{"meta"};
}

/**
 * @brief JSON keys for the helper line protocol
 */
namespace JsonKeys {
inline constexpr QLatin1String EventType{"eventType"};
inline constexpr QLatin1String FilePath{"filePath"};
inline constexpr QLatin1String X{"x"};
inline constexpr QLatin1String Y{"y"};
inline constexpr QLatin1String Timestamp{"timestamp"};
inline constexpr QLatin1String Platform{"platform"};
inline constexpr QLatin1String WindowId{"windowId"};
inline constexpr QLatin1String Code{"code"};
inline constexpr QLatin1String Message{"message"};
inline constexpr QLatin1String Command{"command"};
}

/**
 * @brief Commands the host writes to the helper's stdin
 */
namespace HelperCommands {
inline constexpr QLatin1String Move{"move"};
inline constexpr QLatin1String Shutdown{"shutdown"};
}

/**
 * @brief Helper command line options carrying the sensor layout
 */
namespace HelperOptions {
inline constexpr QLatin1String Layout{"layout"};
inline constexpr QLatin1String GridSize{"grid-size"};
inline constexpr QLatin1String CellSize{"cell"};
inline constexpr QLatin1String Pitch{"pitch"};
inline constexpr QLatin1String StripLength{"strip-length"};
inline constexpr QLatin1String StripThickness{"thickness"};
inline constexpr QLatin1String Gap{"gap"};
}

/**
 * @brief Names of the built-in sensor layouts
 */
namespace LayoutNames {
inline constexpr QLatin1String Frame{"frame"};
inline constexpr QLatin1String SparseGrid{"grid"};
}

/**
 * @brief D-Bus service constants
 */
namespace DBus {
inline constexpr QLatin1String ServiceName{"org.dragsense.daemon"};
inline constexpr QLatin1String ObjectPath{"/Monitor"};

namespace Interface {
inline constexpr QLatin1String Monitor{"org.dragsense.Monitor"};
}
}

/**
 * @brief Executable name of the sensor helper, looked up next to the daemon and in $PATH
 */
inline constexpr QLatin1String HelperExecutableName{"dragsense-sensor-helper"};

} // namespace DragSense
