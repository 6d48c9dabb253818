// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include <QString>

namespace DragSense {

/**
 * @brief Session and OS facts the monitors branch on
 */
namespace Platform {

enum class Session {
    X11,
    Wayland,
    Unknown
};

/**
 * @brief Session type of the current desktop
 *
 * WAYLAND_DISPLAY and XDG_SESSION_TYPE win over the Qt platform plugin, so a
 * helper forced onto xcb inside a Wayland session still reports Wayland.
 */
DRAGSENSE_EXPORT Session session();

DRAGSENSE_EXPORT bool isWayland();

/**
 * @brief Whether an X server is reachable (native X11 or XWayland)
 *
 * The global pointer hook needs one even in a Wayland session.
 */
DRAGSENSE_EXPORT bool hasXDisplay();

/**
 * @brief "x11", "wayland" or "unknown"
 */
DRAGSENSE_EXPORT QString sessionName();

/**
 * @brief Tag carried in the platform field of every event
 * @return Kernel type in lower case ("linux", "freebsd", ...)
 */
DRAGSENSE_EXPORT QString osName();

/**
 * @brief LayerShellQt was available at build time
 */
DRAGSENSE_EXPORT bool hasLayerShell();

/**
 * @brief Sensor windows can be put at absolute desktop positions
 *
 * X11 uses override-redirect windows; Wayland needs layer-shell.
 */
DRAGSENSE_EXPORT bool canPlaceSensorWindows();

} // namespace Platform

} // namespace DragSense
