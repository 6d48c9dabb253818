// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for DragSense
 *
 * This file defines Qt logging categories that enable runtime filtering
 * of log messages. Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcCore) << "Debug message";
 *   qCWarning(lcSensor) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="dragsense.*=true"                  # Enable all
 *   QT_LOGGING_RULES="dragsense.*.debug=false"           # Disable debug only
 *   QT_LOGGING_RULES="dragsense.core.pointer=true"       # Enable pointer hook only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (per-sample pointer data, window moves)
 *   qCInfo     - Significant operational events (monitor start/stop, episode open/close)
 *   qCWarning  - Recoverable errors, invalid input, dropped callbacks
 *   qCCritical - System failures preventing normal operation
 *
 * The sensor helper logs to stderr only; its stdout carries protocol lines.
 */

namespace DragSense {

// Core module - pointer hook, geometry, grid planning, episodes, event bus
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcScreen)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPointer)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcKeyboard)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcGrid)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcEpisode)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcBus)

// Sensor module - sensor windows, backends, color sampling
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSensor)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcColor)

// Helper process
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcHelper)

// Daemon and D-Bus
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings loading/saving
DRAGSENSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace DragSense
