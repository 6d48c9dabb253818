// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace DragSense {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "dragsense.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScreen, "dragsense.core.screen", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPointer, "dragsense.core.pointer", QtInfoMsg)
Q_LOGGING_CATEGORY(lcKeyboard, "dragsense.core.keyboard", QtInfoMsg)
Q_LOGGING_CATEGORY(lcGrid, "dragsense.core.grid", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEpisode, "dragsense.core.episode", QtInfoMsg)
Q_LOGGING_CATEGORY(lcBus, "dragsense.core.bus", QtInfoMsg)

// Sensor module categories
Q_LOGGING_CATEGORY(lcSensor, "dragsense.sensor", QtInfoMsg)
Q_LOGGING_CATEGORY(lcColor, "dragsense.sensor.color", QtInfoMsg)

// Helper process category
Q_LOGGING_CATEGORY(lcHelper, "dragsense.helper", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "dragsense.daemon", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDbus, "dragsense.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "dragsense.config", QtInfoMsg)

} // namespace DragSense
