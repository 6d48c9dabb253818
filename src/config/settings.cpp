// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <KSharedConfig>

namespace DragSense {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

static const QString kConfigName = QStringLiteral("dragsenserc");

Settings::Settings(QObject* parent)
    : QObject(parent)
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::setLayoutName(const QString& name)
{
    if (!GridLayout::fromName(name)) {
        qCWarning(lcConfig) << "Unknown sensor layout" << name;
        return;
    }
    if (m_layoutName != name) {
        m_layoutName = name;
        Q_EMIT layoutNameChanged();
        Q_EMIT settingsChanged();
    }
}

SETTINGS_SETTER_CLAMPED(GridSize, m_gridSize, gridSizeChanged, 3, 15)
SETTINGS_SETTER_CLAMPED(GridCellSize, m_gridCellSize, gridCellSizeChanged, 4, 500)
SETTINGS_SETTER_CLAMPED(GridPitch, m_gridPitch, gridPitchChanged, 4, 1000)
SETTINGS_SETTER_CLAMPED(FrameStripLength, m_frameStripLength, frameStripLengthChanged, 4, 1000)
SETTINGS_SETTER_CLAMPED(FrameStripThickness, m_frameStripThickness, frameStripThicknessChanged, 1, 500)
SETTINGS_SETTER_CLAMPED(FrameGap, m_frameGap, frameGapChanged, 0, 1000)
SETTINGS_SETTER_CLAMPED(ButtonMask, m_buttonMask, buttonMaskChanged, 1, Defaults::ButtonMask)
SETTINGS_SETTER(bool, ThemeSensorWindows, m_themeSensorWindows, themeSensorWindowsChanged)
SETTINGS_SETTER_CLAMPED(DropGraceMs, m_dropGraceMs, dropGraceMsChanged, 0, 5000)
SETTINGS_SETTER(const QString&, HelperPath, m_helperPath, helperPathChanged)
SETTINGS_SETTER_CLAMPED(HelperShutdownTimeoutMs, m_helperShutdownTimeoutMs, helperShutdownTimeoutMsChanged, 50, 30000)
SETTINGS_SETTER(bool, AutostartPointer, m_autostartPointer, autostartPointerChanged)
SETTINGS_SETTER(bool, AutostartKeyboard, m_autostartKeyboard, autostartKeyboardChanged)
SETTINGS_SETTER(bool, AutostartDrag, m_autostartDrag, autostartDragChanged)

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

GridLayout Settings::gridLayout() const
{
    const std::optional<GridLayout> named = GridLayout::fromName(m_layoutName);
    const GridLayout::Kind kind = named ? named->kind : GridLayout::defaultLayout().kind;

    GridLayout layout = kind == GridLayout::Kind::SparseGrid
        ? GridLayout::sparseGrid(m_gridSize, m_gridCellSize, m_gridPitch)
        : GridLayout::frame(m_frameStripLength, m_frameStripThickness, m_frameGap);
    if (!layout.isValid()) {
        qCWarning(lcConfig) << "Configured" << layout.name() << "layout is invalid, using the default frame";
        layout = GridLayout::defaultLayout();
    }
    return layout;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Load / Save
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    auto config = KSharedConfig::openConfig(kConfigName);

    // Force re-read from disk - KSharedConfig caches in memory, so edits made
    // by another process are only seen after invalidating the cache
    config->reparseConfiguration();

    KConfigGroup sensors = config->group(QStringLiteral("Sensors"));
    KConfigGroup helper = config->group(QStringLiteral("Helper"));
    KConfigGroup daemon = config->group(QStringLiteral("Daemon"));

    // Sensors (defaults from .kcfg via ConfigDefaults)
    m_layoutName = sensors.readEntry(QLatin1String("Layout"), ConfigDefaults::layout());
    if (!GridLayout::fromName(m_layoutName)) {
        qCWarning(lcConfig) << "Unknown sensor layout" << m_layoutName << "using default";
        m_layoutName = ConfigDefaults::layout();
    }
    m_gridSize = readValidatedInt(sensors, "GridSize", ConfigDefaults::gridSize(), 3, 15, "grid size");
    if (m_gridSize % 2 == 0) {
        qCWarning(lcConfig) << "Grid size must be odd, got" << m_gridSize << "using default";
        m_gridSize = ConfigDefaults::gridSize();
    }
    m_gridCellSize = readValidatedInt(sensors, "GridCellSize", ConfigDefaults::gridCellSize(), 4, 500, "grid cell size");
    m_gridPitch = readValidatedInt(sensors, "GridPitch", ConfigDefaults::gridPitch(), 4, 1000, "grid pitch");
    m_frameStripLength = readValidatedInt(sensors, "FrameStripLength", ConfigDefaults::frameStripLength(), 4, 1000,
                                          "frame strip length");
    m_frameStripThickness = readValidatedInt(sensors, "FrameStripThickness", ConfigDefaults::frameStripThickness(),
                                             1, 500, "frame strip thickness");
    m_frameGap = readValidatedInt(sensors, "FrameGap", ConfigDefaults::frameGap(), 0, 1000, "frame gap");
    m_buttonMask = readValidatedInt(sensors, "ButtonMask", ConfigDefaults::buttonMask(), 1, Defaults::ButtonMask,
                                    "button mask");
    m_themeSensorWindows = sensors.readEntry(QLatin1String("ThemeSensorWindows"), ConfigDefaults::themeSensorWindows());
    m_dropGraceMs = readValidatedInt(sensors, "DropGraceMs", ConfigDefaults::dropGraceMs(), 0, 5000, "drop grace");

    // Helper
    m_helperPath = helper.readEntry(QLatin1String("Path"), ConfigDefaults::helperPath());
    m_helperShutdownTimeoutMs = readValidatedInt(helper, "ShutdownTimeoutMs", ConfigDefaults::helperShutdownTimeoutMs(),
                                                 50, 30000, "helper shutdown timeout");

    // Daemon
    m_autostartPointer = daemon.readEntry(QLatin1String("AutostartPointer"), ConfigDefaults::autostartPointer());
    m_autostartKeyboard = daemon.readEntry(QLatin1String("AutostartKeyboard"), ConfigDefaults::autostartKeyboard());
    m_autostartDrag = daemon.readEntry(QLatin1String("AutostartDrag"), ConfigDefaults::autostartDrag());

    qCDebug(lcConfig) << "Loaded settings: layout=" << m_layoutName << "buttonMask=" << m_buttonMask
                      << "helper=" << (m_helperPath.isEmpty() ? QStringLiteral("<auto>") : m_helperPath);
    Q_EMIT settingsChanged();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(kConfigName);
    KConfigGroup sensors = config->group(QStringLiteral("Sensors"));
    KConfigGroup helper = config->group(QStringLiteral("Helper"));
    KConfigGroup daemon = config->group(QStringLiteral("Daemon"));

    // Sensors
    sensors.writeEntry(QLatin1String("Layout"), m_layoutName);
    sensors.writeEntry(QLatin1String("GridSize"), m_gridSize);
    sensors.writeEntry(QLatin1String("GridCellSize"), m_gridCellSize);
    sensors.writeEntry(QLatin1String("GridPitch"), m_gridPitch);
    sensors.writeEntry(QLatin1String("FrameStripLength"), m_frameStripLength);
    sensors.writeEntry(QLatin1String("FrameStripThickness"), m_frameStripThickness);
    sensors.writeEntry(QLatin1String("FrameGap"), m_frameGap);
    sensors.writeEntry(QLatin1String("ButtonMask"), m_buttonMask);
    sensors.writeEntry(QLatin1String("ThemeSensorWindows"), m_themeSensorWindows);
    sensors.writeEntry(QLatin1String("DropGraceMs"), m_dropGraceMs);

    // Helper
    helper.writeEntry(QLatin1String("Path"), m_helperPath);
    helper.writeEntry(QLatin1String("ShutdownTimeoutMs"), m_helperShutdownTimeoutMs);

    // Daemon
    daemon.writeEntry(QLatin1String("AutostartPointer"), m_autostartPointer);
    daemon.writeEntry(QLatin1String("AutostartKeyboard"), m_autostartKeyboard);
    daemon.writeEntry(QLatin1String("AutostartDrag"), m_autostartDrag);

    config->sync();
}

void Settings::reset()
{
    // Delete all setting groups (load() will use ConfigDefaults for missing keys)
    auto config = KSharedConfig::openConfig(kConfigName);
    const QStringList groups = {QStringLiteral("Sensors"), QStringLiteral("Helper"), QStringLiteral("Daemon")};
    for (const QString& groupName : groups) {
        config->deleteGroup(groupName);
    }
    config->sync();

    load();

    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace DragSense
