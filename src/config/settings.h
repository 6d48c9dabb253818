// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "../core/sensorgrid.h"
#include <KConfigGroup>
#include <QObject>
#include <QString>

namespace DragSense {

/**
 * @brief Persistent settings of the drag monitor (dragsenserc)
 *
 * Values are range-checked on load; out-of-range entries fall back to the
 * .kcfg defaults with a warning.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class DRAGSENSE_EXPORT Settings : public QObject
{
    Q_OBJECT

    // Sensors
    Q_PROPERTY(QString layoutName READ layoutName WRITE setLayoutName NOTIFY layoutNameChanged)
    Q_PROPERTY(int gridSize READ gridSize WRITE setGridSize NOTIFY gridSizeChanged)
    Q_PROPERTY(int gridCellSize READ gridCellSize WRITE setGridCellSize NOTIFY gridCellSizeChanged)
    Q_PROPERTY(int gridPitch READ gridPitch WRITE setGridPitch NOTIFY gridPitchChanged)
    Q_PROPERTY(int frameStripLength READ frameStripLength WRITE setFrameStripLength NOTIFY frameStripLengthChanged)
    Q_PROPERTY(int frameStripThickness READ frameStripThickness WRITE setFrameStripThickness NOTIFY
                   frameStripThicknessChanged)
    Q_PROPERTY(int frameGap READ frameGap WRITE setFrameGap NOTIFY frameGapChanged)
    Q_PROPERTY(int buttonMask READ buttonMask WRITE setButtonMask NOTIFY buttonMaskChanged)
    Q_PROPERTY(bool themeSensorWindows READ themeSensorWindows WRITE setThemeSensorWindows NOTIFY
                   themeSensorWindowsChanged)
    Q_PROPERTY(int dropGraceMs READ dropGraceMs WRITE setDropGraceMs NOTIFY dropGraceMsChanged)

    // Helper
    Q_PROPERTY(QString helperPath READ helperPath WRITE setHelperPath NOTIFY helperPathChanged)
    Q_PROPERTY(int helperShutdownTimeoutMs READ helperShutdownTimeoutMs WRITE setHelperShutdownTimeoutMs NOTIFY
                   helperShutdownTimeoutMsChanged)

    // Daemon
    Q_PROPERTY(bool autostartPointer READ autostartPointer WRITE setAutostartPointer NOTIFY autostartPointerChanged)
    Q_PROPERTY(bool autostartKeyboard READ autostartKeyboard WRITE setAutostartKeyboard NOTIFY autostartKeyboardChanged)
    Q_PROPERTY(bool autostartDrag READ autostartDrag WRITE setAutostartDrag NOTIFY autostartDragChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    QString layoutName() const
    {
        return m_layoutName;
    }
    void setLayoutName(const QString& name);

    int gridSize() const
    {
        return m_gridSize;
    }
    void setGridSize(int size);

    int gridCellSize() const
    {
        return m_gridCellSize;
    }
    void setGridCellSize(int size);

    int gridPitch() const
    {
        return m_gridPitch;
    }
    void setGridPitch(int pitch);

    int frameStripLength() const
    {
        return m_frameStripLength;
    }
    void setFrameStripLength(int length);

    int frameStripThickness() const
    {
        return m_frameStripThickness;
    }
    void setFrameStripThickness(int thickness);

    int frameGap() const
    {
        return m_frameGap;
    }
    void setFrameGap(int gap);

    int buttonMask() const
    {
        return m_buttonMask;
    }
    void setButtonMask(int mask);

    bool themeSensorWindows() const
    {
        return m_themeSensorWindows;
    }
    void setThemeSensorWindows(bool enabled);

    int dropGraceMs() const
    {
        return m_dropGraceMs;
    }
    void setDropGraceMs(int ms);

    QString helperPath() const
    {
        return m_helperPath;
    }
    void setHelperPath(const QString& path);

    int helperShutdownTimeoutMs() const
    {
        return m_helperShutdownTimeoutMs;
    }
    void setHelperShutdownTimeoutMs(int ms);

    bool autostartPointer() const
    {
        return m_autostartPointer;
    }
    void setAutostartPointer(bool enabled);

    bool autostartKeyboard() const
    {
        return m_autostartKeyboard;
    }
    void setAutostartKeyboard(bool enabled);

    bool autostartDrag() const
    {
        return m_autostartDrag;
    }
    void setAutostartDrag(bool enabled);

    /**
     * @brief Sensor layout built from the current values
     *
     * Falls back to the default frame when the stored combination is invalid
     * (e.g. an even grid size or a pitch smaller than the cell).
     */
    GridLayout gridLayout() const;

    void load();
    void save();
    void reset();

Q_SIGNALS:
    void settingsChanged();
    void layoutNameChanged();
    void gridSizeChanged();
    void gridCellSizeChanged();
    void gridPitchChanged();
    void frameStripLengthChanged();
    void frameStripThicknessChanged();
    void frameGapChanged();
    void buttonMaskChanged();
    void themeSensorWindowsChanged();
    void dropGraceMsChanged();
    void helperPathChanged();
    void helperShutdownTimeoutMsChanged();
    void autostartPointerChanged();
    void autostartKeyboardChanged();
    void autostartDragChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);

    QString m_layoutName;
    int m_gridSize;
    int m_gridCellSize;
    int m_gridPitch;
    int m_frameStripLength;
    int m_frameStripThickness;
    int m_frameGap;
    int m_buttonMask;
    bool m_themeSensorWindows;
    int m_dropGraceMs;

    QString m_helperPath;
    int m_helperShutdownTimeoutMs;

    bool m_autostartPointer;
    bool m_autostartKeyboard;
    bool m_autostartDrag;
};

} // namespace DragSense
