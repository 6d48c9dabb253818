// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include <QMetaType>
#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>
#include <variant>

namespace DragSense {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types - value objects passed between the pointer hook, the windowing
// context and host listeners
// ═══════════════════════════════════════════════════════════════════════════════

enum class PointerButton {
    None = 0,
    Left = 1,
    Middle = 2,
    Right = 3
};

enum class PointerKind {
    Move,
    Down,
    Up,
    Wheel
};

/**
 * @brief Bit of @p button in a button mask (Left = 1, Middle = 2, Right = 4)
 */
DRAGSENSE_EXPORT int buttonMaskBit(PointerButton button);

/**
 * @brief Seconds since the Unix epoch, millisecond resolution
 */
DRAGSENSE_EXPORT double currentTimestamp();

/**
 * @brief One pointer input event as seen by the global hook
 *
 * Samples leaving a PointerSource carry logical desktop coordinates and an
 * empty monitorId. CoordinateUtils::normalize() turns them into physical
 * pixels and fills monitorId.
 */
struct DRAGSENSE_EXPORT PointerSample
{
    qreal x = 0;
    qreal y = 0;
    PointerButton button = PointerButton::None;
    PointerKind kind = PointerKind::Move;
    double timestamp = 0;       ///< Seconds since epoch
    QString monitorId;          ///< Empty for raw samples

    QPointF position() const
    {
        return QPointF(x, y);
    }
};

enum class KeyAction {
    Press,
    Release
};

/**
 * @brief One key transition as seen by the global keyboard hook
 */
struct DRAGSENSE_EXPORT KeySample
{
    KeyAction action = KeyAction::Press;
    quint32 keycode = 0;        ///< X keycode (evdev code + 8)
    quint32 keysym = 0;         ///< Base-level keysym of the key, 0 if unmapped
    QStringList modifiers;      ///< ModifierNames active while the key is down
    double timestamp = 0;       ///< Seconds since epoch
};

/**
 * @brief Snapshot of one monitor
 *
 * Origin is shared by the logical and physical coordinate spaces; the
 * logical extent is the physical extent divided by scaleFactor.
 */
struct DRAGSENSE_EXPORT MonitorDescriptor
{
    QString id;                 ///< Screen name, e.g. "DP-1"
    int originX = 0;
    int originY = 0;
    int widthPx = 0;
    int heightPx = 0;
    qreal scaleFactor = 1.0;

    QRect physicalBounds() const
    {
        return QRect(originX, originY, widthPx, heightPx);
    }

    QRectF logicalBounds() const
    {
        return QRectF(originX, originY, widthPx / scaleFactor, heightPx / scaleFactor);
    }

    bool isValid() const
    {
        return widthPx > 0 && heightPx > 0 && scaleFactor > 0;
    }
};

/**
 * @brief Placement of one sensor window in physical pixels
 *
 * The slot is the (row, col) cell of the layout; the center cell never
 * carries a window.
 */
struct DRAGSENSE_EXPORT SensorWindowSpec
{
    QPoint slot;                ///< x = column, y = row
    QRect rect;
    bool clamped = false;       ///< Rect was translated or shrunk to fit the monitor

    bool operator==(const SensorWindowSpec& other) const = default;
};

enum class DragCallbackKind {
    HoveredFile,
    DroppedFile,
    HoverCancelled
};

/**
 * @brief Drag notification raised by a sensor window
 */
struct DRAGSENSE_EXPORT DragCallbackEvent
{
    DragCallbackKind kind = DragCallbackKind::HoveredFile;
    std::optional<QString> filePath;    ///< Absent for HoverCancelled
    qreal x = 0;
    qreal y = 0;
    double timestamp = 0;
    QString originatingSensorWindow;
};

enum class EpisodeState {
    Idle,
    Armed,
    Active,     ///< Armed and at least one hover has been seen
    Closing
};

/**
 * @brief The interval between a qualifying press and its matching release
 */
struct DRAGSENSE_EXPORT DragEpisode
{
    quint64 episodeId = 0;
    PointerSample originPointer;
    QVector<SensorWindowSpec> sensorWindows;
    EpisodeState state = EpisodeState::Idle;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Host-facing payloads
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Pointer event delivered to host listeners
 *
 * eventType is one of "mousemove", "mousedown", "mouseup", "wheel".
 * button: 0 none, 1 left, 2 middle, 3 right.
 */
struct DRAGSENSE_EXPORT PointerEvent
{
    QString eventType;
    qreal x = 0;
    qreal y = 0;
    int button = 0;
    double timestamp = 0;
    QString platform;

    static PointerEvent fromSample(const PointerSample& sample);
};

/**
 * @brief Drag event delivered to host listeners
 *
 * eventType is one of "hovered_file", "dropped_file", "hovered_file_cancelled",
 * or a status type ("window_creation_failed", "monitor_terminated").
 */
struct DRAGSENSE_EXPORT DragEvent
{
    QString eventType;
    QString filePath;
    qreal x = 0;
    qreal y = 0;
    double timestamp = 0;
    QString platform;
    QString windowId;
    quint64 episodeId = 0;      ///< 0 for simulated and status events

    /**
     * @brief Status event without file or position
     */
    static DragEvent status(QLatin1String type, const QString& message);
};

/**
 * @brief Keyboard event delivered to host listeners
 *
 * eventType is "keydown" or "keyup". keyCode and keyName follow the DOM
 * legacy key codes ("A" is 65, "Return" 13); see KeyMapping.
 */
struct DRAGSENSE_EXPORT KeyboardEvent
{
    QString eventType;
    int keyCode = 0;
    QString keyName;
    QStringList modifiers;
    double timestamp = 0;
    QString platform;

    static KeyboardEvent fromSample(const KeySample& sample);
};

/**
 * @brief Tagged union carried by the event bus
 */
using MonitorEvent = std::variant<PointerEvent, DragEvent, KeyboardEvent>;

DRAGSENSE_EXPORT QString pointerKindName(PointerKind kind);
DRAGSENSE_EXPORT QString dragCallbackKindName(DragCallbackKind kind);
DRAGSENSE_EXPORT std::optional<DragCallbackKind> dragCallbackKindFromName(const QString& name);

} // namespace DragSense

Q_DECLARE_METATYPE(DragSense::PointerSample)
Q_DECLARE_METATYPE(DragSense::MonitorDescriptor)
Q_DECLARE_METATYPE(DragSense::DragCallbackEvent)
Q_DECLARE_METATYPE(DragSense::PointerEvent)
Q_DECLARE_METATYPE(DragSense::DragEvent)
Q_DECLARE_METATYPE(DragSense::KeySample)
Q_DECLARE_METATYPE(DragSense::KeyboardEvent)
