// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include "constants.h"
#include "keymapping.h"
#include "platform.h"
#include <QDateTime>

namespace DragSense {

int buttonMaskBit(PointerButton button)
{
    switch (button) {
    case PointerButton::Left:
        return 1;
    case PointerButton::Middle:
        return 2;
    case PointerButton::Right:
        return 4;
    case PointerButton::None:
        break;
    }
    return 0;
}

double currentTimestamp()
{
    return QDateTime::currentMSecsSinceEpoch() / 1000.0;
}

QString pointerKindName(PointerKind kind)
{
    switch (kind) {
    case PointerKind::Move:
        return EventTypes::MouseMove;
    case PointerKind::Down:
        return EventTypes::MouseDown;
    case PointerKind::Up:
        return EventTypes::MouseUp;
    case PointerKind::Wheel:
        return EventTypes::Wheel;
    }
    return QString();
}

QString dragCallbackKindName(DragCallbackKind kind)
{
    switch (kind) {
    case DragCallbackKind::HoveredFile:
        return EventTypes::HoveredFile;
    case DragCallbackKind::DroppedFile:
        return EventTypes::DroppedFile;
    case DragCallbackKind::HoverCancelled:
        return EventTypes::HoverCancelled;
    }
    return QString();
}

std::optional<DragCallbackKind> dragCallbackKindFromName(const QString& name)
{
    if (name == EventTypes::HoveredFile) {
        return DragCallbackKind::HoveredFile;
    }
    if (name == EventTypes::DroppedFile) {
        return DragCallbackKind::DroppedFile;
    }
    if (name == EventTypes::HoverCancelled) {
        return DragCallbackKind::HoverCancelled;
    }
    return std::nullopt;
}

KeyboardEvent KeyboardEvent::fromSample(const KeySample& sample)
{
    const KeyMapping::KeyIdentity key = KeyMapping::identify(sample.keysym, sample.keycode);
    KeyboardEvent event;
    event.eventType = sample.action == KeyAction::Press ? EventTypes::KeyDown : EventTypes::KeyUp;
    event.keyCode = key.code;
    event.keyName = key.name;
    event.modifiers = sample.modifiers;
    event.timestamp = sample.timestamp;
    event.platform = Platform::osName();
    return event;
}

PointerEvent PointerEvent::fromSample(const PointerSample& sample)
{
    PointerEvent event;
    event.eventType = pointerKindName(sample.kind);
    event.x = sample.x;
    event.y = sample.y;
    event.button = static_cast<int>(sample.button);
    event.timestamp = sample.timestamp;
    event.platform = Platform::osName();
    return event;
}

DragEvent DragEvent::status(QLatin1String type, const QString& message)
{
    DragEvent event;
    event.eventType = type;
    // Status events reuse filePath for the human-readable reason
    event.filePath = message;
    event.timestamp = currentTimestamp();
    event.platform = Platform::osName();
    return event;
}

} // namespace DragSense
