// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keymapping.h"

#include <xkbcommon/xkbcommon.h>

#include <array>

namespace DragSense {

namespace KeyMapping {

namespace {

struct KeyEntry
{
    xkb_keysym_t keysym;
    int code;
    QLatin1String name;
};

constexpr std::array<KeyEntry, 48> KeyTable{{
    {XKB_KEY_BackSpace, 8, QLatin1String("Backspace")},
    {XKB_KEY_Tab, 9, QLatin1String("Tab")},
    {XKB_KEY_ISO_Left_Tab, 9, QLatin1String("Tab")},
    {XKB_KEY_Return, 13, QLatin1String("Return")},
    {XKB_KEY_KP_Enter, 13, QLatin1String("Return")},
    {XKB_KEY_Shift_L, 16, QLatin1String("ShiftLeft")},
    {XKB_KEY_Shift_R, 16, QLatin1String("ShiftRight")},
    {XKB_KEY_Control_L, 17, QLatin1String("ControlLeft")},
    {XKB_KEY_Control_R, 17, QLatin1String("ControlRight")},
    {XKB_KEY_Alt_L, 18, QLatin1String("Alt")},
    {XKB_KEY_Pause, 19, QLatin1String("Pause")},
    {XKB_KEY_Caps_Lock, 20, QLatin1String("CapsLock")},
    {XKB_KEY_Escape, 27, QLatin1String("Escape")},
    {XKB_KEY_space, 32, QLatin1String("Space")},
    {XKB_KEY_Prior, 33, QLatin1String("PageUp")},
    {XKB_KEY_Next, 34, QLatin1String("PageDown")},
    {XKB_KEY_End, 35, QLatin1String("End")},
    {XKB_KEY_Home, 36, QLatin1String("Home")},
    {XKB_KEY_Left, 37, QLatin1String("LeftArrow")},
    {XKB_KEY_Up, 38, QLatin1String("UpArrow")},
    {XKB_KEY_Right, 39, QLatin1String("RightArrow")},
    {XKB_KEY_Down, 40, QLatin1String("DownArrow")},
    {XKB_KEY_Insert, 45, QLatin1String("Insert")},
    {XKB_KEY_Delete, 46, QLatin1String("Delete")},
    {XKB_KEY_Super_L, 91, QLatin1String("MetaLeft")},
    {XKB_KEY_Super_R, 91, QLatin1String("MetaRight")},
    {XKB_KEY_KP_Multiply, 106, QLatin1String("Multiply")},
    {XKB_KEY_KP_Divide, 111, QLatin1String("Divide")},
    {XKB_KEY_F1, 112, QLatin1String("F1")},
    {XKB_KEY_F2, 113, QLatin1String("F2")},
    {XKB_KEY_F3, 114, QLatin1String("F3")},
    {XKB_KEY_F4, 115, QLatin1String("F4")},
    {XKB_KEY_F5, 116, QLatin1String("F5")},
    {XKB_KEY_F6, 117, QLatin1String("F6")},
    {XKB_KEY_F7, 118, QLatin1String("F7")},
    {XKB_KEY_F8, 119, QLatin1String("F8")},
    {XKB_KEY_F9, 120, QLatin1String("F9")},
    {XKB_KEY_F10, 121, QLatin1String("F10")},
    {XKB_KEY_F11, 122, QLatin1String("F11")},
    {XKB_KEY_F12, 123, QLatin1String("F12")},
    {XKB_KEY_Num_Lock, 144, QLatin1String("NumLock")},
    {XKB_KEY_Scroll_Lock, 145, QLatin1String("ScrollLock")},
    {XKB_KEY_Print, 154, QLatin1String("PrintScreen")},
    {XKB_KEY_Alt_R, 225, QLatin1String("AltGr")},
    {XKB_KEY_ISO_Level3_Shift, 225, QLatin1String("AltGr")},
    {XKB_KEY_Meta_L, 91, QLatin1String("MetaLeft")},
    {XKB_KEY_Meta_R, 91, QLatin1String("MetaRight")},
    {XKB_KEY_Menu, 93, QLatin1String("ContextMenu")},
}};

} // anonymous namespace

KeyIdentity identify(quint32 keysym, quint32 keycode)
{
    if (keysym == XKB_KEY_NoSymbol) {
        return KeyIdentity{static_cast<int>(keycode), QStringLiteral("Unknown(%1)").arg(keycode)};
    }

    if (keysym >= XKB_KEY_a && keysym <= XKB_KEY_z) {
        keysym = keysym - XKB_KEY_a + XKB_KEY_A;
    }
    if (keysym >= XKB_KEY_A && keysym <= XKB_KEY_Z) {
        return KeyIdentity{static_cast<int>(keysym), QString(QChar(static_cast<char16_t>(keysym)))};
    }
    if (keysym >= XKB_KEY_0 && keysym <= XKB_KEY_9) {
        return KeyIdentity{static_cast<int>(keysym), QStringLiteral("Num%1").arg(keysym - XKB_KEY_0)};
    }

    for (const KeyEntry& entry : KeyTable) {
        if (entry.keysym == keysym) {
            return KeyIdentity{entry.code, QString(entry.name)};
        }
    }

    char name[64];
    if (xkb_keysym_get_name(keysym, name, sizeof(name)) > 0) {
        return KeyIdentity{0, QString::fromLatin1(name)};
    }
    return KeyIdentity{static_cast<int>(keycode), QStringLiteral("Unknown(%1)").arg(keycode)};
}

} // namespace KeyMapping

} // namespace DragSense
