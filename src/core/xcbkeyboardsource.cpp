// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "xcbkeyboardsource.h"
#include "constants.h"
#include "logging.h"

#include <xcb/xcb.h>
#include <xcb/xinput.h>
#include <xkbcommon/xkbcommon-x11.h>
#include <xkbcommon/xkbcommon.h>

#include <array>

namespace DragSense {

namespace {

struct ModifierName
{
    const char* xkbName;
    QLatin1String name;
};

const std::array<ModifierName, 4> ReportedModifiers{{
    {XKB_MOD_NAME_SHIFT, ModifierNames::Shift},
    {XKB_MOD_NAME_CTRL, ModifierNames::Control},
    {XKB_MOD_NAME_ALT, ModifierNames::Alt},
    {XKB_MOD_NAME_LOGO, ModifierNames::Meta},
}};

} // anonymous namespace

XcbKeyboardSource::XcbKeyboardSource(QObject* parent)
    : KeyboardSource(parent)
{
}

XcbKeyboardSource::~XcbKeyboardSource()
{
    shutdown();
}

OperationResult XcbKeyboardSource::install()
{
    const OperationResult opened = m_xinput.open(
        XCB_INPUT_XI_EVENT_MASK_RAW_KEY_PRESS | XCB_INPUT_XI_EVENT_MASK_RAW_KEY_RELEASE, QStringLiteral("keyboard"));
    if (!opened.ok()) {
        return opened;
    }

    QString keymapError;
    if (!loadKeymap(&keymapError)) {
        m_xinput.close();
        releaseKeymap();
        return OperationResult::failure(ErrorCode::PermissionDenied, keymapError);
    }

    const OperationResult started = m_xinput.start(
        [this](const xcb_generic_event_t* event) {
            handleEvent(event);
        },
        QStringLiteral("dragsense-keyboard-hook"));
    if (!started.ok()) {
        releaseKeymap();
    }
    return started;
}

void XcbKeyboardSource::uninstall()
{
    // Joins the reader thread before the state goes away
    m_xinput.close();
    releaseKeymap();
}

bool XcbKeyboardSource::loadKeymap(QString* errorMessage)
{
    xcb_connection_t* connection = m_xinput.connection();
    if (!xkb_x11_setup_xkb_extension(connection, XKB_X11_MIN_MAJOR_XKB_VERSION, XKB_X11_MIN_MINOR_XKB_VERSION,
                                     XKB_X11_SETUP_XKB_EXTENSION_NO_FLAGS, nullptr, nullptr, nullptr, nullptr)) {
        *errorMessage = QStringLiteral("X server does not provide the XKB extension");
        return false;
    }

    const int32_t deviceId = xkb_x11_get_core_keyboard_device_id(connection);
    if (deviceId == -1) {
        *errorMessage = QStringLiteral("No core keyboard device");
        return false;
    }

    m_context = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    if (!m_context) {
        *errorMessage = QStringLiteral("Failed to create xkb context");
        return false;
    }
    m_keymap = xkb_x11_keymap_new_from_device(m_context, connection, deviceId, XKB_KEYMAP_COMPILE_NO_FLAGS);
    if (!m_keymap) {
        *errorMessage = QStringLiteral("Failed to read the keymap of keyboard device %1").arg(deviceId);
        return false;
    }
    m_state = xkb_x11_state_new_from_device(m_keymap, connection, deviceId);
    if (!m_state) {
        *errorMessage = QStringLiteral("Failed to read the state of keyboard device %1").arg(deviceId);
        return false;
    }
    qCDebug(lcKeyboard) << "Loaded keymap of device" << deviceId << "with" << xkb_keymap_num_layouts(m_keymap)
                        << "layouts";
    return true;
}

void XcbKeyboardSource::releaseKeymap()
{
    if (m_state) {
        xkb_state_unref(m_state);
        m_state = nullptr;
    }
    if (m_keymap) {
        xkb_keymap_unref(m_keymap);
        m_keymap = nullptr;
    }
    if (m_context) {
        xkb_context_unref(m_context);
        m_context = nullptr;
    }
}

quint32 XcbKeyboardSource::baseKeysym(quint32 keycode) const
{
    xkb_layout_index_t layout = xkb_state_key_get_layout(m_state, keycode);
    if (layout == XKB_LAYOUT_INVALID) {
        layout = 0;
    }
    const xkb_keysym_t* syms = nullptr;
    const int count = xkb_keymap_key_get_syms_by_level(m_keymap, keycode, layout, 0, &syms);
    return count > 0 ? syms[0] : XKB_KEY_NoSymbol;
}

QStringList XcbKeyboardSource::activeModifiers() const
{
    QStringList modifiers;
    for (const ModifierName& modifier : ReportedModifiers) {
        if (xkb_state_mod_name_is_active(m_state, modifier.xkbName, XKB_STATE_MODS_EFFECTIVE) > 0) {
            modifiers.append(modifier.name);
        }
    }
    return modifiers;
}

// Runs on the hook thread
void XcbKeyboardSource::handleEvent(const xcb_generic_event_t* event)
{
    const auto* generic = reinterpret_cast<const xcb_ge_generic_event_t*>(event);
    const bool press = generic->event_type == XCB_INPUT_RAW_KEY_PRESS;
    if (!press && generic->event_type != XCB_INPUT_RAW_KEY_RELEASE) {
        return;
    }

    const auto* raw = reinterpret_cast<const xcb_input_raw_key_press_event_t*>(event);
    const xkb_keycode_t keycode = raw->detail;

    KeySample sample;
    sample.action = press ? KeyAction::Press : KeyAction::Release;
    sample.keycode = keycode;
    sample.keysym = baseKeysym(keycode);
    // Modifiers as seen while the key is down, so Shift reports "shift" both ways
    if (press) {
        xkb_state_update_key(m_state, keycode, XKB_KEY_DOWN);
        sample.modifiers = activeModifiers();
    } else {
        sample.modifiers = activeModifiers();
        xkb_state_update_key(m_state, keycode, XKB_KEY_UP);
    }
    sample.timestamp = currentTimestamp();
    deliver(sample);
}

} // namespace DragSense
