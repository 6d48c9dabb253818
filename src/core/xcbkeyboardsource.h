// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "keyboardsource.h"
#include "xinputconnection.h"

struct xkb_context;
struct xkb_keymap;
struct xkb_state;

namespace DragSense {

/**
 * @brief Global keyboard hook built on XInput2 raw key events
 *
 * Selects RawKeyPress/RawKeyRelease on the root window through a private X
 * connection. The core keyboard's keymap and current modifier state are
 * read once through xkbcommon-x11; after that the state follows the raw key
 * stream, so modifiers are tracked without focus.
 *
 * Keys report the keysym of their base level in the active layout, so
 * Shift+a and a both identify the "A" key.
 */
class DRAGSENSE_EXPORT XcbKeyboardSource : public KeyboardSource
{
    Q_OBJECT

public:
    explicit XcbKeyboardSource(QObject* parent = nullptr);
    ~XcbKeyboardSource() override;

protected:
    OperationResult install() override;
    void uninstall() override;

private:
    bool loadKeymap(QString* errorMessage);
    void releaseKeymap();
    void handleEvent(const xcb_generic_event_t* event);
    quint32 baseKeysym(quint32 keycode) const;
    QStringList activeModifiers() const;

    XInputConnection m_xinput;
    xkb_context* m_context = nullptr;
    xkb_keymap* m_keymap = nullptr;
    xkb_state* m_state = nullptr;
};

} // namespace DragSense
