// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "pointersource.h"
#include "xinputconnection.h"

namespace DragSense {

/**
 * @brief Global pointer hook built on XInput2 raw events
 *
 * Opens a private X connection, selects RawMotion/RawButtonPress/
 * RawButtonRelease on the root window for all master devices and reads
 * them on a dedicated thread. Raw events are delivered regardless of
 * grabs and focus, so a drag started in any client is seen.
 *
 * Raw events carry no position; each one is paired with a QueryPointer on
 * the root window. The native position is mapped back to logical desktop
 * coordinates through the monitor snapshot.
 *
 * In a Wayland session this works through XWayland only while the pointer
 * is over X clients; without any X display install() fails with
 * PermissionDenied.
 */
class DRAGSENSE_EXPORT XcbPointerSource : public PointerSource
{
    Q_OBJECT

public:
    explicit XcbPointerSource(QObject* parent = nullptr);
    ~XcbPointerSource() override;

protected:
    OperationResult install() override;
    void uninstall() override;

private:
    void handleEvent(const xcb_generic_event_t* event);
    void emitSample(PointerKind kind, PointerButton button);

    XInputConnection m_xinput;
};

} // namespace DragSense
