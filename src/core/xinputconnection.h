// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "errors.h"
#include <QString>
#include <QThread>
#include <functional>
#include <memory>

#include <xcb/xcb.h>

namespace DragSense {

/**
 * @brief Private X connection reading XInput2 raw events on its own thread
 *
 * open() connects, checks for XInput 2.2 and selects the requested raw
 * events on the root window for all master devices. start() reads them on a
 * dedicated thread until close() wakes it through a pipe. Raw events are
 * delivered regardless of grabs and focus.
 *
 * Internal to the xcb input sources.
 */
class XInputConnection
{
public:
    using EventHandler = std::function<void(const xcb_generic_event_t*)>;

    XInputConnection();
    ~XInputConnection();

    XInputConnection(const XInputConnection&) = delete;
    XInputConnection& operator=(const XInputConnection&) = delete;

    /**
     * @param eventMask XCB_INPUT_XI_EVENT_MASK_* bits
     * @param purpose Used in error messages ("pointer", "keyboard")
     * @return PermissionDenied if there is no X display or XInput2
     */
    OperationResult open(quint32 eventMask, const QString& purpose);

    /**
     * @brief Start the reader thread; @p handler sees XI2 generic events only
     */
    OperationResult start(EventHandler handler, const QString& threadName);

    void close();

    xcb_connection_t* connection() const
    {
        return m_connection;
    }
    quint32 root() const
    {
        return m_root;
    }

private:
    void readLoop();
    void dispatch(const xcb_generic_event_t* event);

    xcb_connection_t* m_connection = nullptr;
    quint32 m_root = 0;
    quint8 m_xiOpcode = 0;
    int m_wakePipe[2] = {-1, -1};
    EventHandler m_handler;
    std::unique_ptr<QThread> m_thread;
};

} // namespace DragSense
