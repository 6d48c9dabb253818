// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "xinputconnection.h"
#include "logging.h"
#include "platform.h"

#include <xcb/xcb.h>
#include <xcb/xinput.h>

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace DragSense {

XInputConnection::XInputConnection() = default;

XInputConnection::~XInputConnection()
{
    close();
}

OperationResult XInputConnection::open(quint32 eventMask, const QString& purpose)
{
    if (!Platform::hasXDisplay()) {
        return OperationResult::failure(ErrorCode::PermissionDenied,
                                        QStringLiteral("No X display for global %1 input").arg(purpose));
    }

    int screenNumber = 0;
    m_connection = xcb_connect(nullptr, &screenNumber);
    if (!m_connection || xcb_connection_has_error(m_connection)) {
        close();
        return OperationResult::failure(
            ErrorCode::PermissionDenied,
            QStringLiteral("Cannot connect to the X server for global %1 input").arg(purpose));
    }

    const xcb_query_extension_reply_t* extension = xcb_get_extension_data(m_connection, &xcb_input_id);
    if (!extension || !extension->present) {
        close();
        return OperationResult::failure(ErrorCode::PermissionDenied,
                                        QStringLiteral("X server does not provide the XInput extension"));
    }
    m_xiOpcode = extension->major_opcode;

    // 2.2 delivers raw events to the root window even while a client holds a grab
    xcb_input_xi_query_version_cookie_t versionCookie = xcb_input_xi_query_version(m_connection, 2, 2);
    xcb_input_xi_query_version_reply_t* version =
        xcb_input_xi_query_version_reply(m_connection, versionCookie, nullptr);
    if (!version || version->major_version < 2) {
        free(version);
        close();
        return OperationResult::failure(ErrorCode::PermissionDenied, QStringLiteral("XInput 2 is not available"));
    }
    qCDebug(lcCore) << "XInput version" << version->major_version << "." << version->minor_version << "for"
                       << purpose;
    free(version);

    const xcb_setup_t* setup = xcb_get_setup(m_connection);
    xcb_screen_iterator_t screenIt = xcb_setup_roots_iterator(setup);
    for (int i = 0; i < screenNumber && screenIt.rem > 0; ++i) {
        xcb_screen_next(&screenIt);
    }
    if (screenIt.rem == 0 || !screenIt.data) {
        close();
        return OperationResult::failure(ErrorCode::PermissionDenied, QStringLiteral("No X screen found"));
    }
    m_root = screenIt.data->root;

    struct
    {
        xcb_input_event_mask_t head;
        uint32_t mask;
    } selection;
    selection.head.deviceid = XCB_INPUT_DEVICE_ALL_MASTER;
    selection.head.mask_len = 1;
    selection.mask = eventMask;

    xcb_void_cookie_t selectCookie = xcb_input_xi_select_events_checked(m_connection, m_root, 1, &selection.head);
    if (xcb_generic_error_t* error = xcb_request_check(m_connection, selectCookie)) {
        const int code = error->error_code;
        free(error);
        close();
        return OperationResult::failure(
            ErrorCode::PermissionDenied,
            QStringLiteral("X server refused raw %1 events (error %2)").arg(purpose).arg(code));
    }
    return OperationResult::success();
}

OperationResult XInputConnection::start(EventHandler handler, const QString& threadName)
{
    if (pipe2(m_wakePipe, O_CLOEXEC | O_NONBLOCK) != 0) {
        const QString reason = qt_error_string(errno);
        close();
        return OperationResult::failure(ErrorCode::PermissionDenied,
                                        QStringLiteral("Cannot create wake pipe: %1").arg(reason));
    }

    m_handler = std::move(handler);
    m_thread.reset(QThread::create([this]() {
        readLoop();
    }));
    m_thread->setObjectName(threadName);
    m_thread->start();
    return OperationResult::success();
}

void XInputConnection::close()
{
    if (m_thread) {
        const char wake = 'q';
        if (write(m_wakePipe[1], &wake, 1) != 1) {
            qCWarning(lcCore) << "Failed to wake input hook thread:" << qt_error_string(errno);
        }
        m_thread->wait();
        m_thread.reset();
    }
    for (int& fd : m_wakePipe) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
    if (m_connection) {
        xcb_disconnect(m_connection);
        m_connection = nullptr;
    }
    m_root = 0;
    m_handler = nullptr;
}

void XInputConnection::readLoop()
{
    pollfd fds[2];
    fds[0].fd = xcb_get_file_descriptor(m_connection);
    fds[0].events = POLLIN;
    fds[1].fd = m_wakePipe[0];
    fds[1].events = POLLIN;

    while (true) {
        // Handler round-trips can pull events into xcb's queue; drain before sleeping
        while (xcb_generic_event_t* event = xcb_poll_for_event(m_connection)) {
            dispatch(event);
            free(event);
        }

        if (xcb_connection_has_error(m_connection)) {
            qCWarning(lcCore) << "X connection lost, input hook stopped";
            return;
        }

        fds[0].revents = 0;
        fds[1].revents = 0;
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            qCWarning(lcCore) << "poll() failed in input hook:" << qt_error_string(errno);
            return;
        }

        if (fds[1].revents & POLLIN) {
            return;
        }
    }
}

void XInputConnection::dispatch(const xcb_generic_event_t* event)
{
    const uint8_t responseType = event->response_type & ~0x80;
    if (responseType != XCB_GE_GENERIC) {
        return;
    }
    const auto* generic = reinterpret_cast<const xcb_ge_generic_event_t*>(event);
    if (generic->extension != m_xiOpcode) {
        return;
    }
    m_handler(event);
}

} // namespace DragSense
