// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "xcbpointersource.h"
#include "coordinateutils.h"
#include "logging.h"

#include <xcb/xcb.h>
#include <xcb/xinput.h>

#include <cstdlib>

namespace DragSense {

namespace {

// X core button numbers
constexpr quint32 XButtonLeft = 1;
constexpr quint32 XButtonMiddle = 2;
constexpr quint32 XButtonRight = 3;
constexpr quint32 XButtonWheelFirst = 4;   // 4-7: vertical and horizontal scroll
constexpr quint32 XButtonWheelLast = 7;

PointerButton buttonFromDetail(quint32 detail)
{
    switch (detail) {
    case XButtonLeft:
        return PointerButton::Left;
    case XButtonMiddle:
        return PointerButton::Middle;
    case XButtonRight:
        return PointerButton::Right;
    default:
        return PointerButton::None;
    }
}

bool isWheelButton(quint32 detail)
{
    return detail >= XButtonWheelFirst && detail <= XButtonWheelLast;
}

} // anonymous namespace

XcbPointerSource::XcbPointerSource(QObject* parent)
    : PointerSource(parent)
{
}

XcbPointerSource::~XcbPointerSource()
{
    shutdown();
}

OperationResult XcbPointerSource::install()
{
    const OperationResult opened = m_xinput.open(XCB_INPUT_XI_EVENT_MASK_RAW_MOTION
                                                     | XCB_INPUT_XI_EVENT_MASK_RAW_BUTTON_PRESS
                                                     | XCB_INPUT_XI_EVENT_MASK_RAW_BUTTON_RELEASE,
                                                 QStringLiteral("pointer"));
    if (!opened.ok()) {
        return opened;
    }
    return m_xinput.start(
        [this](const xcb_generic_event_t* event) {
            handleEvent(event);
        },
        QStringLiteral("dragsense-pointer-hook"));
}

void XcbPointerSource::uninstall()
{
    m_xinput.close();
}

void XcbPointerSource::handleEvent(const xcb_generic_event_t* event)
{
    const auto* generic = reinterpret_cast<const xcb_ge_generic_event_t*>(event);
    switch (generic->event_type) {
    case XCB_INPUT_RAW_MOTION:
        emitSample(PointerKind::Move, PointerButton::None);
        break;
    case XCB_INPUT_RAW_BUTTON_PRESS: {
        const auto* press = reinterpret_cast<const xcb_input_raw_button_press_event_t*>(event);
        if (isWheelButton(press->detail)) {
            emitSample(PointerKind::Wheel, PointerButton::None);
        } else {
            emitSample(PointerKind::Down, buttonFromDetail(press->detail));
        }
        break;
    }
    case XCB_INPUT_RAW_BUTTON_RELEASE: {
        const auto* release = reinterpret_cast<const xcb_input_raw_button_release_event_t*>(event);
        // Wheel "releases" carry no information
        if (!isWheelButton(release->detail)) {
            emitSample(PointerKind::Up, buttonFromDetail(release->detail));
        }
        break;
    }
    default:
        break;
    }
}

void XcbPointerSource::emitSample(PointerKind kind, PointerButton button)
{
    xcb_connection_t* connection = m_xinput.connection();
    xcb_query_pointer_cookie_t cookie = xcb_query_pointer(connection, m_xinput.root());
    xcb_query_pointer_reply_t* reply = xcb_query_pointer_reply(connection, cookie, nullptr);
    if (!reply) {
        qCDebug(lcPointer) << "QueryPointer failed, dropping sample";
        return;
    }

    const QPointF native(reply->root_x, reply->root_y);
    free(reply);

    // X reports native pixels; samples leave in logical units
    QPointF logical = native;
    const QVector<MonitorDescriptor> snapshot = monitors();
    const int index = CoordinateUtils::monitorIndexForPhysical(native, snapshot);
    if (index >= 0) {
        logical = CoordinateUtils::physicalToLogical(native, snapshot.at(index));
    }

    PointerSample sample;
    sample.x = logical.x();
    sample.y = logical.y();
    sample.kind = kind;
    sample.button = button;
    sample.timestamp = currentTimestamp();
    deliver(sample);
}

} // namespace DragSense
