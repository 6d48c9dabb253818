// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "eventbus.h"
#include "logging.h"
#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>
#include <algorithm>

namespace DragSense {

EventBus::EventBus(QObject* parent)
    : QObject(parent)
{
}

EventBus::~EventBus()
{
    QMutexLocker locker(&m_mutex);
    for (auto it = m_registrations.begin(); it != m_registrations.end(); ++it) {
        it->active->store(false);
        if (it->ownedContext) {
            it->ownedContext->deleteLater();
        }
    }
    m_registrations.clear();
}

EventBus::Channel EventBus::channelOf(const MonitorEvent& event)
{
    if (std::holds_alternative<PointerEvent>(event)) {
        return Channel::Pointer;
    }
    if (std::holds_alternative<KeyboardEvent>(event)) {
        return Channel::Keyboard;
    }
    return Channel::Drag;
}

QString EventBus::channelName(Channel channel)
{
    switch (channel) {
    case Channel::Pointer:
        return QStringLiteral("pointer");
    case Channel::Drag:
        return QStringLiteral("drag");
    case Channel::Keyboard:
        return QStringLiteral("keyboard");
    }
    return QString();
}

EventBus::Handle EventBus::registerListener(Channel channel, Callback callback, QObject* context)
{
    if (!callback) {
        qCWarning(lcBus) << "Ignoring registration of an empty callback";
        return 0;
    }

    Registration registration;
    registration.channel = channel;
    registration.callback = std::move(callback);
    registration.active = std::make_shared<std::atomic_bool>(true);
    if (context) {
        registration.context = context;
    } else {
        // Lives on the calling thread, so deliveries run there
        registration.ownedContext = new QObject();
        registration.ownedContext->setObjectName(QStringLiteral("EventBusListenerContext"));
        registration.context = registration.ownedContext;
    }

    QMutexLocker locker(&m_mutex);
    registration.handle = m_nextHandle++;
    const Handle handle = registration.handle;
    m_registrations.insert(handle, std::move(registration));
    qCDebug(lcBus) << "Registered listener" << handle << "on" << channelName(channel) << "channel";
    return handle;
}

EventBus::Handle EventBus::registerPointerListener(PointerCallback callback, QObject* context)
{
    if (!callback) {
        return registerListener(Channel::Pointer, Callback(), context);
    }
    return registerListener(
        Channel::Pointer,
        [callback = std::move(callback)](const MonitorEvent& event) {
            if (const auto* pointer = std::get_if<PointerEvent>(&event)) {
                callback(*pointer);
            }
        },
        context);
}

EventBus::Handle EventBus::registerDragListener(DragCallback callback, QObject* context)
{
    if (!callback) {
        return registerListener(Channel::Drag, Callback(), context);
    }
    return registerListener(
        Channel::Drag,
        [callback = std::move(callback)](const MonitorEvent& event) {
            if (const auto* drag = std::get_if<DragEvent>(&event)) {
                callback(*drag);
            }
        },
        context);
}

EventBus::Handle EventBus::registerKeyboardListener(KeyboardCallback callback, QObject* context)
{
    if (!callback) {
        return registerListener(Channel::Keyboard, Callback(), context);
    }
    return registerListener(
        Channel::Keyboard,
        [callback = std::move(callback)](const MonitorEvent& event) {
            if (const auto* keyboard = std::get_if<KeyboardEvent>(&event)) {
                callback(*keyboard);
            }
        },
        context);
}

bool EventBus::unregisterListener(Handle handle)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_registrations.find(handle);
    if (it == m_registrations.end()) {
        return false;
    }

    it->active->store(false);
    if (it->ownedContext) {
        it->ownedContext->deleteLater();
    }
    m_registrations.erase(it);
    qCDebug(lcBus) << "Unregistered listener" << handle;
    return true;
}

void EventBus::publish(const MonitorEvent& event)
{
    const Channel channel = channelOf(event);

    // Snapshot under the lock, post outside it
    QVector<Registration> targets;
    {
        QMutexLocker locker(&m_mutex);
        targets.reserve(m_registrations.size());
        for (const Registration& registration : std::as_const(m_registrations)) {
            if (registration.channel == channel) {
                targets.append(registration);
            }
        }
    }

    // Fan out in registration order
    std::sort(targets.begin(), targets.end(), [](const Registration& a, const Registration& b) {
        return a.handle < b.handle;
    });

    for (const Registration& target : std::as_const(targets)) {
        QObject* context = target.context.data();
        if (!context) {
            qCDebug(lcBus) << "Listener" << target.handle << "lost its context, skipping delivery";
            continue;
        }
        QMetaObject::invokeMethod(
            context,
            [callback = target.callback, active = target.active, event]() {
                if (active->load()) {
                    callback(event);
                }
            },
            Qt::QueuedConnection);
    }
}

int EventBus::listenerCount(Channel channel) const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(std::count_if(m_registrations.cbegin(), m_registrations.cend(),
                                          [channel](const Registration& registration) {
                                              return registration.channel == channel;
                                          }));
}

} // namespace DragSense
