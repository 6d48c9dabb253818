// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "types.h"
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <atomic>
#include <functional>
#include <memory>

namespace DragSense {

/**
 * @brief Fan-out of MonitorEvents to registered listeners across threads
 *
 * Each listener subscribes to one channel and gets a handle that is unique
 * for the lifetime of the process (monotonic, starting at 1, never reused).
 *
 * publish() never calls a listener directly: every delivery is posted to the
 * listener's context object and runs on that object's thread. A listener
 * registered without a context gets one living on the registering thread.
 * Per listener, events of one channel arrive in publish order. Deliveries
 * still queued when a listener is unregistered are dropped.
 *
 * Thread-safe. The registry is never exposed; only register/unregister.
 */
class DRAGSENSE_EXPORT EventBus : public QObject
{
    Q_OBJECT

public:
    enum class Channel {
        Pointer,
        Drag,
        Keyboard
    };

    using Handle = quint64;
    using Callback = std::function<void(const MonitorEvent&)>;
    using PointerCallback = std::function<void(const PointerEvent&)>;
    using DragCallback = std::function<void(const DragEvent&)>;
    using KeyboardCallback = std::function<void(const KeyboardEvent&)>;

    explicit EventBus(QObject* parent = nullptr);
    ~EventBus() override;

    /**
     * @brief Register a listener on @p channel
     * @param context Object whose thread runs the callback; nullptr for the calling thread
     * @return Handle (never 0)
     */
    Handle registerListener(Channel channel, Callback callback, QObject* context = nullptr);

    Handle registerPointerListener(PointerCallback callback, QObject* context = nullptr);
    Handle registerDragListener(DragCallback callback, QObject* context = nullptr);
    Handle registerKeyboardListener(KeyboardCallback callback, QObject* context = nullptr);

    /**
     * @brief Remove a listener
     * @return false if @p handle is unknown or already removed
     */
    bool unregisterListener(Handle handle);

    /**
     * @brief Queue @p event for every listener of its channel
     */
    void publish(const MonitorEvent& event);

    int listenerCount(Channel channel) const;

    static Channel channelOf(const MonitorEvent& event);
    static QString channelName(Channel channel);

private:
    struct Registration
    {
        Handle handle = 0;
        Channel channel = Channel::Pointer;
        Callback callback;
        QPointer<QObject> context;
        QObject* ownedContext = nullptr;    ///< Created for context-less listeners
        std::shared_ptr<std::atomic_bool> active;
    };

    mutable QMutex m_mutex;
    QHash<Handle, Registration> m_registrations;
    Handle m_nextHandle = 1;
};

} // namespace DragSense
