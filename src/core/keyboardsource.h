// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "errors.h"
#include "types.h"
#include <QMap>
#include <QMutex>
#include <QObject>
#include <functional>

namespace DragSense {

/**
 * @brief System-wide keyboard input, independent of window focus
 *
 * Same contract as PointerSource: the hook is installed by the first
 * subscriber, removed after the last one leaves, and callbacks run on the
 * hook thread.
 */
class DRAGSENSE_EXPORT KeyboardSource : public QObject
{
    Q_OBJECT

public:
    using SampleCallback = std::function<void(const KeySample&)>;

    explicit KeyboardSource(QObject* parent = nullptr);
    ~KeyboardSource() override;

    /**
     * @return PermissionDenied if the platform hook could not be installed
     */
    OperationResult subscribe(SampleCallback callback, int* subscriptionId);
    bool unsubscribe(int subscriptionId);

    int subscriberCount() const;
    bool isInstalled() const;

protected:
    virtual OperationResult install() = 0;
    virtual void uninstall() = 0;

    /**
     * @brief Fan a sample out to all subscribers (any thread)
     */
    void deliver(const KeySample& sample);

    /**
     * @brief Subclass destructors must call this before their state goes away
     */
    void shutdown();

private:
    QMutex m_lifecycleMutex;
    mutable QMutex m_mutex;
    QMap<int, SampleCallback> m_subscribers;
    int m_nextSubscriptionId = 1;
    bool m_installed = false;
};

} // namespace DragSense
