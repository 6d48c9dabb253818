// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "errors.h"
#include "types.h"
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QVector>
#include <functional>

namespace DragSense {

/**
 * @brief System-wide pointer input, independent of window focus
 *
 * The platform hook is installed by the first subscriber and removed when
 * the last one leaves. Callbacks run on the hook's own thread and must not
 * block; anything heavier than copying the sample belongs on the event bus.
 *
 * Samples carry logical desktop coordinates.
 */
class DRAGSENSE_EXPORT PointerSource : public QObject
{
    Q_OBJECT

public:
    using SampleCallback = std::function<void(const PointerSample&)>;

    explicit PointerSource(QObject* parent = nullptr);
    ~PointerSource() override;

    /**
     * @brief Add a subscriber
     *
     * @param callback Invoked for every sample on the hook thread
     * @param subscriptionId Receives the new id on success
     * @return PermissionDenied if the platform hook could not be installed
     */
    OperationResult subscribe(SampleCallback callback, int* subscriptionId);

    /**
     * @brief Remove a subscriber
     * @return false if the id is unknown
     */
    bool unsubscribe(int subscriptionId);

    int subscriberCount() const;

    bool isInstalled() const;

    /**
     * @brief Monitor snapshot used by hooks that report native pixels
     */
    void setMonitors(const QVector<MonitorDescriptor>& monitors);

protected:
    /**
     * @brief Install the platform hook; called with no subscribers present
     */
    virtual OperationResult install() = 0;

    /**
     * @brief Remove the platform hook; called after the last unsubscribe
     */
    virtual void uninstall() = 0;

    /**
     * @brief Fan a sample out to all subscribers (any thread)
     */
    void deliver(const PointerSample& sample);

    QVector<MonitorDescriptor> monitors() const;

    /**
     * @brief Subclass destructors must call this before their state goes away
     */
    void shutdown();

private:
    QMutex m_lifecycleMutex;    ///< Serializes install/uninstall
    mutable QMutex m_mutex;
    QMap<int, SampleCallback> m_subscribers;
    QVector<MonitorDescriptor> m_monitors;
    int m_nextSubscriptionId = 1;
    bool m_installed = false;
};

} // namespace DragSense
