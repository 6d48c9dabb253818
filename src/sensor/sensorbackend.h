// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "../core/sensorgrid.h"
#include "../core/types.h"
#include <QObject>
#include <QPointF>

namespace DragSense {

class SensorWindowManager;

/**
 * @brief Windowing side of the drag monitor
 *
 * DragMonitor drives a backend with arm/moveTo/disarm and listens for the
 * outcome. Every request is asynchronous with respect to the caller: results
 * come back as signals, possibly before the call returns.
 *
 * - armed(): windows exist; armFailed(): none do, the episode is over
 * - disarmed(): windows are gone after a disarm()
 * - terminated(): the windowing context died outside of disarm()/abort()
 */
class DRAGSENSE_EXPORT ISensorBackend : public QObject
{
    Q_OBJECT

public:
    explicit ISensorBackend(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISensorBackend() override = default;

    /// Logical desktop coordinates
    virtual void arm(const QPointF& logicalCenter) = 0;
    virtual void moveTo(const QPointF& logicalCenter) = 0;
    virtual void disarm() = 0;

    /**
     * @brief Tear down immediately, without signals
     */
    virtual void abort() = 0;

    /**
     * @brief Whether the backend creates windows itself and so must run on the GUI thread
     */
    virtual bool requiresGuiThread() const = 0;

Q_SIGNALS:
    void armed(const QVector<DragSense::SensorWindowSpec>& plan);
    void armFailed(const QString& message);
    void disarmed();
    void callbackReceived(const DragSense::DragCallbackEvent& callback);
    void terminated(const QString& message);
};

/**
 * @brief In-process backend driving a SensorWindowManager on the GUI thread
 */
class DRAGSENSE_EXPORT LocalSensorBackend : public ISensorBackend
{
    Q_OBJECT

public:
    /**
     * @param manager Takes ownership
     */
    explicit LocalSensorBackend(SensorWindowManager* manager, QObject* parent = nullptr);
    ~LocalSensorBackend() override;

    void arm(const QPointF& logicalCenter) override;
    void moveTo(const QPointF& logicalCenter) override;
    void disarm() override;
    void abort() override;

    bool requiresGuiThread() const override
    {
        return true;
    }

    SensorWindowManager* manager() const
    {
        return m_manager;
    }

private:
    SensorWindowManager* m_manager;
};

} // namespace DragSense
