// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "sensorwindow.h"
#include "../core/errors.h"
#include "../core/sensorgrid.h"
#include "../core/types.h"
#include <QObject>
#include <QTimer>
#include <functional>
#include <memory>
#include <vector>

namespace DragSense {

/**
 * @brief Owns the sensor windows of one episode
 *
 * State machine Idle -> Armed -> Closing -> Idle. Exactly
 * layout().windowCount() windows exist while Armed or Closing, none while
 * Idle. Windows are moved, never recreated, while the button is held, so
 * their drop-target registration survives.
 *
 * Closing keeps the windows alive for a short grace period: the drop of an
 * XDND drag is delivered after the source has seen the button release, so
 * tearing down on the release itself would lose it.
 *
 * Lives on, and must only be called from, the thread that owns the windows.
 */
class DRAGSENSE_EXPORT SensorWindowManager : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Armed,
        Closing
    };
    Q_ENUM(State)

    using MonitorProvider = std::function<QVector<MonitorDescriptor>()>;

    explicit SensorWindowManager(std::unique_ptr<SensorWindowFactory> factory, QObject* parent = nullptr);
    ~SensorWindowManager() override;

    void setLayout(const GridLayout& layout);
    GridLayout layout() const
    {
        return m_layout;
    }

    /**
     * @brief Source of monitor snapshots, queried at every arm
     *
     * Defaults to ScreenManager::currentMonitors().
     */
    void setMonitorProvider(MonitorProvider provider);

    void setTint(const QColor& color);

    /**
     * @brief Time windows stay alive in Closing before they are destroyed
     */
    void setDropGraceMs(int ms);

    /**
     * @brief Idle -> Armed: plan and create the windows around @p logicalCenter
     *
     * On any creation failure the windows created so far are destroyed, the
     * manager stays Idle, and windowCreationFailed() is emitted.
     */
    OperationResult arm(const QPointF& logicalCenter);

    /**
     * @brief Re-plan around @p logicalCenter and move the existing windows
     */
    void moveTo(const QPointF& logicalCenter);

    /**
     * @brief Armed -> Closing; closed() follows after the grace period
     */
    void disarm();

    /**
     * @brief Destroy everything now and return to Idle
     */
    void abort();

    State state() const
    {
        return m_state;
    }

    int windowCount() const
    {
        return static_cast<int>(m_windows.size());
    }

    QVector<SensorWindowSpec> currentPlan() const
    {
        return m_plan;
    }

Q_SIGNALS:
    void armed(const QVector<DragSense::SensorWindowSpec>& plan);
    void moved(const QVector<DragSense::SensorWindowSpec>& plan);
    void closed();
    void windowCreationFailed(const QString& message);
    void callbackReceived(const DragSense::DragCallbackEvent& callback);

private:
    bool planAround(const QPointF& logicalCenter, QVector<SensorWindowSpec>* plan, MonitorDescriptor* monitor,
                    QString* errorMessage) const;
    void destroyWindows();
    void finishClosing();

    std::unique_ptr<SensorWindowFactory> m_factory;
    MonitorProvider m_monitorProvider;
    GridLayout m_layout;
    QColor m_tint;
    State m_state = State::Idle;
    std::vector<std::unique_ptr<ISensorWindow>> m_windows;
    QVector<SensorWindowSpec> m_plan;
    QTimer m_closeTimer;
};

} // namespace DragSense
