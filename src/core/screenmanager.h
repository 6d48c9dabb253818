// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "types.h"
#include <QObject>
#include <QTimer>
#include <QVector>

class QScreen;

namespace DragSense {

/**
 * @brief Keeps the monitor snapshot in step with QGuiApplication's screens
 *
 * Snapshots are plain values so they can be handed to the pointer hook
 * thread without touching QScreen off the GUI thread. A display
 * reconfiguration fires a burst of QScreen signals; they are coalesced into
 * one monitorsChanged() per event loop pass, and only if the snapshot really
 * differs.
 */
class DRAGSENSE_EXPORT ScreenManager : public QObject
{
    Q_OBJECT

public:
    explicit ScreenManager(QObject* parent = nullptr);
    ~ScreenManager() override;

    /**
     * @brief Start tracking screens; idempotent
     */
    void start();
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    /**
     * @brief Last snapshot taken (current screens if not running)
     */
    QVector<MonitorDescriptor> monitors() const;

    /**
     * @brief Describe one screen
     *
     * QScreen::geometry() keeps the native origin and divides the size by
     * the device pixel ratio, which is exactly the shared-origin model of
     * MonitorDescriptor.
     */
    static MonitorDescriptor describe(const QScreen* screen);

    /**
     * @brief Snapshot of the screens known to QGuiApplication right now
     *
     * Usable without a ScreenManager (e.g. in the sensor helper).
     */
    static QVector<MonitorDescriptor> currentMonitors();

Q_SIGNALS:
    void monitorsChanged(const QVector<DragSense::MonitorDescriptor>& monitors);

private Q_SLOTS:
    void onScreenAdded(QScreen* screen);
    void onScreenRemoved(QScreen* screen);
    void refresh();

private:
    void track(QScreen* screen);

    bool m_running = false;
    QVector<MonitorDescriptor> m_monitors;
    QString m_removedScreen;    ///< Still listed by QGuiApplication until screenRemoved returns
    QTimer m_refreshTimer;
};

} // namespace DragSense
