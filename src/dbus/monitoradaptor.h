// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "../core/eventbus.h"
#include <QDBusAbstractAdaptor>
#include <QDBusVariant>
#include <QObject>
#include <QPointer>
#include <QStringList>

namespace DragSense {

class Monitor;

/**
 * @brief D-Bus adaptor for the pointer and drag monitors
 *
 * Provides D-Bus interface: org.dragsense.Monitor
 *
 * Methods mirror the Monitor facade and return false on failure; the reason
 * follows as a monitorError() signal. Events reach D-Bus clients as
 * pointerEvent(), keyboardEvent() and dragEvent() signals.
 *
 * NOTE: Interface name must match DBus::Interface::Monitor.
 */
class DRAGSENSE_EXPORT MonitorAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.dragsense.Monitor")

public:
    explicit MonitorAdaptor(Monitor* monitor, QObject* parent = nullptr);
    ~MonitorAdaptor() override;

public Q_SLOTS:
    // Pointer monitoring
    bool startPointerMonitor();
    bool stopPointerMonitor();
    bool isPointerMonitoring();

    // Keyboard monitoring
    bool startKeyboardMonitor();
    bool stopKeyboardMonitor();
    bool isKeyboardMonitoring();

    // Drag monitoring
    bool configureDragMonitor(const QString& helperLocator);
    bool startDragMonitor();
    bool stopDragMonitor();
    bool isDragMonitoring();
    bool simulateDragEvent(const QDBusVariant& filePaths);

    /**
     * @brief Color at logical desktop position as "#AARRGGBB", empty on failure
     */
    QString sampleColorAt(double x, double y);

Q_SIGNALS:
    void pointerEvent(const QString& eventType, double x, double y, int button, double timestamp,
                      const QString& platform);
    void keyboardEvent(const QString& eventType, int keyCode, const QString& keyName, const QStringList& modifiers,
                       double timestamp, const QString& platform);
    void dragEvent(const QString& eventType, const QString& filePath, double x, double y, double timestamp,
                   const QString& platform, const QString& windowId);
    void monitorError(const QString& code, const QString& message);
    void pointerMonitoringChanged(bool active);
    void keyboardMonitoringChanged(bool active);
    void dragMonitoringChanged(bool active);

private:
    QPointer<Monitor> m_monitor;
    EventBus::Handle m_pointerListener = 0;
    EventBus::Handle m_keyboardListener = 0;
    EventBus::Handle m_dragListener = 0;
};

} // namespace DragSense
