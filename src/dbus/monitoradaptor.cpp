// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitoradaptor.h"
#include "../core/errors.h"
#include "../core/logging.h"
#include "../sensor/monitor.h"

namespace DragSense {

MonitorAdaptor::MonitorAdaptor(Monitor* monitor, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_monitor(monitor)
{
    // Signals are emitted on the adaptor's thread
    m_pointerListener = m_monitor->onPointerEvent(
        [this](const PointerEvent& event) {
            Q_EMIT pointerEvent(event.eventType, event.x, event.y, event.button, event.timestamp, event.platform);
        },
        this);
    m_keyboardListener = m_monitor->onKeyboardEvent(
        [this](const KeyboardEvent& event) {
            Q_EMIT keyboardEvent(event.eventType, event.keyCode, event.keyName, event.modifiers, event.timestamp,
                                 event.platform);
        },
        this);
    m_dragListener = m_monitor->onDragEvent(
        [this](const DragEvent& event) {
            Q_EMIT dragEvent(event.eventType, event.filePath, event.x, event.y, event.timestamp, event.platform,
                             event.windowId);
        },
        this);

    connect(m_monitor, &Monitor::monitorError, this, [this](int code, const QString& message) {
        Q_EMIT monitorError(errorCodeName(static_cast<ErrorCode>(code)), message);
    });
    connect(m_monitor, &Monitor::pointerMonitoringChanged, this, &MonitorAdaptor::pointerMonitoringChanged);
    connect(m_monitor, &Monitor::keyboardMonitoringChanged, this, &MonitorAdaptor::keyboardMonitoringChanged);
    connect(m_monitor, &Monitor::dragMonitoringChanged, this, &MonitorAdaptor::dragMonitoringChanged);
}

MonitorAdaptor::~MonitorAdaptor()
{
    if (m_monitor) {
        m_monitor->removePointerEventListener(m_pointerListener);
        m_monitor->removeKeyboardEventListener(m_keyboardListener);
        m_monitor->removeDragEventListener(m_dragListener);
    }
}

bool MonitorAdaptor::startPointerMonitor()
{
    if (!m_monitor) {
        return false;
    }
    return m_monitor->startPointerMonitor().ok();
}

bool MonitorAdaptor::stopPointerMonitor()
{
    if (!m_monitor) {
        return false;
    }
    return m_monitor->stopPointerMonitor().ok();
}

bool MonitorAdaptor::isPointerMonitoring()
{
    return m_monitor && m_monitor->isPointerMonitoring();
}

bool MonitorAdaptor::startKeyboardMonitor()
{
    if (!m_monitor) {
        return false;
    }
    return m_monitor->startKeyboardMonitor().ok();
}

bool MonitorAdaptor::stopKeyboardMonitor()
{
    if (!m_monitor) {
        return false;
    }
    return m_monitor->stopKeyboardMonitor().ok();
}

bool MonitorAdaptor::isKeyboardMonitoring()
{
    return m_monitor && m_monitor->isKeyboardMonitoring();
}

bool MonitorAdaptor::configureDragMonitor(const QString& helperLocator)
{
    if (!m_monitor) {
        return false;
    }
    return m_monitor->configureDragMonitor(helperLocator).ok();
}

bool MonitorAdaptor::startDragMonitor()
{
    if (!m_monitor) {
        return false;
    }
    return m_monitor->startDragMonitor().ok();
}

bool MonitorAdaptor::stopDragMonitor()
{
    if (!m_monitor) {
        return false;
    }
    return m_monitor->stopDragMonitor().ok();
}

bool MonitorAdaptor::isDragMonitoring()
{
    return m_monitor && m_monitor->isDragMonitoring();
}

bool MonitorAdaptor::simulateDragEvent(const QDBusVariant& filePaths)
{
    if (!m_monitor) {
        return false;
    }
    qCDebug(lcDbus) << "simulateDragEvent:" << filePaths.variant();
    return m_monitor->simulateDragEvent(filePaths.variant()).ok();
}

QString MonitorAdaptor::sampleColorAt(double x, double y)
{
    if (!m_monitor) {
        return QString();
    }
    const ColorSample sample = m_monitor->sampleColorAt(x, y);
    return sample.ok() ? sample.color.name(QColor::HexArgb) : QString();
}

} // namespace DragSense
