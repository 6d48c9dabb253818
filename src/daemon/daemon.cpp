// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../config/configwatcher.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/platform.h"
#include "../core/screenmanager.h"
#include "../dbus/monitoradaptor.h"
#include "../sensor/monitor.h"
#include <QDBusConnection>
#include <QDBusError>
#include <QStandardPaths>
#include <QThread>
#include <QTimer>

namespace DragSense {

Daemon::Daemon(const Overrides& overrides, QObject* parent)
    : QObject(parent)
    , m_overrides(overrides)
    , m_settings(std::make_unique<Settings>())
    , m_screenManager(std::make_unique<ScreenManager>())
    , m_monitor(std::make_unique<Monitor>())
{
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::init()
{
    qCInfo(lcDaemon) << "Session:" << Platform::sessionName()
                     << "sensor window placement:" << Platform::canPlaceSensorWindows();

    applySettings();
    connect(m_settings.get(), &Settings::settingsChanged, this, &Daemon::applySettings);
    connect(m_monitor.get(), &Monitor::monitorError, this, &Daemon::onMonitorError);
    watchConfig();

    m_monitorAdaptor = new MonitorAdaptor(m_monitor.get(), this);
    return exportOnBus();
}

bool Daemon::exportOnBus()
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "No session bus:" << bus.lastError().message();
        return false;
    }

    // Object first, so whoever sees the name appear can call it right away
    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        qCCritical(lcDaemon) << "Cannot export" << DBus::ObjectPath << ":" << bus.lastError().message();
        return false;
    }

    // The bus daemon may still be starting up with the session; give it a moment
    constexpr int attempts = 3;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (bus.registerService(QString(DBus::ServiceName))) {
            qCInfo(lcDaemon) << "Exported" << DBus::Interface::Monitor << "at" << DBus::ServiceName
                             << DBus::ObjectPath;
            return true;
        }

        const QDBusError error = bus.lastError();
        const bool transient = error.type() == QDBusError::NoReply || error.type() == QDBusError::ServiceUnknown;
        if (!transient || attempt == attempts) {
            qCCritical(lcDaemon) << "Cannot own" << DBus::ServiceName << ":" << error.message();
            break;
        }
        qCWarning(lcDaemon) << "Owning" << DBus::ServiceName << "failed (" << error.message() << "), attempt"
                            << attempt << "of" << attempts;
        QThread::msleep(500 * attempt);
    }

    bus.unregisterObject(QString(DBus::ObjectPath));
    return false;
}

void Daemon::watchConfig()
{
    const QString configFile =
        QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + QLatin1String("/dragsenserc");
    m_configWatcher = new ConfigWatcher(configFile, this);
    if (!m_configWatcher->start()) {
        qCWarning(lcConfig) << "Settings changes need a restart";
        return;
    }
    connect(m_configWatcher, &ConfigWatcher::changed, m_settings.get(), &Settings::load);
}

void Daemon::applySettings()
{
    m_monitor->setLayout(m_settings->gridLayout());
    m_monitor->setButtonMask(m_settings->buttonMask());
    m_monitor->setHelperShutdownTimeoutMs(m_settings->helperShutdownTimeoutMs());
    m_monitor->setDropGraceMs(m_settings->dropGraceMs());

    const QString helperPath = m_overrides.helperPath.isEmpty() ? m_settings->helperPath() : m_overrides.helperPath;
    if (helperPath.isEmpty() || helperPath == m_monitor->helperPath()) {
        return;
    }
    // On failure monitorError goes out and the default helper lookup stays in effect
    if (!m_monitor->configureDragMonitor(helperPath).ok()) {
        qCWarning(lcDaemon) << "Sensor helper" << helperPath << "is unusable";
    }
}

void Daemon::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    m_screenManager->start();
    m_monitor->setScreenManager(m_screenManager.get());

    if (m_overrides.startPointer.value_or(m_settings->autostartPointer())) {
        const OperationResult result = m_monitor->startPointerMonitor();
        if (!result.ok()) {
            qCWarning(lcDaemon) << "Pointer monitoring not started:" << errorCodeName(result.code) << result.message;
        }
    }
    if (m_overrides.startKeyboard.value_or(m_settings->autostartKeyboard())) {
        const OperationResult result = m_monitor->startKeyboardMonitor();
        if (!result.ok()) {
            qCWarning(lcDaemon) << "Keyboard monitoring not started:" << errorCodeName(result.code) << result.message;
        }
    }
    if (m_overrides.startDrag.value_or(m_settings->autostartDrag())) {
        const OperationResult result = m_monitor->startDragMonitor();
        if (!result.ok()) {
            qCWarning(lcDaemon) << "Drag monitoring not started:" << errorCodeName(result.code) << result.message;
        }
    }
}

void Daemon::onMonitorError(int code, const QString& message)
{
    Q_UNUSED(message)
    if (static_cast<ErrorCode>(code) != ErrorCode::MonitorTerminatedUnexpectedly || !m_running || m_stopping) {
        return;
    }
    // The sensor helper died under us. Bring drag monitoring back a few times;
    // a helper that keeps crashing stays down until a client starts it again.
    if (m_dragRestarts >= MaxDragRestarts) {
        qCWarning(lcDaemon) << "Sensor helper failed" << m_dragRestarts << "times, drag monitoring stays off";
        return;
    }
    ++m_dragRestarts;

    // Queued behind the monitor's own teardown of the dead helper
    QTimer::singleShot(0, this, [this]() {
        if (!m_running || m_monitor->isDragMonitoring()) {
            return;
        }
        qCInfo(lcDaemon) << "Restarting drag monitoring, attempt" << m_dragRestarts << "of" << MaxDragRestarts;
        const OperationResult result = m_monitor->startDragMonitor();
        if (!result.ok()) {
            qCWarning(lcDaemon) << "Drag monitoring restart failed:" << result.message;
        }
    });
}

void Daemon::stop()
{
    if (!m_running) {
        return;
    }
    m_stopping = true;

    // An open drag episode is torn down out of band
    m_monitor->stopDragMonitor();
    m_monitor->stopKeyboardMonitor();
    m_monitor->stopPointerMonitor();
    m_screenManager->stop();

    QDBusConnection bus = QDBusConnection::sessionBus();
    bus.unregisterService(QString(DBus::ServiceName));
    bus.unregisterObject(QString(DBus::ObjectPath));

    m_running = false;
    m_stopping = false;
}

} // namespace DragSense
