// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <optional>

namespace DragSense {

class ConfigWatcher;
class Monitor;
class MonitorAdaptor;
class ScreenManager;
class Settings;

/**
 * @brief dragsensed: hosts one Monitor and exports it on the session bus
 *
 * Owns the screen tracker feeding the monitor snapshot, applies dragsenserc
 * to the monitor (and re-applies it when the file changes on disk), and
 * starts the monitors the settings or the command line ask for.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Command line overrides; unset fields follow dragsenserc
     */
    struct Overrides
    {
        QString helperPath;
        std::optional<bool> startPointer;
        std::optional<bool> startKeyboard;
        std::optional<bool> startDrag;
    };

    explicit Daemon(const Overrides& overrides = {}, QObject* parent = nullptr);
    ~Daemon() override;

    /**
     * @brief Load settings and claim the D-Bus name
     * @return false if the session bus or the service name is unavailable
     */
    bool init();

    void start();
    void stop();

    Settings* settings() const
    {
        return m_settings.get();
    }
    Monitor* monitor() const
    {
        return m_monitor.get();
    }

private Q_SLOTS:
    void applySettings();
    void onMonitorError(int code, const QString& message);

private:
    bool exportOnBus();
    void watchConfig();

    Overrides m_overrides;
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<ScreenManager> m_screenManager;
    std::unique_ptr<Monitor> m_monitor;

    MonitorAdaptor* m_monitorAdaptor = nullptr;
    ConfigWatcher* m_configWatcher = nullptr;

    bool m_running = false;
    bool m_stopping = false;
    int m_dragRestarts = 0;

    static constexpr int MaxDragRestarts = 3;
};

} // namespace DragSense
