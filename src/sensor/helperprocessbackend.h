// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "sensorbackend.h"
#include "../core/helperprotocol.h"
#include <QByteArray>
#include <QProcess>
#include <QTimer>
#include <functional>

namespace DragSense {

/**
 * @brief Backend running the sensor windows in dragsense-sensor-helper
 *
 * One helper process per episode: arm() spawns it with the logical press
 * position, moveTo() and disarm() become "move" and "shutdown" commands on
 * its stdin, and its stdout lines (HelperProtocol) come back as signals.
 *
 * A helper that exits before acknowledging a shutdown is reported through
 * terminated(); one that does not acknowledge in time is terminated, then
 * killed, like any other unresponsive child.
 */
class DRAGSENSE_EXPORT HelperProcessBackend : public ISensorBackend
{
    Q_OBJECT

public:
    using MonitorProvider = std::function<QVector<MonitorDescriptor>()>;

    explicit HelperProcessBackend(const QString& helperPath, QObject* parent = nullptr);
    ~HelperProcessBackend() override;

    /**
     * @brief Check whether @p path names an executable helper
     */
    static bool isUsableHelper(const QString& path);

    /**
     * @brief Default helper: next to the running binary, then $PATH
     * @return Empty if none was found
     */
    static QString findDefaultHelper();

    QString helperPath() const
    {
        return m_helperPath;
    }

    /**
     * @brief Layout passed to the helper; also used for the host-side episode record
     */
    void setLayout(const GridLayout& layout);

    void setShutdownTimeoutMs(int ms);

    /**
     * @brief Monitor snapshot used to plan the host-side episode record
     */
    void setMonitorProvider(MonitorProvider provider);

    void arm(const QPointF& logicalCenter) override;
    void moveTo(const QPointF& logicalCenter) override;
    void disarm() override;
    void abort() override;

    bool requiresGuiThread() const override
    {
        return false;
    }

    bool isRunning() const;

private:
    void onReadyReadStandardOutput();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessError(QProcess::ProcessError error);
    void onShutdownTimeout();
    void handleMessage(const HelperProtocol::Message& message);
    void write(const QByteArray& line);
    void stopProcess();
    void finishDisarm();

    static constexpr qsizetype kMaxStdoutBufferSize = 65536; // 64 KB

    enum class Phase {
        Idle,
        Starting,       ///< Spawned, waiting for "ready"
        Armed,
        ShuttingDown    ///< "shutdown" sent, waiting for "shutdown_ack" or exit
    };

    QString m_helperPath;
    GridLayout m_layout;
    MonitorProvider m_monitorProvider;
    QPointF m_armCenter;
    QProcess* m_process = nullptr;
    QByteArray m_stdoutBuffer;
    QTimer m_shutdownTimer;
    Phase m_phase = Phase::Idle;
    bool m_stopping = false; // suppress error reporting during intentional stop
    bool m_failureReported = false;
};

} // namespace DragSense
