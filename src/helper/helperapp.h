// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/helperprotocol.h"
#include "../core/sensorgrid.h"
#include <QByteArray>
#include <QFile>
#include <QObject>
#include <QPointF>

class QSocketNotifier;

namespace DragSense {

class SensorWindowManager;

/**
 * @brief Sensor helper process: owns the sensor windows of one episode
 *
 * Protocol on the standard streams:
 * - stdout: one JSON line per drag callback plus ready/error/shutdown_ack
 * - stdin: move and shutdown commands, one JSON line each
 *
 * Exits with 0 after an acknowledged shutdown or stdin EOF, with 2 when the
 * windows cannot be created.
 */
class HelperApp : public QObject
{
    Q_OBJECT

public:
    enum ExitCode {
        ExitOk = 0,
        ExitArmFailed = 2
    };

    explicit HelperApp(const GridLayout& layout, QObject* parent = nullptr);
    ~HelperApp() override;

    void setDropGraceMs(int ms);

    /**
     * @brief Tint the sensor windows with the color under the pointer
     */
    void setThemeSensorWindows(bool enabled);

    /**
     * @brief Create the windows around @p logicalCenter and start reading stdin
     * @return false if the windows could not be created (error line written)
     */
    bool start(const QPointF& logicalCenter);

    /**
     * @brief Report a fatal start-up problem to the host
     */
    void reportError(ErrorCode code, const QString& message);

private Q_SLOTS:
    void onStdinReadable();
    void onManagerClosed();

private:
    void handleCommand(const HelperProtocol::Command& command);
    void beginShutdown(bool acknowledge);
    void writeLine(const QByteArray& line);

    GridLayout m_layout;
    int m_dropGraceMs = -1;
    bool m_themeSensorWindows = false;
    SensorWindowManager* m_manager = nullptr;
    QSocketNotifier* m_stdinNotifier = nullptr;
    QByteArray m_stdinBuffer;
    QFile m_stdout;
    bool m_shuttingDown = false;
    bool m_acknowledge = false;
};

} // namespace DragSense
