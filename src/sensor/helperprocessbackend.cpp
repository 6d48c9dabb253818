// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "helperprocessbackend.h"
#include "../core/constants.h"
#include "../core/coordinateutils.h"
#include "../core/logging.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace DragSense {

HelperProcessBackend::HelperProcessBackend(const QString& helperPath, QObject* parent)
    : ISensorBackend(parent)
    , m_helperPath(helperPath)
    , m_layout(GridLayout::defaultLayout())
    , m_shutdownTimer(this)
{
    m_shutdownTimer.setSingleShot(true);
    m_shutdownTimer.setInterval(Defaults::HelperShutdownTimeoutMs);
    connect(&m_shutdownTimer, &QTimer::timeout, this, &HelperProcessBackend::onShutdownTimeout);
}

HelperProcessBackend::~HelperProcessBackend()
{
    abort();
}

bool HelperProcessBackend::isUsableHelper(const QString& path)
{
    if (path.isEmpty()) {
        return false;
    }
    const QFileInfo info(path);
    return info.isFile() && info.isExecutable();
}

QString HelperProcessBackend::findDefaultHelper()
{
    if (QCoreApplication::instance()) {
        const QString sibling = QDir(QCoreApplication::applicationDirPath()).filePath(HelperExecutableName);
        if (isUsableHelper(sibling)) {
            return sibling;
        }
    }
    return QStandardPaths::findExecutable(HelperExecutableName);
}

void HelperProcessBackend::setLayout(const GridLayout& layout)
{
    if (layout.isValid()) {
        m_layout = layout;
    }
}

void HelperProcessBackend::setShutdownTimeoutMs(int ms)
{
    m_shutdownTimer.setInterval(qMax(0, ms));
}

void HelperProcessBackend::setMonitorProvider(MonitorProvider provider)
{
    m_monitorProvider = std::move(provider);
}

bool HelperProcessBackend::isRunning() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

void HelperProcessBackend::arm(const QPointF& logicalCenter)
{
    if (isRunning()) {
        qCDebug(lcHelper) << "Previous sensor helper still running, stopping it";
        stopProcess();
    }
    m_shutdownTimer.stop();

    if (!m_process) {
        m_process = new QProcess(this);
        connect(m_process, &QProcess::readyReadStandardOutput, this,
                &HelperProcessBackend::onReadyReadStandardOutput);
        connect(m_process, &QProcess::finished, this, &HelperProcessBackend::onProcessFinished);
        connect(m_process, &QProcess::errorOccurred, this, &HelperProcessBackend::onProcessError);
    }

    m_stdoutBuffer.clear();
    m_armCenter = logicalCenter;
    m_failureReported = false;
    m_phase = Phase::Starting;

    // stderr carries the helper's log; stdout is the protocol
    m_process->setProcessChannelMode(QProcess::ForwardedErrorChannel);
    m_process->start(m_helperPath, HelperProtocol::encodeArguments(m_layout, logicalCenter));

    qCDebug(lcHelper) << "Spawned" << m_helperPath << "at" << logicalCenter;
    // Async start: failures arrive through errorOccurred
}

void HelperProcessBackend::moveTo(const QPointF& logicalCenter)
{
    if (m_phase != Phase::Starting && m_phase != Phase::Armed) {
        return;
    }
    write(HelperProtocol::encodeMove(logicalCenter));
}

void HelperProcessBackend::disarm()
{
    if (m_phase != Phase::Starting && m_phase != Phase::Armed) {
        Q_EMIT disarmed();
        return;
    }
    m_phase = Phase::ShuttingDown;
    write(HelperProtocol::encodeShutdown());
    m_shutdownTimer.start();
}

void HelperProcessBackend::abort()
{
    m_shutdownTimer.stop();
    if (isRunning()) {
        write(HelperProtocol::encodeShutdown());
        stopProcess();
    }
    m_phase = Phase::Idle;
}

void HelperProcessBackend::write(const QByteArray& line)
{
    if (!isRunning()) {
        return;
    }
    if (m_process->write(line) != line.size()) {
        qCWarning(lcHelper) << "Short write to sensor helper stdin:" << m_process->errorString();
    }
}

void HelperProcessBackend::stopProcess()
{
    if (!isRunning()) {
        return;
    }
    m_stopping = true;
    // Graceful: SIGTERM first, then SIGKILL if unresponsive
    m_process->terminate();
    if (!m_process->waitForFinished(500)) {
        m_process->kill();
        m_process->waitForFinished(500);
    }
    m_stopping = false;
}

void HelperProcessBackend::finishDisarm()
{
    m_shutdownTimer.stop();
    m_phase = Phase::Idle;
    Q_EMIT disarmed();
}

void HelperProcessBackend::onShutdownTimeout()
{
    if (m_phase != Phase::ShuttingDown) {
        return;
    }
    qCWarning(lcHelper) << "Sensor helper did not acknowledge shutdown within" << m_shutdownTimer.interval()
                        << "ms, terminating it";
    stopProcess();
    finishDisarm();
}

void HelperProcessBackend::onReadyReadStandardOutput()
{
    if (!m_process) {
        return;
    }
    m_stdoutBuffer += m_process->readAllStandardOutput();

    // Guard against unbounded buffer growth from malformed data (no newlines)
    if (m_stdoutBuffer.size() > kMaxStdoutBufferSize) {
        qCWarning(lcHelper) << "Sensor helper stdout buffer exceeded" << kMaxStdoutBufferSize
                            << "bytes, discarding oldest data";
        m_stdoutBuffer = m_stdoutBuffer.mid(m_stdoutBuffer.size() - kMaxStdoutBufferSize / 2);
    }

    qsizetype newlineIndex;
    while ((newlineIndex = m_stdoutBuffer.indexOf('\n')) != -1) {
        const QByteArray line = m_stdoutBuffer.left(newlineIndex).trimmed();
        m_stdoutBuffer = m_stdoutBuffer.mid(newlineIndex + 1);
        if (line.isEmpty()) {
            continue;
        }
        if (const std::optional<HelperProtocol::Message> message = HelperProtocol::decodeMessage(line)) {
            handleMessage(*message);
        }
    }
}

void HelperProcessBackend::handleMessage(const HelperProtocol::Message& message)
{
    switch (message.type) {
    case HelperProtocol::Message::Type::Ready: {
        if (m_phase != Phase::Starting) {
            return;
        }
        m_phase = Phase::Armed;
        // Host-side record of where the helper put its windows
        QVector<SensorWindowSpec> plan;
        const QVector<MonitorDescriptor> monitors = m_monitorProvider ? m_monitorProvider() : QVector<MonitorDescriptor>();
        const int index = CoordinateUtils::monitorIndexForLogical(m_armCenter, monitors);
        if (index >= 0) {
            const CoordinateUtils::NormalizedPoint center =
                CoordinateUtils::normalize(m_armCenter.x(), m_armCenter.y(), monitors);
            plan = SensorGrid::plan(QPoint(qRound(center.x), qRound(center.y)), monitors.at(index), m_layout);
        }
        qCDebug(lcHelper) << "Sensor helper ready with" << message.windowCount << "windows";
        Q_EMIT armed(plan);
        break;
    }
    case HelperProtocol::Message::Type::Error:
        qCWarning(lcHelper) << "Sensor helper failed:" << errorCodeName(message.errorCode) << message.errorMessage;
        m_failureReported = true;
        m_shutdownTimer.stop();
        m_phase = Phase::Idle;
        Q_EMIT armFailed(message.errorMessage);
        break;
    case HelperProtocol::Message::Type::ShutdownAck:
        if (m_phase == Phase::ShuttingDown) {
            finishDisarm();
        }
        break;
    case HelperProtocol::Message::Type::DragCallback:
        Q_EMIT callbackReceived(message.callback);
        break;
    }
}

void HelperProcessBackend::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    // Lines written right before exit (a drop, the ack) are still buffered
    onReadyReadStandardOutput();

    if (m_stopping) {
        return;
    }

    const bool clean = exitStatus == QProcess::NormalExit && exitCode == 0;
    switch (m_phase) {
    case Phase::Idle:
        break;
    case Phase::ShuttingDown:
        if (clean) {
            finishDisarm();
        } else {
            m_shutdownTimer.stop();
            m_phase = Phase::Idle;
            Q_EMIT terminated(QStringLiteral("Sensor helper exited during shutdown (exit code %1)").arg(exitCode));
        }
        break;
    case Phase::Starting:
        m_phase = Phase::Idle;
        if (!m_failureReported) {
            m_failureReported = true;
            Q_EMIT armFailed(QStringLiteral("Sensor helper exited before creating windows (exit code %1)").arg(exitCode));
        }
        break;
    case Phase::Armed:
        m_phase = Phase::Idle;
        qCWarning(lcHelper) << "Sensor helper exited unexpectedly, exit code" << exitCode << exitStatus;
        Q_EMIT terminated(QStringLiteral("Sensor helper exited unexpectedly (exit code %1)").arg(exitCode));
        break;
    }
}

void HelperProcessBackend::onProcessError(QProcess::ProcessError error)
{
    // Suppress errors from intentional stop - SIGTERM causes QProcess::Crashed
    if (m_stopping) {
        return;
    }
    const QString message = m_process ? m_process->errorString() : QStringLiteral("Unknown error");
    qCWarning(lcHelper) << "Sensor helper process error:" << error << message;

    if (error == QProcess::FailedToStart && m_phase == Phase::Starting) {
        m_phase = Phase::Idle;
        m_failureReported = true;
        Q_EMIT armFailed(QStringLiteral("Cannot start sensor helper: %1").arg(message));
    }
}

} // namespace DragSense
