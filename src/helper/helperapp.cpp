// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "helperapp.h"
#include "../core/logging.h"
#include "../sensor/screencolorsampler.h"
#include "../sensor/sensorwindow.h"
#include "../sensor/sensorwindowmanager.h"
#include <QCoreApplication>
#include <QSocketNotifier>

#include <cerrno>
#include <cstdio>
#include <unistd.h>

namespace DragSense {

// Guard against a host writing without newlines
static constexpr int kMaxStdinBufferSize = 65536;

// Sampled color is a hint, not an opaque cover
static constexpr int kTintAlpha = 48;

HelperApp::HelperApp(const GridLayout& layout, QObject* parent)
    : QObject(parent)
    , m_layout(layout)
{
    if (!m_stdout.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        qCCritical(lcHelper) << "Cannot open stdout:" << m_stdout.errorString();
    }
}

HelperApp::~HelperApp()
{
    if (m_manager) {
        m_manager->abort();
    }
}

void HelperApp::setDropGraceMs(int ms)
{
    m_dropGraceMs = ms;
}

void HelperApp::setThemeSensorWindows(bool enabled)
{
    m_themeSensorWindows = enabled;
}

bool HelperApp::start(const QPointF& logicalCenter)
{
    m_manager = new SensorWindowManager(std::make_unique<QtSensorWindowFactory>(), this);
    m_manager->setLayout(m_layout);
    if (m_dropGraceMs >= 0) {
        m_manager->setDropGraceMs(m_dropGraceMs);
    }
    if (m_themeSensorWindows) {
        const ColorSample sample = ScreenColorSampler::sampleAt(logicalCenter.x(), logicalCenter.y());
        if (sample.ok()) {
            QColor tint = sample.color;
            tint.setAlpha(kTintAlpha);
            m_manager->setTint(tint);
        }
    }

    connect(m_manager, &SensorWindowManager::callbackReceived, this, [this](const DragCallbackEvent& callback) {
        writeLine(HelperProtocol::encodeCallback(callback));
    });
    connect(m_manager, &SensorWindowManager::closed, this, &HelperApp::onManagerClosed);

    const OperationResult result = m_manager->arm(logicalCenter);
    if (!result.ok()) {
        reportError(result.code, result.message);
        return false;
    }
    writeLine(HelperProtocol::encodeReady(m_manager->windowCount()));

    m_stdinNotifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_stdinNotifier, &QSocketNotifier::activated, this, &HelperApp::onStdinReadable);

    qCInfo(lcHelper) << "Armed" << m_manager->windowCount() << m_layout.name() << "sensor windows at"
                     << logicalCenter;
    return true;
}

void HelperApp::reportError(ErrorCode code, const QString& message)
{
    qCWarning(lcHelper) << errorCodeName(code) << message;
    writeLine(HelperProtocol::encodeError(code, message));
}

void HelperApp::onStdinReadable()
{
    char chunk[4096];
    const ssize_t count = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    if (count < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return;
        }
        qCWarning(lcHelper) << "stdin read failed, errno" << errno;
        beginShutdown(false);
        return;
    }
    if (count == 0) {
        qCInfo(lcHelper) << "Host closed stdin, shutting down";
        m_stdinNotifier->setEnabled(false);
        beginShutdown(false);
        return;
    }

    m_stdinBuffer.append(chunk, static_cast<qsizetype>(count));
    if (m_stdinBuffer.size() > kMaxStdinBufferSize) {
        qCWarning(lcHelper) << "stdin buffer exceeded" << kMaxStdinBufferSize << "bytes, discarding";
        m_stdinBuffer.clear();
        return;
    }

    qsizetype newlineIndex;
    while ((newlineIndex = m_stdinBuffer.indexOf('\n')) != -1) {
        const QByteArray line = m_stdinBuffer.left(newlineIndex).trimmed();
        m_stdinBuffer = m_stdinBuffer.mid(newlineIndex + 1);
        if (line.isEmpty()) {
            continue;
        }
        if (const std::optional<HelperProtocol::Command> command = HelperProtocol::decodeCommand(line)) {
            handleCommand(*command);
        }
    }
}

void HelperApp::handleCommand(const HelperProtocol::Command& command)
{
    switch (command.type) {
    case HelperProtocol::Command::Type::Move:
        if (!m_shuttingDown) {
            m_manager->moveTo(command.position);
        }
        break;
    case HelperProtocol::Command::Type::Shutdown:
        beginShutdown(true);
        break;
    }
}

void HelperApp::beginShutdown(bool acknowledge)
{
    m_acknowledge = m_acknowledge || acknowledge;
    if (m_shuttingDown) {
        return;
    }
    m_shuttingDown = true;

    // Windows linger for the drop grace period; closed() follows
    if (m_manager && m_manager->state() == SensorWindowManager::State::Armed) {
        m_manager->disarm();
    } else {
        onManagerClosed();
    }
}

void HelperApp::onManagerClosed()
{
    if (!m_shuttingDown) {
        return;
    }
    if (m_acknowledge) {
        writeLine(HelperProtocol::encodeShutdownAck());
    }
    qCInfo(lcHelper) << "Sensor windows closed, exiting";
    QCoreApplication::exit(ExitOk);
}

void HelperApp::writeLine(const QByteArray& line)
{
    if (!m_stdout.isOpen()) {
        return;
    }
    if (m_stdout.write(line) != line.size()) {
        // Host is gone; nobody is left to deliver to
        qCWarning(lcHelper) << "stdout write failed:" << m_stdout.errorString();
        QCoreApplication::exit(ExitOk);
    }
}

} // namespace DragSense
