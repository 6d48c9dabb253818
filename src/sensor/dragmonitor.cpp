// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragmonitor.h"
#include "sensorbackend.h"
#include "../core/constants.h"
#include "../core/logging.h"

namespace DragSense {

DragMonitor::DragMonitor(ISensorBackend* backend, QObject* parent)
    : QObject(parent)
    , m_backend(backend)
    , m_buttonMask(Defaults::ButtonMask)
{
    m_backend->setParent(this);
    connect(m_backend, &ISensorBackend::armed, this, &DragMonitor::onArmed);
    connect(m_backend, &ISensorBackend::armFailed, this, &DragMonitor::onArmFailed);
    connect(m_backend, &ISensorBackend::disarmed, this, &DragMonitor::onDisarmed);
    connect(m_backend, &ISensorBackend::callbackReceived, this, &DragMonitor::onCallbackReceived);
    connect(m_backend, &ISensorBackend::terminated, this, &DragMonitor::onTerminated);
}

DragMonitor::~DragMonitor()
{
    abort();
}

void DragMonitor::setButtonMask(int mask)
{
    m_buttonMask = mask & Defaults::ButtonMask;
}

void DragMonitor::handleSample(const PointerSample& sample)
{
    switch (sample.kind) {
    case PointerKind::Down:
        if (!(m_buttonMask & buttonMaskBit(sample.button))) {
            return;
        }
        if (m_phase == Phase::Closing) {
            if (!m_pendingPress) {
                qCDebug(lcSensor) << "Press while closing, arming after teardown";
                m_pendingPress = sample;
            }
            return;
        }
        if (m_phase != Phase::Idle) {
            // A second button during an episode changes nothing
            return;
        }
        startEpisode(sample);
        break;

    case PointerKind::Move:
        if (m_phase == Phase::Arming || m_phase == Phase::Armed) {
            m_backend->moveTo(sample.position());
        } else if (m_pendingPress) {
            m_pendingPress->x = sample.x;
            m_pendingPress->y = sample.y;
        }
        break;

    case PointerKind::Up:
        if (m_pendingPress && sample.button == m_pendingPress->button) {
            m_pendingPress.reset();
            return;
        }
        if (sample.button != m_activeButton) {
            return;
        }
        if (m_phase == Phase::Arming || m_phase == Phase::Armed) {
            m_phase = Phase::Closing;
            m_activeButton = PointerButton::None;
            m_episodes.beginClosing();
            m_backend->disarm();
        }
        break;

    case PointerKind::Wheel:
        break;
    }
}

void DragMonitor::startEpisode(const PointerSample& press)
{
    m_activeButton = press.button;
    m_phase = Phase::Arming;
    // Open first: the local backend reports armed() from inside arm()
    m_episodes.open(press, {});
    m_backend->arm(press.position());
}

void DragMonitor::abort()
{
    m_pendingPress.reset();
    if (m_phase == Phase::Idle) {
        return;
    }
    qCInfo(lcSensor) << "Aborting drag episode in phase" << m_phase;
    m_backend->abort();
    reset();
}

void DragMonitor::reset()
{
    m_episodes.close();
    m_phase = Phase::Idle;
    m_activeButton = PointerButton::None;
    m_pendingPress.reset();
}

void DragMonitor::onArmed(const QVector<SensorWindowSpec>& plan)
{
    // Closing is possible when the release beat the helper's ready line
    if (m_phase == Phase::Arming) {
        m_phase = Phase::Armed;
    } else if (m_phase != Phase::Closing) {
        qCDebug(lcSensor) << "Ignoring armed() in phase" << m_phase;
        return;
    }
    m_episodes.updateSensorWindows(plan);
}

void DragMonitor::onArmFailed(const QString& message)
{
    if (m_phase == Phase::Idle) {
        return;
    }
    qCWarning(lcSensor) << "Sensor window creation failed:" << message;
    reset();
    Q_EMIT errorOccurred(ErrorCode::WindowCreationFailed, message);
    Q_EMIT dragEvent(DragEvent::status(EventTypes::WindowCreationFailed, message));
}

void DragMonitor::onDisarmed()
{
    if (m_phase != Phase::Closing) {
        return;
    }
    const std::optional<PointerSample> pending = m_pendingPress;
    reset();
    if (pending) {
        startEpisode(*pending);
    }
}

void DragMonitor::onCallbackReceived(const DragCallbackEvent& callback)
{
    if (const std::optional<DragEvent> event = m_episodes.accept(callback)) {
        Q_EMIT dragEvent(*event);
    }
}

void DragMonitor::onTerminated(const QString& message)
{
    qCWarning(lcSensor) << "Sensor backend terminated:" << message;
    reset();
    Q_EMIT errorOccurred(ErrorCode::MonitorTerminatedUnexpectedly, message);
    Q_EMIT dragEvent(DragEvent::status(EventTypes::MonitorTerminated, message));
    Q_EMIT terminated(message);
}

} // namespace DragSense
