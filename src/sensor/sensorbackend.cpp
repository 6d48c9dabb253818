// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sensorbackend.h"
#include "sensorwindowmanager.h"
#include "../core/logging.h"

namespace DragSense {

LocalSensorBackend::LocalSensorBackend(SensorWindowManager* manager, QObject* parent)
    : ISensorBackend(parent)
    , m_manager(manager)
{
    m_manager->setParent(this);
    connect(m_manager, &SensorWindowManager::armed, this, &ISensorBackend::armed);
    connect(m_manager, &SensorWindowManager::windowCreationFailed, this, &ISensorBackend::armFailed);
    connect(m_manager, &SensorWindowManager::closed, this, &ISensorBackend::disarmed);
    connect(m_manager, &SensorWindowManager::callbackReceived, this, &ISensorBackend::callbackReceived);
}

LocalSensorBackend::~LocalSensorBackend()
{
    // No signals out of a half-destroyed backend
    m_manager->disconnect(this);
}

void LocalSensorBackend::arm(const QPointF& logicalCenter)
{
    // Failures are reported through windowCreationFailed -> armFailed
    const OperationResult result = m_manager->arm(logicalCenter);
    if (!result.ok()) {
        qCDebug(lcSensor) << "Local arm failed:" << result.message;
    }
}

void LocalSensorBackend::moveTo(const QPointF& logicalCenter)
{
    m_manager->moveTo(logicalCenter);
}

void LocalSensorBackend::disarm()
{
    m_manager->disarm();
}

void LocalSensorBackend::abort()
{
    const QSignalBlocker blocker(m_manager);
    m_manager->abort();
}

} // namespace DragSense
