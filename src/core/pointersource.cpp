// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pointersource.h"
#include "logging.h"
#include <QMutexLocker>

namespace DragSense {

PointerSource::PointerSource(QObject* parent)
    : QObject(parent)
{
}

PointerSource::~PointerSource() = default;

OperationResult PointerSource::subscribe(SampleCallback callback, int* subscriptionId)
{
    if (!callback) {
        return OperationResult::failure(ErrorCode::InvalidArgument, QStringLiteral("Empty pointer callback"));
    }

    QMutexLocker lifecycle(&m_lifecycleMutex);
    bool needsInstall = false;
    {
        QMutexLocker locker(&m_mutex);
        needsInstall = !m_installed;
    }

    if (needsInstall) {
        // install() may start a thread that calls deliver(), so not under the lock
        const OperationResult result = install();
        if (!result.ok()) {
            qCWarning(lcPointer) << "Failed to install pointer hook:" << result.message;
            return result;
        }
        qCInfo(lcPointer) << "Pointer hook installed";
    }

    QMutexLocker locker(&m_mutex);
    m_installed = true;
    const int id = m_nextSubscriptionId++;
    m_subscribers.insert(id, std::move(callback));
    if (subscriptionId) {
        *subscriptionId = id;
    }
    return OperationResult::success();
}

bool PointerSource::unsubscribe(int subscriptionId)
{
    QMutexLocker lifecycle(&m_lifecycleMutex);
    bool needsUninstall = false;
    {
        QMutexLocker locker(&m_mutex);
        if (m_subscribers.remove(subscriptionId) == 0) {
            return false;
        }
        if (m_subscribers.isEmpty() && m_installed) {
            m_installed = false;
            needsUninstall = true;
        }
    }

    if (needsUninstall) {
        uninstall();
        qCInfo(lcPointer) << "Pointer hook removed";
    }
    return true;
}

int PointerSource::subscriberCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_subscribers.size();
}

bool PointerSource::isInstalled() const
{
    QMutexLocker locker(&m_mutex);
    return m_installed;
}

void PointerSource::setMonitors(const QVector<MonitorDescriptor>& monitors)
{
    QMutexLocker locker(&m_mutex);
    m_monitors = monitors;
}

QVector<MonitorDescriptor> PointerSource::monitors() const
{
    QMutexLocker locker(&m_mutex);
    return m_monitors;
}

void PointerSource::deliver(const PointerSample& sample)
{
    QVector<SampleCallback> callbacks;
    {
        QMutexLocker locker(&m_mutex);
        callbacks.reserve(m_subscribers.size());
        for (const SampleCallback& callback : std::as_const(m_subscribers)) {
            callbacks.append(callback);
        }
    }

    for (const SampleCallback& callback : std::as_const(callbacks)) {
        callback(sample);
    }
}

void PointerSource::shutdown()
{
    QMutexLocker lifecycle(&m_lifecycleMutex);
    bool needsUninstall = false;
    {
        QMutexLocker locker(&m_mutex);
        m_subscribers.clear();
        needsUninstall = m_installed;
        m_installed = false;
    }
    if (needsUninstall) {
        uninstall();
    }
}

} // namespace DragSense
