// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboardsource.h"
#include "logging.h"
#include <QMutexLocker>
#include <QVector>

namespace DragSense {

KeyboardSource::KeyboardSource(QObject* parent)
    : QObject(parent)
{
}

KeyboardSource::~KeyboardSource() = default;

OperationResult KeyboardSource::subscribe(SampleCallback callback, int* subscriptionId)
{
    if (!callback) {
        return OperationResult::failure(ErrorCode::InvalidArgument, QStringLiteral("Empty keyboard callback"));
    }

    QMutexLocker lifecycle(&m_lifecycleMutex);
    bool needsInstall = false;
    {
        QMutexLocker locker(&m_mutex);
        needsInstall = !m_installed;
    }

    if (needsInstall) {
        const OperationResult result = install();
        if (!result.ok()) {
            qCWarning(lcKeyboard) << "Failed to install keyboard hook:" << result.message;
            return result;
        }
        qCInfo(lcKeyboard) << "Keyboard hook installed";
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

bool KeyboardSource::unsubscribe(int subscriptionId)
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
        qCInfo(lcKeyboard) << "Keyboard hook removed";
    }
    return true;
}

int KeyboardSource::subscriberCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_subscribers.size();
}

bool KeyboardSource::isInstalled() const
{
    QMutexLocker locker(&m_mutex);
    return m_installed;
}

void KeyboardSource::deliver(const KeySample& sample)
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

void KeyboardSource::shutdown()
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
