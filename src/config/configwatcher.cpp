// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "configwatcher.h"
#include "../core/logging.h"
#include <QFileInfo>

namespace DragSense {

static constexpr int DefaultDebounceMs = 300;

ConfigWatcher::ConfigWatcher(const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
    , m_watcher(this)
    , m_debounce(this)
{
    m_debounce.setSingleShot(true);
    m_debounce.setInterval(DefaultDebounceMs);
    connect(&m_debounce, &QTimer::timeout, this, &ConfigWatcher::compareStamp);
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged, this, &ConfigWatcher::onPathChanged);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged, this, &ConfigWatcher::onPathChanged);
}

void ConfigWatcher::setDebounceMs(int ms)
{
    m_debounce.setInterval(qMax(0, ms));
}

bool ConfigWatcher::start()
{
    const QString directory = QFileInfo(m_filePath).absolutePath();
    m_stamp = stampOf(m_filePath);
    if (!m_watcher.addPath(directory)) {
        qCWarning(lcConfig) << "Cannot watch" << directory;
        return false;
    }
    if (m_stamp.exists) {
        watchFile();
    }
    qCDebug(lcConfig) << "Watching" << m_filePath;
    return true;
}

ConfigWatcher::Stamp ConfigWatcher::stampOf(const QString& filePath)
{
    const QFileInfo info(filePath);
    Stamp stamp;
    stamp.exists = info.exists();
    if (stamp.exists) {
        stamp.modified = info.lastModified();
        stamp.size = info.size();
    }
    return stamp;
}

void ConfigWatcher::watchFile()
{
    // Directory events still cover the file
    if (!m_watcher.addPath(m_filePath)) {
        qCDebug(lcConfig) << "Cannot watch" << m_filePath << "directly";
    }
}

void ConfigWatcher::onPathChanged()
{
    m_debounce.start();
}

void ConfigWatcher::compareStamp()
{
    const Stamp current = stampOf(m_filePath);
    // A replaced file drops out of the watcher
    if (current.exists && !m_watcher.files().contains(m_filePath)) {
        watchFile();
    }
    if (current == m_stamp) {
        return;
    }
    m_stamp = current;
    qCInfo(lcConfig) << m_filePath << "changed on disk";
    Q_EMIT changed();
}

} // namespace DragSense
