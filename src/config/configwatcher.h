// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include <QDateTime>
#include <QFileSystemWatcher>
#include <QObject>
#include <QString>
#include <QTimer>

namespace DragSense {

/**
 * @brief Reports changes of one rc file on disk
 *
 * KConfig replaces the file on sync, so the containing directory is watched
 * and the file is re-added whenever it reappears. Directory events are
 * debounced and only reported when the file's existence, modification time
 * or size differ from the last seen state, so other applications writing
 * their own rc files stay silent.
 */
class DRAGSENSE_EXPORT ConfigWatcher : public QObject
{
    Q_OBJECT

public:
    explicit ConfigWatcher(const QString& filePath, QObject* parent = nullptr);

    /**
     * @return false if the directory cannot be watched
     */
    bool start();

    QString filePath() const
    {
        return m_filePath;
    }

    void setDebounceMs(int ms);

Q_SIGNALS:
    void changed();

private:
    struct Stamp
    {
        bool exists = false;
        QDateTime modified;
        qint64 size = -1;

        bool operator==(const Stamp& other) const = default;
    };

    static Stamp stampOf(const QString& filePath);
    void watchFile();
    void onPathChanged();
    void compareStamp();

    QString m_filePath;
    QFileSystemWatcher m_watcher;
    QTimer m_debounce;
    Stamp m_stamp;
};

} // namespace DragSense
