// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QFile>
#include <QSaveFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "config/configwatcher.h"

using namespace DragSense;

namespace {

bool writeFile(const QString& path, const QByteArray& contents)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    file.write(contents);
    return file.commit();
}

} // anonymous namespace

/**
 * @brief Unit tests for ConfigWatcher
 *
 * Tests cover:
 * - Other rc files in the same directory do not trigger a reload
 * - Creating, replacing and removing the watched file do
 */
class TestConfigWatcher : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void otherFilesInDirectory_areIgnored()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QVERIFY(writeFile(dir.filePath(QStringLiteral("dragsenserc")), "[General]\nLayout=frame\n"));

        ConfigWatcher watcher(dir.filePath(QStringLiteral("dragsenserc")));
        watcher.setDebounceMs(20);
        QVERIFY(watcher.start());
        QSignalSpy changedSpy(&watcher, &ConfigWatcher::changed);

        QVERIFY(writeFile(dir.filePath(QStringLiteral("kwinrc")), "[Windows]\nFocusPolicy=ClickToFocus\n"));
        QVERIFY(writeFile(dir.filePath(QStringLiteral("kdeglobals")), "[General]\nColorScheme=BreezeDark\n"));
        QTest::qWait(300);
        QCOMPARE(changedSpy.count(), 0);
    }

    void watchedFile_createReplaceRemove()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("dragsenserc"));

        ConfigWatcher watcher(path);
        watcher.setDebounceMs(20);
        QVERIFY(watcher.start());
        QSignalSpy changedSpy(&watcher, &ConfigWatcher::changed);

        QVERIFY(writeFile(path, "[General]\nLayout=frame\n"));
        QTRY_COMPARE(changedSpy.count(), 1);

        // Replaced like KConfig::sync() does, with new contents
        QVERIFY(writeFile(path, "[General]\nLayout=grid\nGridSize=7\n"));
        QTRY_COMPARE(changedSpy.count(), 2);

        QVERIFY(QFile::remove(path));
        QTRY_COMPARE(changedSpy.count(), 3);
    }
};

QTEST_GUILESS_MAIN(TestConfigWatcher)
#include "test_config_watcher.moc"
