// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "core/constants.h"
#include "core/dragepisode.h"

using namespace DragSense;

namespace {

PointerSample press(qreal x, qreal y)
{
    PointerSample sample;
    sample.x = x;
    sample.y = y;
    sample.button = PointerButton::Left;
    sample.kind = PointerKind::Down;
    return sample;
}

DragCallbackEvent callback(DragCallbackKind kind, const QString& path, const QString& window)
{
    DragCallbackEvent event;
    event.kind = kind;
    if (!path.isEmpty()) {
        event.filePath = path;
    }
    event.x = 10;
    event.y = 20;
    event.timestamp = 1234.5;
    event.originatingSensorWindow = window;
    return event;
}

} // anonymous namespace

/**
 * @brief Unit tests for DragEpisodeTracker
 */
class TestDragEpisode : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void open_assignsMonotonicIds()
    {
        DragEpisodeTracker tracker;
        QCOMPARE(tracker.state(), EpisodeState::Idle);
        QCOMPARE(tracker.open(press(1, 1), {}), quint64(1));
        QCOMPARE(tracker.state(), EpisodeState::Armed);
        tracker.close();
        QCOMPARE(tracker.open(press(2, 2), {}), quint64(2));
        // Reopening closes the previous episode
        QCOMPARE(tracker.open(press(3, 3), {}), quint64(3));
        QCOMPARE(tracker.current()->originPointer.x, 3.0);
    }

    void accept_withoutEpisodeIsDiscarded()
    {
        DragEpisodeTracker tracker;
        QVERIFY(!tracker.accept(callback(DragCallbackKind::DroppedFile, QStringLiteral("/a"), QStringLiteral("w")))
                     .has_value());
    }

    void accept_tagsAndPassesThrough()
    {
        DragEpisodeTracker tracker;
        const quint64 id = tracker.open(press(5, 5), {});

        const std::optional<DragEvent> hovered =
            tracker.accept(callback(DragCallbackKind::HoveredFile, QStringLiteral("/a.txt"), QStringLiteral("w1")));
        QVERIFY(hovered.has_value());
        QCOMPARE(hovered->eventType, QString(EventTypes::HoveredFile));
        QCOMPARE(hovered->filePath, QStringLiteral("/a.txt"));
        QCOMPARE(hovered->windowId, QStringLiteral("w1"));
        QCOMPARE(hovered->episodeId, id);
        QCOMPARE(hovered->x, 10.0);
        QCOMPARE(hovered->timestamp, 1234.5);
        QCOMPARE(tracker.state(), EpisodeState::Active);

        // Same file hovered over a second window: no deduplication
        const std::optional<DragEvent> second =
            tracker.accept(callback(DragCallbackKind::HoveredFile, QStringLiteral("/a.txt"), QStringLiteral("w2")));
        QVERIFY(second.has_value());
        QCOMPARE(second->windowId, QStringLiteral("w2"));
    }

    void closing_stillAcceptsLateDrop()
    {
        DragEpisodeTracker tracker;
        tracker.open(press(0, 0), {});
        tracker.beginClosing();
        QCOMPARE(tracker.state(), EpisodeState::Closing);

        const std::optional<DragEvent> dropped =
            tracker.accept(callback(DragCallbackKind::DroppedFile, QStringLiteral("/b.jpg"), QStringLiteral("w")));
        QVERIFY(dropped.has_value());
        QCOMPARE(dropped->eventType, QString(EventTypes::DroppedFile));

        tracker.close();
        QVERIFY(!tracker.accept(callback(DragCallbackKind::DroppedFile, QStringLiteral("/c"), QStringLiteral("w")))
                     .has_value());
    }

    void hoverCancelled_hasNoPath()
    {
        DragEpisodeTracker tracker;
        tracker.open(press(0, 0), {});
        const std::optional<DragEvent> cancelled =
            tracker.accept(callback(DragCallbackKind::HoverCancelled, QString(), QStringLiteral("w")));
        QVERIFY(cancelled.has_value());
        QCOMPARE(cancelled->eventType, QString(EventTypes::HoverCancelled));
        QVERIFY(cancelled->filePath.isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestDragEpisode)
#include "test_drag_episode.moc"
