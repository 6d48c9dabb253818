// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragepisode.h"
#include "logging.h"
#include "platform.h"

namespace DragSense {

DragEpisodeTracker::DragEpisodeTracker()
    : m_platform(Platform::osName())
{
}

quint64 DragEpisodeTracker::open(const PointerSample& origin, const QVector<SensorWindowSpec>& sensorWindows)
{
    if (m_episode) {
        qCWarning(lcEpisode) << "Episode" << m_episode->episodeId << "still open, closing it first";
        close();
    }

    DragEpisode episode;
    episode.episodeId = m_nextEpisodeId++;
    episode.originPointer = origin;
    episode.sensorWindows = sensorWindows;
    episode.state = EpisodeState::Armed;
    m_episode = episode;

    qCInfo(lcEpisode) << "Episode" << episode.episodeId << "opened at" << origin.x << origin.y << "with"
                      << sensorWindows.size() << "sensor windows";
    return episode.episodeId;
}

void DragEpisodeTracker::updateSensorWindows(const QVector<SensorWindowSpec>& sensorWindows)
{
    if (m_episode) {
        m_episode->sensorWindows = sensorWindows;
    }
}

void DragEpisodeTracker::beginClosing()
{
    if (m_episode) {
        m_episode->state = EpisodeState::Closing;
    }
}

void DragEpisodeTracker::close()
{
    if (!m_episode) {
        return;
    }
    qCInfo(lcEpisode) << "Episode" << m_episode->episodeId << "closed";
    m_episode.reset();
}

std::optional<DragEvent> DragEpisodeTracker::accept(const DragCallbackEvent& callback)
{
    if (!m_episode) {
        qCInfo(lcEpisode) << "Discarding" << dragCallbackKindName(callback.kind) << "from"
                          << callback.originatingSensorWindow << "- no open episode";
        return std::nullopt;
    }

    if (callback.kind == DragCallbackKind::HoveredFile && m_episode->state == EpisodeState::Armed) {
        m_episode->state = EpisodeState::Active;
        qCDebug(lcEpisode) << "Episode" << m_episode->episodeId << "active";
    }

    DragEvent event;
    event.eventType = dragCallbackKindName(callback.kind);
    event.filePath = callback.filePath.value_or(QString());
    event.x = callback.x;
    event.y = callback.y;
    event.timestamp = callback.timestamp;
    event.platform = m_platform;
    event.windowId = callback.originatingSensorWindow;
    event.episodeId = m_episode->episodeId;
    return event;
}

} // namespace DragSense
