// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "types.h"
#include <optional>

namespace DragSense {

/**
 * @brief Correlates sensor window callbacks with the open drag episode
 *
 * At most one episode exists at a time. Callbacks are tagged with the open
 * episode's id and passed through unchanged; nothing is deduplicated across
 * sensor windows. A callback arriving while no episode is open (the release
 * already closed it) is logged and dropped.
 *
 * Not thread-safe; owned by the windowing context.
 */
class DRAGSENSE_EXPORT DragEpisodeTracker
{
public:
    DragEpisodeTracker();

    /**
     * @brief Open a new episode in Armed state
     *
     * An episode still open is closed first.
     * @return Id of the new episode (monotonic, starting at 1)
     */
    quint64 open(const PointerSample& origin, const QVector<SensorWindowSpec>& sensorWindows);

    void updateSensorWindows(const QVector<SensorWindowSpec>& sensorWindows);

    /**
     * @brief Armed/Active -> Closing; callbacks are still accepted
     */
    void beginClosing();

    /**
     * @brief Drop the episode; later callbacks are discarded
     */
    void close();

    bool isOpen() const
    {
        return m_episode.has_value();
    }

    EpisodeState state() const
    {
        return m_episode ? m_episode->state : EpisodeState::Idle;
    }

    const std::optional<DragEpisode>& current() const
    {
        return m_episode;
    }

    /**
     * @brief Turn a sensor callback into a host-facing DragEvent
     * @return std::nullopt if no episode is open
     */
    std::optional<DragEvent> accept(const DragCallbackEvent& callback);

private:
    std::optional<DragEpisode> m_episode;
    quint64 m_nextEpisodeId = 1;
    QString m_platform;
};

} // namespace DragSense
