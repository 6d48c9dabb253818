// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "../core/dragepisode.h"
#include "../core/errors.h"
#include "../core/types.h"
#include <QObject>
#include <optional>

namespace DragSense {

class ISensorBackend;

/**
 * @brief Lifecycle controller of the drag monitor
 *
 * Turns the pointer sample stream into arm/move/disarm requests for the
 * sensor backend and the backend's callbacks into DragEvents. Samples arrive
 * through handleSample() as queued calls, so the controller sees them in
 * order on its own thread.
 *
 * Phases:
 * - Idle: no episode
 * - Arming: qualifying press seen, backend creating windows
 * - Armed: windows follow the pointer
 * - Closing: matching release seen, waiting for the backend to tear down
 *
 * A qualifying press during Closing is held back and armed as soon as the
 * backend reports disarmed(), so a late drop still belongs to the closing
 * episode. Releasing that press before then cancels it.
 */
class DRAGSENSE_EXPORT DragMonitor : public QObject
{
    Q_OBJECT

public:
    enum class Phase {
        Idle,
        Arming,
        Armed,
        Closing
    };
    Q_ENUM(Phase)

    /**
     * @param backend Takes ownership
     */
    explicit DragMonitor(ISensorBackend* backend, QObject* parent = nullptr);
    ~DragMonitor() override;

    /**
     * @brief Buttons that start an episode (bit 0 left, bit 1 middle, bit 2 right)
     */
    void setButtonMask(int mask);
    int buttonMask() const
    {
        return m_buttonMask;
    }

    Phase phase() const
    {
        return m_phase;
    }

    ISensorBackend* backend() const
    {
        return m_backend;
    }

    const DragEpisodeTracker& episodes() const
    {
        return m_episodes;
    }

public Q_SLOTS:
    /**
     * @brief Feed one raw pointer sample (logical coordinates)
     */
    void handleSample(const DragSense::PointerSample& sample);

    /**
     * @brief Forced stop: tear down any episode without emitting events
     */
    void abort();

Q_SIGNALS:
    void dragEvent(const DragSense::DragEvent& event);
    void errorOccurred(DragSense::ErrorCode code, const QString& message);

    /**
     * @brief The windowing context died; drag monitoring cannot continue
     */
    void terminated(const QString& message);

private Q_SLOTS:
    void onArmed(const QVector<DragSense::SensorWindowSpec>& plan);
    void onArmFailed(const QString& message);
    void onDisarmed();
    void onCallbackReceived(const DragSense::DragCallbackEvent& callback);
    void onTerminated(const QString& message);

private:
    void reset();
    void startEpisode(const PointerSample& press);

    ISensorBackend* m_backend;
    DragEpisodeTracker m_episodes;
    Phase m_phase = Phase::Idle;
    PointerButton m_activeButton = PointerButton::None;
    std::optional<PointerSample> m_pendingPress;
    int m_buttonMask;
};

} // namespace DragSense
