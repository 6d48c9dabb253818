// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "../core/errors.h"
#include "../core/eventbus.h"
#include "../core/sensorgrid.h"
#include "../core/types.h"
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QVariant>
#include <functional>
#include <memory>

class QThread;

namespace DragSense {

class DragMonitor;
class ISensorBackend;
class KeyboardSource;
class PointerSource;
class ScreenManager;

/**
 * @brief Host-facing facade of the pointer, keyboard and drag monitors
 *
 * Every operation is non-blocking and returns an OperationResult; events reach
 * listeners through the event bus on their own threads.
 *
 * Pointer samples come from one PointerSource. Pointer monitoring publishes
 * them (in physical coordinates) as PointerEvents; drag monitoring forwards
 * them to a DragMonitor, which runs on this thread for in-process sensor
 * windows and on a dedicated thread for the sensor helper. Key samples come
 * from a separate KeyboardSource and are published as KeyboardEvents.
 *
 * Must be created and called on the GUI thread.
 */
class DRAGSENSE_EXPORT Monitor : public QObject
{
    Q_OBJECT

public:
    using BackendFactory = std::function<ISensorBackend*()>;

    explicit Monitor(QObject* parent = nullptr);
    ~Monitor() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Wiring (before start)
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Replace the pointer hook; defaults to the xcb source
     *
     * Ignored while a monitor is running.
     */
    void setPointerSource(std::unique_ptr<PointerSource> source);

    /**
     * @brief Replace the keyboard hook; defaults to the xcb source
     *
     * Ignored while keyboard monitoring runs.
     */
    void setKeyboardSource(std::unique_ptr<KeyboardSource> source);

    /**
     * @brief Override sensor backend selection (used by tests)
     */
    void setSensorBackendFactory(BackendFactory factory);

    /**
     * @brief Track screens through @p screenManager instead of one-off snapshots
     */
    void setScreenManager(ScreenManager* screenManager);

    void setMonitors(const QVector<MonitorDescriptor>& monitors);
    QVector<MonitorDescriptor> monitors() const;

    void setLayout(const GridLayout& layout);
    void setButtonMask(int mask);
    void setHelperShutdownTimeoutMs(int ms);
    void setDropGraceMs(int ms);

    // ═══════════════════════════════════════════════════════════════════════════
    // Pointer monitoring
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Install the global pointer hook and start publishing PointerEvents
     *
     * Idempotent. PermissionDenied if the hook cannot be installed.
     */
    OperationResult startPointerMonitor();
    OperationResult stopPointerMonitor();
    bool isPointerMonitoring() const;

    EventBus::Handle onPointerEvent(EventBus::PointerCallback callback, QObject* context = nullptr);
    bool removePointerEventListener(EventBus::Handle handle);

    // ═══════════════════════════════════════════════════════════════════════════
    // Keyboard monitoring
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Install the global keyboard hook and start publishing KeyboardEvents
     *
     * Idempotent. PermissionDenied if the hook cannot be installed.
     */
    OperationResult startKeyboardMonitor();
    OperationResult stopKeyboardMonitor();
    bool isKeyboardMonitoring() const;

    EventBus::Handle onKeyboardEvent(EventBus::KeyboardCallback callback, QObject* context = nullptr);
    bool removeKeyboardEventListener(EventBus::Handle handle);

    // ═══════════════════════════════════════════════════════════════════════════
    // Drag monitoring
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Point the drag monitor at a sensor helper executable
     *
     * InvalidArgument for an empty locator, HelperUnavailable if it does not
     * name an executable file. Takes effect at the next startDragMonitor().
     */
    OperationResult configureDragMonitor(const QString& helperLocator);
    QString helperPath() const;

    OperationResult startDragMonitor();
    OperationResult stopDragMonitor();
    bool isDragMonitoring() const;

    EventBus::Handle onDragEvent(EventBus::DragCallback callback, QObject* context = nullptr);
    bool removeDragEventListener(EventBus::Handle handle);

    /**
     * @brief Deliver one dropped_file event per path, in order
     *
     * Independent of drag monitoring. InvalidArgument for an empty list.
     */
    OperationResult simulateDragEvent(const QStringList& filePaths);

    /**
     * @brief Variant overload for loosely typed callers (D-Bus)
     *
     * InvalidArgument unless @p filePaths is a non-empty list of strings.
     */
    OperationResult simulateDragEvent(const QVariant& filePaths);

    /**
     * @brief Color of the pixel at logical (@p x, @p y); CaptureFailed on denial
     */
    ColorSample sampleColorAt(qreal x, qreal y);

    EventBus* eventBus() const
    {
        return m_bus;
    }

Q_SIGNALS:
    void pointerMonitoringChanged(bool active);
    void keyboardMonitoringChanged(bool active);
    void dragMonitoringChanged(bool active);
    void monitorError(int code, const QString& message);

    /// Internal: carries hook samples to the drag monitor's thread
    void pointerSampleForDrag(const DragSense::PointerSample& sample);

private Q_SLOTS:
    void onDragEventFromMonitor(const DragSense::DragEvent& event);
    void onDragMonitorError(DragSense::ErrorCode code, const QString& message);
    void onDragMonitorTerminated(const QString& message);

private:
    void ensurePointerSource();
    ISensorBackend* createBackend(OperationResult* result);
    void configureBackend(ISensorBackend* backend) const;
    void publishPointerSample(const PointerSample& sample);
    void publishKeySample(const KeySample& sample);
    void forwardDragSample(const PointerSample& sample);
    void teardownDragMonitor(bool wait);
    OperationResult report(const OperationResult& result);

    EventBus* m_bus;
    std::unique_ptr<PointerSource> m_pointerSource;
    std::unique_ptr<KeyboardSource> m_keyboardSource;
    QPointer<ScreenManager> m_screenManager;
    BackendFactory m_backendFactory;

    // Shared with the pointer-hook thread and the drag monitor thread
    mutable QMutex m_mutex;
    struct State
    {
        bool pointerMonitoring = false;
        bool keyboardMonitoring = false;
        bool dragMonitoring = false;
        QVector<MonitorDescriptor> monitors;
    } m_state;

    DragMonitor* m_dragMonitor = nullptr;

    int m_pointerSubscription = 0;
    int m_keyboardSubscription = 0;
    int m_dragSubscription = 0;
    QThread* m_dragThread = nullptr;

    QString m_helperPath;
    GridLayout m_layout;
    int m_buttonMask;
    int m_helperShutdownTimeoutMs;
    int m_dropGraceMs = -1;
};

} // namespace DragSense
