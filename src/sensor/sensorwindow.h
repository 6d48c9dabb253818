// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "../core/types.h"
#include <QColor>
#include <QRasterWindow>
#include <functional>
#include <memory>

class QDropEvent;

namespace DragSense {

/**
 * @brief One sensor window as seen by SensorWindowManager
 */
class DRAGSENSE_EXPORT ISensorWindow
{
public:
    virtual ~ISensorWindow() = default;

    virtual QString sensorId() const = 0;

    /**
     * @brief Move/resize to a physical rect on @p monitor
     */
    virtual void place(const QRect& physical, const MonitorDescriptor& monitor) = 0;

    virtual void setTint(const QColor& color) = 0;
};

/**
 * @brief Creates sensor windows; replaced by a fake in tests
 */
class DRAGSENSE_EXPORT SensorWindowFactory
{
public:
    using CallbackSink = std::function<void(const DragCallbackEvent&)>;

    virtual ~SensorWindowFactory() = default;

    /**
     * @brief Create and show one sensor window
     * @param sink Receives every drag callback of the window
     * @param errorMessage Set when nullptr is returned
     * @return The window, or nullptr if the platform refused to create it
     */
    virtual std::unique_ptr<ISensorWindow> create(const QString& sensorId, const QRect& physical,
                                                  const MonitorDescriptor& monitor, CallbackSink sink,
                                                  QString* errorMessage) = 0;
};

/**
 * @brief Borderless always-on-top drop target
 *
 * X11: override-redirect tool window, so no window manager decoration,
 * focus or placement policy touches it.
 * Wayland: LayerShellQt overlay surface anchored top-left, positioned with
 * margins relative to its screen.
 *
 * Every DragEnter/DragMove carrying local file URLs is accepted so the
 * drag source keeps offering the drop here. Each local file produces its
 * own callback; non-file URLs are ignored.
 */
class DRAGSENSE_EXPORT SensorWindow : public QRasterWindow, public ISensorWindow
{
    Q_OBJECT

public:
    SensorWindow(const QString& sensorId, SensorWindowFactory::CallbackSink sink);
    ~SensorWindow() override;

    QString sensorId() const override
    {
        return m_sensorId;
    }

    void place(const QRect& physical, const MonitorDescriptor& monitor) override;
    void setTint(const QColor& color) override;

    /**
     * @brief Create the platform window and show it
     * @return false if the platform window could not be created
     */
    bool realize(QString* errorMessage);

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;

private:
    void emitForUrls(DragCallbackKind kind, const QDropEvent* event);
    void emitCallback(DragCallbackKind kind, const std::optional<QString>& filePath, const QPointF& localPos);

    QString m_sensorId;
    SensorWindowFactory::CallbackSink m_sink;
    QColor m_tint = Qt::transparent;
    QRect m_logicalGeometry;
    MonitorDescriptor m_monitor;
    bool m_hovering = false;
    bool m_layerShell = false;
};

/**
 * @brief Factory producing real SensorWindows on the GUI thread
 */
class DRAGSENSE_EXPORT QtSensorWindowFactory : public SensorWindowFactory
{
public:
    std::unique_ptr<ISensorWindow> create(const QString& sensorId, const QRect& physical,
                                          const MonitorDescriptor& monitor, CallbackSink sink,
                                          QString* errorMessage) override;
};

} // namespace DragSense
