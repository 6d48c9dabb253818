// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sensorwindow.h"
#include "../core/coordinateutils.h"
#include "../core/logging.h"
#include "../core/platform.h"
#include <QCursor>
#include <QDragEnterEvent>
#include <QDragLeaveEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QGuiApplication>
#include <QMimeData>
#include <QPainter>
#include <QScreen>
#include <QSurfaceFormat>
#include <QUrl>
#include <algorithm>

#ifdef HAVE_LAYER_SHELL
#include <LayerShellQt/Window>
#endif

namespace DragSense {

namespace {

bool hasLocalFiles(const QMimeData* mime)
{
    if (!mime || !mime->hasUrls()) {
        return false;
    }
    const QList<QUrl> urls = mime->urls();
    return std::any_of(urls.cbegin(), urls.cend(), [](const QUrl& url) {
        return url.isLocalFile();
    });
}

QScreen* screenForMonitor(const MonitorDescriptor& monitor)
{
    for (QScreen* screen : QGuiApplication::screens()) {
        if (screen->name() == monitor.id) {
            return screen;
        }
    }
    return nullptr;
}

} // anonymous namespace

SensorWindow::SensorWindow(const QString& sensorId, SensorWindowFactory::CallbackSink sink)
    : m_sensorId(sensorId)
    , m_sink(std::move(sink))
{
    setObjectName(sensorId);
    setTitle(QStringLiteral("DragSense sensor"));
    setFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool | Qt::WindowDoesNotAcceptFocus
             | Qt::BypassWindowManagerHint);

    QSurfaceFormat surfaceFormat = format();
    surfaceFormat.setAlphaBufferSize(8);
    setFormat(surfaceFormat);

    m_layerShell = Platform::isWayland() && Platform::hasLayerShell();
}

SensorWindow::~SensorWindow()
{
    if (m_hovering) {
        qCDebug(lcSensor) << m_sensorId << "destroyed while a drag hovered it";
    }
}

bool SensorWindow::realize(QString* errorMessage)
{
#ifdef HAVE_LAYER_SHELL
    if (m_layerShell) {
        auto* layerWindow = LayerShellQt::Window::get(this);
        if (!layerWindow) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("LayerShellQt refused %1").arg(m_sensorId);
            }
            return false;
        }
        layerWindow->setScreenConfiguration(LayerShellQt::Window::ScreenFromQWindow);
        layerWindow->setLayer(LayerShellQt::Window::LayerOverlay);
        layerWindow->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityNone);
        layerWindow->setAnchors(
            LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorTop | LayerShellQt::Window::AnchorLeft));
        layerWindow->setExclusiveZone(-1);
        layerWindow->setScope(QStringLiteral("dragsense-sensor"));
    }
#endif

    create();
    if (!handle()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Platform window for %1 could not be created").arg(m_sensorId);
        }
        return false;
    }

    show();
    return true;
}

void SensorWindow::place(const QRect& physical, const MonitorDescriptor& monitor)
{
    const QRect logical = CoordinateUtils::physicalToLogical(physical, monitor);
    const bool screenChanged = m_monitor.id != monitor.id;
    m_monitor = monitor;

    if (screenChanged) {
        if (QScreen* screen = screenForMonitor(monitor)) {
            // Layer surfaces are bound to their output at creation
            const bool remap = m_layerShell && isVisible();
            if (remap) {
                hide();
            }
            setScreen(screen);
            if (remap) {
                show();
            }
        }
    }

#ifdef HAVE_LAYER_SHELL
    if (m_layerShell) {
        if (auto* layerWindow = LayerShellQt::Window::get(this)) {
            layerWindow->setMargins(
                QMargins(logical.x() - monitor.originX, logical.y() - monitor.originY, 0, 0));
        }
        resize(logical.size());
        m_logicalGeometry = logical;
        return;
    }
#endif

    if (logical != m_logicalGeometry) {
        setGeometry(logical);
        m_logicalGeometry = logical;
    }
    qCDebug(lcSensor) << m_sensorId << "placed at" << logical << "on" << monitor.id;
}

void SensorWindow::setTint(const QColor& color)
{
    if (m_tint == color) {
        return;
    }
    m_tint = color;
    requestUpdate();
}

void SensorWindow::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)
    QPainter painter(this);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(QRect(QPoint(0, 0), size()), m_tint);
}

bool SensorWindow::event(QEvent* event)
{
    switch (event->type()) {
    case QEvent::DragEnter: {
        auto* enter = static_cast<QDragEnterEvent*>(event);
        if (!hasLocalFiles(enter->mimeData())) {
            enter->ignore();
            return true;
        }
        enter->acceptProposedAction();
        m_hovering = true;
        emitForUrls(DragCallbackKind::HoveredFile, enter);
        return true;
    }
    case QEvent::DragMove: {
        auto* move = static_cast<QDragMoveEvent*>(event);
        if (m_hovering) {
            move->acceptProposedAction();
        } else {
            move->ignore();
        }
        return true;
    }
    case QEvent::DragLeave:
        if (m_hovering) {
            m_hovering = false;
            emitCallback(DragCallbackKind::HoverCancelled, std::nullopt, mapFromGlobal(QCursor::pos()));
        }
        event->accept();
        return true;
    case QEvent::Drop: {
        auto* drop = static_cast<QDropEvent*>(event);
        m_hovering = false;
        if (!hasLocalFiles(drop->mimeData())) {
            drop->ignore();
            return true;
        }
        emitForUrls(DragCallbackKind::DroppedFile, drop);
        drop->acceptProposedAction();
        return true;
    }
    default:
        break;
    }
    return QRasterWindow::event(event);
}

void SensorWindow::emitForUrls(DragCallbackKind kind, const QDropEvent* event)
{
    const QList<QUrl> urls = event->mimeData()->urls();
    for (const QUrl& url : urls) {
        if (!url.isLocalFile()) {
            continue;
        }
        const QString localPath = url.toLocalFile();
        if (localPath.isEmpty()) {
            continue;
        }
        emitCallback(kind, localPath, event->position());
    }
}

void SensorWindow::emitCallback(DragCallbackKind kind, const std::optional<QString>& filePath,
                                const QPointF& localPos)
{
    if (!m_sink) {
        return;
    }

    DragCallbackEvent callback;
    callback.kind = kind;
    callback.filePath = filePath;
    // Reported in physical pixels, like pointer events
    const QPointF global = CoordinateUtils::logicalToPhysical(mapToGlobal(localPos), m_monitor);
    callback.x = global.x();
    callback.y = global.y();
    callback.timestamp = currentTimestamp();
    callback.originatingSensorWindow = m_sensorId;

    qCDebug(lcSensor) << m_sensorId << dragCallbackKindName(kind) << filePath.value_or(QString());
    m_sink(callback);
}

std::unique_ptr<ISensorWindow> QtSensorWindowFactory::create(const QString& sensorId, const QRect& physical,
                                                             const MonitorDescriptor& monitor, CallbackSink sink,
                                                             QString* errorMessage)
{
    auto window = std::make_unique<SensorWindow>(sensorId, std::move(sink));
    window->place(physical, monitor);
    if (!window->realize(errorMessage)) {
        return nullptr;
    }
    return window;
}

} // namespace DragSense
