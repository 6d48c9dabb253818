// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screencolorsampler.h"
#include "../core/coordinateutils.h"
#include "../core/logging.h"
#include "../core/platform.h"
#include "../core/screenmanager.h"

#include <QDataStream>
#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusReply>
#include <QDBusUnixFileDescriptor>
#include <QFile>
#include <QFileDevice>
#include <QGuiApplication>
#include <QPixmap>
#include <QScreen>
#include <QtMath>

#include <fcntl.h>
#include <unistd.h>

namespace DragSense {

static const QString kScreenShot2Service = QStringLiteral("org.kde.KWin.ScreenShot2");
static const QString kScreenShot2Path = QStringLiteral("/org/kde/KWin/ScreenShot2");
static const QString kScreenShot2Iface = QStringLiteral("org.kde.KWin.ScreenShot2");

// A 1x1 reply fits the pipe buffer, so the call can block before reading
static constexpr int kCaptureTimeoutMs = 2000;

ColorSample ScreenColorSampler::sampleAt(qreal x, qreal y)
{
    if (!qGuiApp) {
        return ColorSample::failed(QStringLiteral("No GUI application to capture from"));
    }

    // Snap onto the desktop first so a point in a gap between monitors still samples
    const QVector<MonitorDescriptor> monitors = ScreenManager::currentMonitors();
    QPointF logical(x, y);
    if (!monitors.isEmpty()) {
        const CoordinateUtils::NormalizedPoint physical = CoordinateUtils::normalize(x, y, monitors);
        const int index = CoordinateUtils::monitorIndexForPhysical(QPointF(physical.x, physical.y), monitors);
        logical = CoordinateUtils::physicalToLogical(QPointF(physical.x, physical.y), monitors.at(index));
    }
    const QPoint pos(qFloor(logical.x()), qFloor(logical.y()));

    const ColorSample sample = Platform::isWayland() ? sampleFromKWin(pos) : sampleFromScreen(pos);
    if (!sample.ok()) {
        qCWarning(lcColor) << "Color capture at" << pos << "failed:" << sample.status.message;
    } else {
        qCDebug(lcColor) << "Sampled" << sample.color.name(QColor::HexArgb) << "at" << pos;
    }
    return sample;
}

ColorSample ScreenColorSampler::sampleFromScreen(const QPoint& logicalPos)
{
    QScreen* screen = QGuiApplication::screenAt(logicalPos);
    if (!screen) {
        screen = QGuiApplication::primaryScreen();
    }
    if (!screen) {
        return ColorSample::failed(QStringLiteral("No screen at %1,%2").arg(logicalPos.x()).arg(logicalPos.y()));
    }

    const QPoint local = logicalPos - screen->geometry().topLeft();
    const QPixmap pixmap = screen->grabWindow(0, local.x(), local.y(), 1, 1);
    if (pixmap.isNull()) {
        return ColorSample::failed(QStringLiteral("Screen capture denied or unsupported"));
    }

    const QImage image = pixmap.toImage();
    if (image.isNull() || image.width() < 1 || image.height() < 1) {
        return ColorSample::failed(QStringLiteral("Screen capture returned no pixels"));
    }
    return ColorSample{OperationResult::success(), image.pixelColor(0, 0)};
}

ColorSample ScreenColorSampler::sampleFromKWin(const QPoint& logicalPos)
{
    int pipeFds[2];
    if (pipe2(pipeFds, O_CLOEXEC) != 0) {
        return ColorSample::failed(QStringLiteral("Pipe creation failed"));
    }

    QDBusUnixFileDescriptor fd(pipeFds[1]);
    close(pipeFds[1]);

    QDBusMessage msg = QDBusMessage::createMethodCall(kScreenShot2Service, kScreenShot2Path, kScreenShot2Iface,
                                                      QStringLiteral("CaptureArea"));
    msg << logicalPos.x() << logicalPos.y() << 1u << 1u << QVariantMap() << QVariant::fromValue(fd);

    const QDBusReply<QVariantMap> reply = QDBusConnection::sessionBus().call(msg, QDBus::Block, kCaptureTimeoutMs);
    if (!reply.isValid()) {
        close(pipeFds[0]);
        return ColorSample::failed(reply.error().message());
    }

    const QImage image = readImageFromPipe(pipeFds[0], reply.value());
    if (image.isNull()) {
        return ColorSample::failed(QStringLiteral("Unreadable screenshot data"));
    }
    return ColorSample{OperationResult::success(), image.pixelColor(0, 0)};
}

// KWin ScreenShot2 protocol: metadata in the D-Bus reply, raw QImage bytes in the pipe
QImage ScreenColorSampler::readImageFromPipe(int readFd, const QVariantMap& metadata)
{
    QFile file;
    if (!file.open(readFd, QFileDevice::ReadOnly, QFileDevice::AutoCloseHandle)) {
        close(readFd);
        return QImage();
    }

    if (metadata.value(QLatin1String("type")).toString() != QLatin1String("raw")) {
        return QImage();
    }

    bool ok = false;
    const int width = metadata.value(QLatin1String("width")).toInt(&ok);
    if (!ok || width <= 0 || width > 10000) {
        return QImage();
    }
    const int height = metadata.value(QLatin1String("height")).toInt(&ok);
    if (!ok || height <= 0 || height > 10000) {
        return QImage();
    }
    const uint format = metadata.value(QLatin1String("format")).toUInt(&ok);
    if (!ok || format <= static_cast<uint>(QImage::Format_Invalid)
        || format >= static_cast<uint>(QImage::NImageFormats)) {
        return QImage();
    }

    QImage image(width, height, static_cast<QImage::Format>(format));
    if (image.isNull()) {
        return QImage();
    }

    QDataStream stream(&file);
    const qint64 toRead = image.sizeInBytes();
    if (stream.readRawData(reinterpret_cast<char*>(image.bits()), toRead) != toRead) {
        return QImage();
    }
    return image;
}

} // namespace DragSense
