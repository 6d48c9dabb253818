// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "../core/errors.h"
#include <QImage>
#include <QVariantMap>

namespace DragSense {

/**
 * @brief Reads the color of a single screen pixel
 *
 * X11 grabs the pixel through QScreen::grabWindow(); Wayland asks KWin's
 * ScreenShot2 interface for the 1x1 area, which needs the caller to be
 * authorized for screenshots. Requires a QGuiApplication.
 *
 * Failures are reported as CaptureFailed and never retried.
 */
class DRAGSENSE_EXPORT ScreenColorSampler
{
public:
    /**
     * @brief Sample the pixel at logical desktop position (@p x, @p y)
     */
    static ColorSample sampleAt(qreal x, qreal y);

    /**
     * @brief Decode a KWin ScreenShot2 raw image written to @p readFd
     *
     * Takes ownership of @p readFd.
     * @return Null image if the metadata or the data is unusable
     */
    static QImage readImageFromPipe(int readFd, const QVariantMap& metadata);

private:
    static ColorSample sampleFromScreen(const QPoint& logicalPos);
    static ColorSample sampleFromKWin(const QPoint& logicalPos);
};

} // namespace DragSense
