// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "platform.h"
#include <QGuiApplication>
#include <QSysInfo>

namespace DragSense {

namespace Platform {

Session session()
{
    if (!qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY")) {
        return Session::Wayland;
    }

    const QString sessionType = qEnvironmentVariable("XDG_SESSION_TYPE");
    if (sessionType.compare(QLatin1String("wayland"), Qt::CaseInsensitive) == 0) {
        return Session::Wayland;
    }
    if (sessionType.compare(QLatin1String("x11"), Qt::CaseInsensitive) == 0) {
        return Session::X11;
    }

    if (qGuiApp && qGuiApp->platformName().startsWith(QLatin1String("wayland"))) {
        return Session::Wayland;
    }
    return hasXDisplay() ? Session::X11 : Session::Unknown;
}

bool isWayland()
{
    return session() == Session::Wayland;
}

bool hasXDisplay()
{
    return !qEnvironmentVariableIsEmpty("DISPLAY");
}

QString sessionName()
{
    switch (session()) {
    case Session::X11:
        return QStringLiteral("x11");
    case Session::Wayland:
        return QStringLiteral("wayland");
    case Session::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

QString osName()
{
    return QSysInfo::kernelType().toLower();
}

bool hasLayerShell()
{
#ifdef HAVE_LAYER_SHELL
    return true;
#else
    return false;
#endif
}

bool canPlaceSensorWindows()
{
    switch (session()) {
    case Session::X11:
        return true;
    case Session::Wayland:
        return hasLayerShell();
    case Session::Unknown:
        break;
    }
    return false;
}

} // namespace Platform

} // namespace DragSense
