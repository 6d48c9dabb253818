// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenmanager.h"
#include "logging.h"
#include <QGuiApplication>
#include <QScreen>

namespace DragSense {

namespace {

bool sameMonitors(const QVector<MonitorDescriptor>& a, const QVector<MonitorDescriptor>& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (int i = 0; i < a.size(); ++i) {
        if (a[i].id != b[i].id || a[i].physicalBounds() != b[i].physicalBounds()
            || !qFuzzyCompare(a[i].scaleFactor, b[i].scaleFactor)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

ScreenManager::ScreenManager(QObject* parent)
    : QObject(parent)
{
    m_refreshTimer.setSingleShot(true);
    m_refreshTimer.setInterval(0);
    connect(&m_refreshTimer, &QTimer::timeout, this, &ScreenManager::refresh);
}

ScreenManager::~ScreenManager()
{
    stop();
}

void ScreenManager::start()
{
    if (m_running) {
        return;
    }
    if (!qGuiApp) {
        qCWarning(lcScreen) << "No QGuiApplication, no screens to track";
        return;
    }
    m_running = true;

    connect(qGuiApp, &QGuiApplication::screenAdded, this, &ScreenManager::onScreenAdded);
    connect(qGuiApp, &QGuiApplication::screenRemoved, this, &ScreenManager::onScreenRemoved);
    const QList<QScreen*> screens = QGuiApplication::screens();
    for (QScreen* screen : screens) {
        track(screen);
    }

    m_monitors = currentMonitors();
    qCInfo(lcScreen) << "Tracking" << m_monitors.size() << "monitors";
    for (const MonitorDescriptor& monitor : std::as_const(m_monitors)) {
        qCDebug(lcScreen) << monitor.id << monitor.physicalBounds() << "scale" << monitor.scaleFactor;
    }
}

void ScreenManager::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;
    m_refreshTimer.stop();

    if (qGuiApp) {
        disconnect(qGuiApp, nullptr, this, nullptr);
        const QList<QScreen*> screens = QGuiApplication::screens();
        for (QScreen* screen : screens) {
            disconnect(screen, nullptr, &m_refreshTimer, nullptr);
        }
    }
}

QVector<MonitorDescriptor> ScreenManager::monitors() const
{
    return m_running ? m_monitors : currentMonitors();
}

MonitorDescriptor ScreenManager::describe(const QScreen* screen)
{
    MonitorDescriptor monitor;
    if (!screen) {
        return monitor;
    }

    const QRect geometry = screen->geometry();
    const qreal scale = screen->devicePixelRatio() > 0 ? screen->devicePixelRatio() : 1.0;
    monitor.id = screen->name();
    monitor.originX = geometry.x();
    monitor.originY = geometry.y();
    monitor.widthPx = qRound(geometry.width() * scale);
    monitor.heightPx = qRound(geometry.height() * scale);
    monitor.scaleFactor = scale;
    return monitor;
}

QVector<MonitorDescriptor> ScreenManager::currentMonitors()
{
    QVector<MonitorDescriptor> result;
    if (!qGuiApp) {
        return result;
    }

    const QList<QScreen*> screens = QGuiApplication::screens();
    result.reserve(screens.size());
    for (const QScreen* screen : screens) {
        const MonitorDescriptor monitor = describe(screen);
        if (monitor.isValid()) {
            result.append(monitor);
        } else {
            qCDebug(lcScreen) << "Skipping screen without geometry:" << screen->name();
        }
    }
    return result;
}

void ScreenManager::track(QScreen* screen)
{
    connect(screen, &QScreen::geometryChanged, &m_refreshTimer, qOverload<>(&QTimer::start), Qt::UniqueConnection);
    connect(screen, &QScreen::physicalDotsPerInchChanged, &m_refreshTimer, qOverload<>(&QTimer::start),
            Qt::UniqueConnection);
}

void ScreenManager::onScreenAdded(QScreen* screen)
{
    qCInfo(lcScreen) << "Screen added:" << screen->name();
    track(screen);
    m_refreshTimer.start();
}

void ScreenManager::onScreenRemoved(QScreen* screen)
{
    qCInfo(lcScreen) << "Screen removed:" << screen->name();
    disconnect(screen, nullptr, &m_refreshTimer, nullptr);
    m_removedScreen = screen->name();
    m_refreshTimer.start();
}

void ScreenManager::refresh()
{
    QVector<MonitorDescriptor> monitors = currentMonitors();
    if (!m_removedScreen.isEmpty()) {
        const QString removed = m_removedScreen;
        monitors.removeIf([&removed](const MonitorDescriptor& monitor) {
            return monitor.id == removed;
        });
        m_removedScreen.clear();
    }

    if (sameMonitors(monitors, m_monitors)) {
        return;
    }
    m_monitors = monitors;
    qCInfo(lcScreen) << "Monitor layout changed:" << m_monitors.size() << "monitors";
    Q_EMIT monitorsChanged(m_monitors);
}

} // namespace DragSense
