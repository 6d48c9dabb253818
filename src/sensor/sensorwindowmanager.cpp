// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sensorwindowmanager.h"
#include "../core/coordinateutils.h"
#include "../core/logging.h"
#include "../core/screenmanager.h"
#include <QPointer>

namespace DragSense {

namespace {
constexpr int DefaultDropGraceMs = 150;
}

SensorWindowManager::SensorWindowManager(std::unique_ptr<SensorWindowFactory> factory, QObject* parent)
    : QObject(parent)
    , m_factory(std::move(factory))
    , m_monitorProvider(&ScreenManager::currentMonitors)
    , m_layout(GridLayout::defaultLayout())
{
    m_closeTimer.setSingleShot(true);
    m_closeTimer.setInterval(DefaultDropGraceMs);
    connect(&m_closeTimer, &QTimer::timeout, this, &SensorWindowManager::finishClosing);
}

SensorWindowManager::~SensorWindowManager()
{
    m_closeTimer.stop();
    destroyWindows();
}

void SensorWindowManager::setLayout(const GridLayout& layout)
{
    if (!layout.isValid()) {
        qCWarning(lcSensor) << "Ignoring invalid sensor layout" << layout.name();
        return;
    }
    m_layout = layout;
}

void SensorWindowManager::setMonitorProvider(MonitorProvider provider)
{
    m_monitorProvider = provider ? std::move(provider) : MonitorProvider(&ScreenManager::currentMonitors);
}

void SensorWindowManager::setTint(const QColor& color)
{
    m_tint = color;
    for (const auto& window : m_windows) {
        window->setTint(color);
    }
}

void SensorWindowManager::setDropGraceMs(int ms)
{
    m_closeTimer.setInterval(qMax(0, ms));
}

bool SensorWindowManager::planAround(const QPointF& logicalCenter, QVector<SensorWindowSpec>* plan,
                                     MonitorDescriptor* monitor, QString* errorMessage) const
{
    const QVector<MonitorDescriptor> monitors = m_monitorProvider();
    const int index = CoordinateUtils::monitorIndexForLogical(logicalCenter, monitors);
    if (index < 0) {
        *errorMessage = QStringLiteral("No monitors available for sensor windows");
        return false;
    }

    *monitor = monitors.at(index);
    const CoordinateUtils::NormalizedPoint center =
        CoordinateUtils::normalize(logicalCenter.x(), logicalCenter.y(), monitors);
    *plan = SensorGrid::plan(QPoint(qRound(center.x), qRound(center.y)), *monitor, m_layout);
    if (plan->size() != m_layout.windowCount()) {
        *errorMessage = QStringLiteral("Sensor layout %1 produced no plan").arg(m_layout.name());
        return false;
    }
    return true;
}

OperationResult SensorWindowManager::arm(const QPointF& logicalCenter)
{
    if (m_state != State::Idle) {
        qCDebug(lcSensor) << "arm() while not idle, tearing down the previous windows first";
        abort();
    }

    QVector<SensorWindowSpec> plan;
    MonitorDescriptor monitor;
    QString errorMessage;
    if (!planAround(logicalCenter, &plan, &monitor, &errorMessage)) {
        qCWarning(lcSensor) << "Cannot arm:" << errorMessage;
        Q_EMIT windowCreationFailed(errorMessage);
        return OperationResult::failure(ErrorCode::WindowCreationFailed, errorMessage);
    }

    QPointer<SensorWindowManager> guard(this);
    auto sink = [guard](const DragCallbackEvent& callback) {
        if (guard) {
            Q_EMIT guard->callbackReceived(callback);
        }
    };

    m_windows.reserve(plan.size());
    for (const SensorWindowSpec& spec : std::as_const(plan)) {
        const QString sensorId = QStringLiteral("SensorWindow-r%1c%2").arg(spec.slot.y()).arg(spec.slot.x());
        std::unique_ptr<ISensorWindow> window = m_factory->create(sensorId, spec.rect, monitor, sink, &errorMessage);
        if (!window) {
            qCWarning(lcSensor) << "Sensor window creation failed:" << errorMessage << "- destroying"
                                << m_windows.size() << "windows already created";
            destroyWindows();
            Q_EMIT windowCreationFailed(errorMessage);
            return OperationResult::failure(ErrorCode::WindowCreationFailed, errorMessage);
        }
        if (m_tint.isValid()) {
            window->setTint(m_tint);
        }
        m_windows.push_back(std::move(window));
    }

    m_plan = plan;
    m_state = State::Armed;
    qCInfo(lcSensor) << "Armed" << m_windows.size() << m_layout.name() << "sensor windows on" << monitor.id;
    Q_EMIT armed(m_plan);
    return OperationResult::success();
}

void SensorWindowManager::moveTo(const QPointF& logicalCenter)
{
    if (m_state != State::Armed) {
        return;
    }

    QVector<SensorWindowSpec> plan;
    MonitorDescriptor monitor;
    QString errorMessage;
    if (!planAround(logicalCenter, &plan, &monitor, &errorMessage)) {
        qCDebug(lcSensor) << "Keeping sensor windows in place:" << errorMessage;
        return;
    }

    for (size_t i = 0; i < m_windows.size(); ++i) {
        m_windows[i]->place(plan.at(static_cast<int>(i)).rect, monitor);
    }
    m_plan = plan;
    Q_EMIT moved(m_plan);
}

void SensorWindowManager::disarm()
{
    if (m_state != State::Armed) {
        return;
    }
    m_state = State::Closing;
    m_closeTimer.start();
}

void SensorWindowManager::abort()
{
    if (m_state == State::Idle) {
        return;
    }
    m_closeTimer.stop();
    finishClosing();
}

void SensorWindowManager::finishClosing()
{
    destroyWindows();
    m_plan.clear();
    m_state = State::Idle;
    qCDebug(lcSensor) << "Sensor windows closed";
    Q_EMIT closed();
}

void SensorWindowManager::destroyWindows()
{
    m_windows.clear();
}

} // namespace DragSense
