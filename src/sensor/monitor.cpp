// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitor.h"
#include "dragmonitor.h"
#include "helperprocessbackend.h"
#include "screencolorsampler.h"
#include "sensorbackend.h"
#include "sensorwindow.h"
#include "sensorwindowmanager.h"
#include "../core/constants.h"
#include "../core/coordinateutils.h"
#include "../core/keyboardsource.h"
#include "../core/logging.h"
#include "../core/platform.h"
#include "../core/pointersource.h"
#include "../core/screenmanager.h"
#include "../core/xcbkeyboardsource.h"
#include "../core/xcbpointersource.h"
#include <QGuiApplication>
#include <QMutexLocker>
#include <QThread>

namespace DragSense {

Monitor::Monitor(QObject* parent)
    : QObject(parent)
    , m_bus(new EventBus(this))
    , m_layout(GridLayout::defaultLayout())
    , m_buttonMask(Defaults::ButtonMask)
    , m_helperShutdownTimeoutMs(Defaults::HelperShutdownTimeoutMs)
{
    qRegisterMetaType<PointerSample>();
    qRegisterMetaType<KeyboardEvent>();
    qRegisterMetaType<DragCallbackEvent>();
    qRegisterMetaType<DragEvent>();
    qRegisterMetaType<ErrorCode>();
    qRegisterMetaType<QVector<SensorWindowSpec>>();

    if (qGuiApp) {
        m_state.monitors = ScreenManager::currentMonitors();
    }
}

Monitor::~Monitor()
{
    teardownDragMonitor(true);
    {
        QMutexLocker locker(&m_mutex);
        m_state.dragMonitoring = false;
    }
    stopPointerMonitor();
    stopKeyboardMonitor();
    m_pointerSource.reset();
    m_keyboardSource.reset();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Wiring
// ═══════════════════════════════════════════════════════════════════════════════

void Monitor::setPointerSource(std::unique_ptr<PointerSource> source)
{
    if (isPointerMonitoring() || isDragMonitoring()) {
        qCWarning(lcCore) << "Cannot replace the pointer source while monitoring";
        return;
    }
    m_pointerSource = std::move(source);
    if (m_pointerSource) {
        m_pointerSource->setMonitors(monitors());
    }
}

void Monitor::setKeyboardSource(std::unique_ptr<KeyboardSource> source)
{
    if (isKeyboardMonitoring()) {
        qCWarning(lcCore) << "Cannot replace the keyboard source while monitoring";
        return;
    }
    m_keyboardSource = std::move(source);
}

void Monitor::setSensorBackendFactory(BackendFactory factory)
{
    m_backendFactory = std::move(factory);
}

void Monitor::setScreenManager(ScreenManager* screenManager)
{
    if (m_screenManager) {
        disconnect(m_screenManager, nullptr, this, nullptr);
    }
    m_screenManager = screenManager;
    if (m_screenManager) {
        connect(m_screenManager, &ScreenManager::monitorsChanged, this, &Monitor::setMonitors);
        setMonitors(m_screenManager->monitors());
    }
}

void Monitor::setMonitors(const QVector<MonitorDescriptor>& monitors)
{
    {
        QMutexLocker locker(&m_mutex);
        m_state.monitors = monitors;
    }
    if (m_pointerSource) {
        m_pointerSource->setMonitors(monitors);
    }
    qCDebug(lcScreen) << "Monitor snapshot updated:" << monitors.size() << "monitors";
}

QVector<MonitorDescriptor> Monitor::monitors() const
{
    QMutexLocker locker(&m_mutex);
    return m_state.monitors;
}

void Monitor::setLayout(const GridLayout& layout)
{
    if (!layout.isValid()) {
        qCWarning(lcGrid) << "Ignoring invalid sensor layout" << layout.name();
        return;
    }
    m_layout = layout;
}

void Monitor::setButtonMask(int mask)
{
    m_buttonMask = mask & Defaults::ButtonMask;
}

void Monitor::setHelperShutdownTimeoutMs(int ms)
{
    m_helperShutdownTimeoutMs = qMax(0, ms);
}

void Monitor::setDropGraceMs(int ms)
{
    m_dropGraceMs = ms;
}

OperationResult Monitor::report(const OperationResult& result)
{
    if (!result.ok()) {
        qCWarning(lcCore) << errorCodeName(result.code) << result.message;
        Q_EMIT monitorError(static_cast<int>(result.code), result.message);
    }
    return result;
}

void Monitor::ensurePointerSource()
{
    if (!m_pointerSource) {
        m_pointerSource = std::make_unique<XcbPointerSource>();
        m_pointerSource->setMonitors(monitors());
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Pointer monitoring
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult Monitor::startPointerMonitor()
{
    if (isPointerMonitoring()) {
        return OperationResult::success();
    }

    ensurePointerSource();
    int subscription = 0;
    const OperationResult result = m_pointerSource->subscribe(
        [this](const PointerSample& sample) {
            publishPointerSample(sample);
        },
        &subscription);
    if (!result.ok()) {
        return report(result);
    }

    m_pointerSubscription = subscription;
    {
        QMutexLocker locker(&m_mutex);
        m_state.pointerMonitoring = true;
    }
    qCInfo(lcCore) << "Pointer monitoring started";
    Q_EMIT pointerMonitoringChanged(true);
    return OperationResult::success();
}

OperationResult Monitor::stopPointerMonitor()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_state.pointerMonitoring) {
            return OperationResult::success();
        }
        m_state.pointerMonitoring = false;
    }
    if (m_pointerSource && m_pointerSubscription) {
        m_pointerSource->unsubscribe(m_pointerSubscription);
    }
    m_pointerSubscription = 0;
    qCInfo(lcCore) << "Pointer monitoring stopped";
    Q_EMIT pointerMonitoringChanged(false);
    return OperationResult::success();
}

bool Monitor::isPointerMonitoring() const
{
    QMutexLocker locker(&m_mutex);
    return m_state.pointerMonitoring;
}

EventBus::Handle Monitor::onPointerEvent(EventBus::PointerCallback callback, QObject* context)
{
    return m_bus->registerPointerListener(std::move(callback), context);
}

bool Monitor::removePointerEventListener(EventBus::Handle handle)
{
    return m_bus->unregisterListener(handle);
}

// Runs on the pointer hook thread
void Monitor::publishPointerSample(const PointerSample& sample)
{
    QVector<MonitorDescriptor> monitors;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_state.pointerMonitoring) {
            return;
        }
        monitors = m_state.monitors;
    }

    const CoordinateUtils::NormalizedPoint point = CoordinateUtils::normalize(sample.x, sample.y, monitors);
    PointerSample physical = sample;
    physical.x = point.x;
    physical.y = point.y;
    physical.monitorId = point.monitorId;
    m_bus->publish(PointerEvent::fromSample(physical));
}

// Runs on the pointer hook thread
void Monitor::forwardDragSample(const PointerSample& sample)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_state.dragMonitoring) {
            return;
        }
    }
    Q_EMIT pointerSampleForDrag(sample);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Keyboard monitoring
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult Monitor::startKeyboardMonitor()
{
    if (isKeyboardMonitoring()) {
        return OperationResult::success();
    }

    if (!m_keyboardSource) {
        m_keyboardSource = std::make_unique<XcbKeyboardSource>();
    }
    int subscription = 0;
    const OperationResult result = m_keyboardSource->subscribe(
        [this](const KeySample& sample) {
            publishKeySample(sample);
        },
        &subscription);
    if (!result.ok()) {
        return report(result);
    }

    m_keyboardSubscription = subscription;
    {
        QMutexLocker locker(&m_mutex);
        m_state.keyboardMonitoring = true;
    }
    qCInfo(lcCore) << "Keyboard monitoring started";
    Q_EMIT keyboardMonitoringChanged(true);
    return OperationResult::success();
}

OperationResult Monitor::stopKeyboardMonitor()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_state.keyboardMonitoring) {
            return OperationResult::success();
        }
        m_state.keyboardMonitoring = false;
    }
    if (m_keyboardSource && m_keyboardSubscription) {
        m_keyboardSource->unsubscribe(m_keyboardSubscription);
    }
    m_keyboardSubscription = 0;
    qCInfo(lcCore) << "Keyboard monitoring stopped";
    Q_EMIT keyboardMonitoringChanged(false);
    return OperationResult::success();
}

bool Monitor::isKeyboardMonitoring() const
{
    QMutexLocker locker(&m_mutex);
    return m_state.keyboardMonitoring;
}

EventBus::Handle Monitor::onKeyboardEvent(EventBus::KeyboardCallback callback, QObject* context)
{
    return m_bus->registerKeyboardListener(std::move(callback), context);
}

bool Monitor::removeKeyboardEventListener(EventBus::Handle handle)
{
    return m_bus->unregisterListener(handle);
}

// Runs on the keyboard hook thread
void Monitor::publishKeySample(const KeySample& sample)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_state.keyboardMonitoring) {
            return;
        }
    }
    m_bus->publish(KeyboardEvent::fromSample(sample));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Drag monitoring
// ═══════════════════════════════════════════════════════════════════════════════

OperationResult Monitor::configureDragMonitor(const QString& helperLocator)
{
    if (helperLocator.trimmed().isEmpty()) {
        return report(OperationResult::failure(ErrorCode::InvalidArgument,
                                               QStringLiteral("Helper locator must not be empty")));
    }
    if (!HelperProcessBackend::isUsableHelper(helperLocator)) {
        return report(OperationResult::failure(
            ErrorCode::HelperUnavailable, QStringLiteral("%1 is not an executable file").arg(helperLocator)));
    }
    m_helperPath = helperLocator;
    qCInfo(lcCore) << "Drag monitor helper set to" << m_helperPath;
    return OperationResult::success();
}

QString Monitor::helperPath() const
{
    return m_helperPath;
}

ISensorBackend* Monitor::createBackend(OperationResult* result)
{
    if (m_backendFactory) {
        ISensorBackend* backend = m_backendFactory();
        if (!backend) {
            *result = OperationResult::failure(ErrorCode::HelperUnavailable,
                                               QStringLiteral("No sensor backend available"));
        }
        return backend;
    }

    if (!m_helperPath.isEmpty()) {
        if (!HelperProcessBackend::isUsableHelper(m_helperPath)) {
            *result = OperationResult::failure(
                ErrorCode::HelperUnavailable,
                QStringLiteral("%1 is no longer an executable file").arg(m_helperPath));
            return nullptr;
        }
        return new HelperProcessBackend(m_helperPath);
    }

    const QString found = HelperProcessBackend::findDefaultHelper();
    if (HelperProcessBackend::isUsableHelper(found)) {
        return new HelperProcessBackend(found);
    }

    if (qGuiApp) {
        qCInfo(lcCore) << "No sensor helper found, using in-process sensor windows";
        return new LocalSensorBackend(new SensorWindowManager(std::make_unique<QtSensorWindowFactory>()));
    }

    *result = OperationResult::failure(ErrorCode::HelperUnavailable,
                                       QStringLiteral("No sensor helper found and no GUI for in-process windows"));
    return nullptr;
}

void Monitor::configureBackend(ISensorBackend* backend) const
{
    const auto snapshot = [this]() {
        return monitors();
    };

    if (auto* helper = qobject_cast<HelperProcessBackend*>(backend)) {
        helper->setLayout(m_layout);
        helper->setShutdownTimeoutMs(m_helperShutdownTimeoutMs);
        helper->setMonitorProvider(snapshot);
    } else if (auto* local = qobject_cast<LocalSensorBackend*>(backend)) {
        local->manager()->setLayout(m_layout);
        local->manager()->setMonitorProvider(snapshot);
        if (m_dropGraceMs >= 0) {
            local->manager()->setDropGraceMs(m_dropGraceMs);
        }
    }
}

OperationResult Monitor::startDragMonitor()
{
    if (isDragMonitoring()) {
        return OperationResult::success();
    }

    OperationResult result = OperationResult::success();
    ISensorBackend* backend = createBackend(&result);
    if (!backend) {
        return report(result);
    }
    configureBackend(backend);

    auto* dragMonitor = new DragMonitor(backend);
    dragMonitor->setButtonMask(m_buttonMask);

    if (!backend->requiresGuiThread()) {
        m_dragThread = new QThread();
        m_dragThread->setObjectName(QStringLiteral("DragSenseDragMonitor"));
        dragMonitor->moveToThread(m_dragThread);
        m_dragThread->start();
    }

    // Queued both ways: the drag monitor may be torn down from these slots
    connect(this, &Monitor::pointerSampleForDrag, dragMonitor, &DragMonitor::handleSample, Qt::QueuedConnection);
    connect(dragMonitor, &DragMonitor::dragEvent, this, &Monitor::onDragEventFromMonitor, Qt::QueuedConnection);
    connect(dragMonitor, &DragMonitor::errorOccurred, this, &Monitor::onDragMonitorError, Qt::QueuedConnection);
    connect(dragMonitor, &DragMonitor::terminated, this, &Monitor::onDragMonitorTerminated, Qt::QueuedConnection);
    m_dragMonitor = dragMonitor;

    ensurePointerSource();
    int subscription = 0;
    result = m_pointerSource->subscribe(
        [this](const PointerSample& sample) {
            forwardDragSample(sample);
        },
        &subscription);
    if (!result.ok()) {
        teardownDragMonitor(false);
        return report(result);
    }
    m_dragSubscription = subscription;

    {
        QMutexLocker locker(&m_mutex);
        m_state.dragMonitoring = true;
    }
    qCInfo(lcCore) << "Drag monitoring started with layout" << m_layout.name()
                   << (m_dragThread ? "(sensor helper)" : "(in-process windows)");
    Q_EMIT dragMonitoringChanged(true);
    return OperationResult::success();
}

OperationResult Monitor::stopDragMonitor()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_state.dragMonitoring) {
            return OperationResult::success();
        }
        m_state.dragMonitoring = false;
    }
    teardownDragMonitor(false);
    qCInfo(lcCore) << "Drag monitoring stopped";
    Q_EMIT dragMonitoringChanged(false);
    return OperationResult::success();
}

bool Monitor::isDragMonitoring() const
{
    QMutexLocker locker(&m_mutex);
    return m_state.dragMonitoring;
}

void Monitor::teardownDragMonitor(bool wait)
{
    if (m_pointerSource && m_dragSubscription) {
        m_pointerSource->unsubscribe(m_dragSubscription);
    }
    m_dragSubscription = 0;

    DragMonitor* dragMonitor = m_dragMonitor;
    m_dragMonitor = nullptr;
    if (!dragMonitor) {
        return;
    }
    disconnect(this, nullptr, dragMonitor, nullptr);
    dragMonitor->disconnect(this);

    if (!m_dragThread) {
        // The destructor aborts an open episode out of band
        delete dragMonitor;
        return;
    }

    QThread* thread = m_dragThread;
    m_dragThread = nullptr;
    if (wait) {
        QMetaObject::invokeMethod(
            dragMonitor,
            [dragMonitor]() {
                delete dragMonitor;
            },
            Qt::BlockingQueuedConnection);
        thread->quit();
        thread->wait();
        delete thread;
    } else {
        connect(dragMonitor, &QObject::destroyed, thread, &QThread::quit);
        connect(thread, &QThread::finished, thread, &QObject::deleteLater);
        dragMonitor->deleteLater();
    }
}

void Monitor::onDragEventFromMonitor(const DragEvent& event)
{
    m_bus->publish(event);
}

void Monitor::onDragMonitorError(ErrorCode code, const QString& message)
{
    Q_EMIT monitorError(static_cast<int>(code), message);
}

void Monitor::onDragMonitorTerminated(const QString& message)
{
    qCWarning(lcCore) << "Drag monitoring stopped by sensor failure:" << message;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_state.dragMonitoring) {
            return;
        }
        m_state.dragMonitoring = false;
    }
    teardownDragMonitor(false);
    Q_EMIT dragMonitoringChanged(false);
}

EventBus::Handle Monitor::onDragEvent(EventBus::DragCallback callback, QObject* context)
{
    return m_bus->registerDragListener(std::move(callback), context);
}

bool Monitor::removeDragEventListener(EventBus::Handle handle)
{
    return m_bus->unregisterListener(handle);
}

OperationResult Monitor::simulateDragEvent(const QStringList& filePaths)
{
    if (filePaths.isEmpty()) {
        return report(
            OperationResult::failure(ErrorCode::InvalidArgument, QStringLiteral("File list cannot be empty")));
    }
    for (const QString& path : filePaths) {
        if (path.isEmpty()) {
            return report(OperationResult::failure(ErrorCode::InvalidArgument,
                                                   QStringLiteral("File paths must not be empty")));
        }
    }

    qCInfo(lcCore) << "Simulating drop of" << filePaths.size() << "file(s):" << filePaths;
    const QString platform = Platform::osName();
    for (const QString& path : filePaths) {
        DragEvent event;
        event.eventType = EventTypes::DroppedFile;
        event.filePath = path;
        event.timestamp = currentTimestamp();
        event.platform = platform;
        m_bus->publish(event);
    }
    return OperationResult::success();
}

OperationResult Monitor::simulateDragEvent(const QVariant& filePaths)
{
    if (filePaths.metaType() == QMetaType::fromType<QStringList>()) {
        return simulateDragEvent(filePaths.toStringList());
    }
    if (filePaths.metaType() != QMetaType::fromType<QVariantList>()) {
        return report(OperationResult::failure(ErrorCode::InvalidArgument,
                                               QStringLiteral("Expected a list of file paths, got %1")
                                                   .arg(QString::fromLatin1(filePaths.typeName()))));
    }

    QStringList paths;
    const QVariantList items = filePaths.toList();
    for (const QVariant& item : items) {
        if (item.metaType() != QMetaType::fromType<QString>()) {
            return report(OperationResult::failure(ErrorCode::InvalidArgument,
                                                   QStringLiteral("File paths must be strings")));
        }
        paths.append(item.toString());
    }
    return simulateDragEvent(paths);
}

ColorSample Monitor::sampleColorAt(qreal x, qreal y)
{
    const ColorSample sample = ScreenColorSampler::sampleAt(x, y);
    if (!sample.ok()) {
        report(sample.status);
    }
    return sample;
}

} // namespace DragSense
