// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "helperprotocol.h"
#include "constants.h"
#include "logging.h"
#include "platform.h"
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace DragSense {

namespace HelperProtocol {

namespace {

QJsonObject baseObject(const QString& eventType)
{
    QJsonObject object;
    object[JsonKeys::EventType] = eventType;
    object[JsonKeys::FilePath] = QString();
    object[JsonKeys::X] = 0.0;
    object[JsonKeys::Y] = 0.0;
    object[JsonKeys::Timestamp] = currentTimestamp();
    object[JsonKeys::Platform] = Platform::osName();
    object[JsonKeys::WindowId] = QString();
    return object;
}

QByteArray toLine(const QJsonObject& object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact) + '\n';
}

std::optional<QJsonObject> parseObject(const QByteArray& line)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(line.trimmed(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }
    return document.object();
}

bool applyIntOption(const QCommandLineParser& parser, QLatin1String name, int* target, QString* errorMessage)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const int value = parser.value(name).toInt(&ok);
    if (!ok) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("--%1 expects an integer, got %2").arg(QString(name), parser.value(name));
        }
        return false;
    }
    *target = value;
    return true;
}

} // anonymous namespace

QByteArray encodeCallback(const DragCallbackEvent& callback)
{
    QJsonObject object = baseObject(dragCallbackKindName(callback.kind));
    object[JsonKeys::FilePath] = callback.filePath.value_or(QString());
    object[JsonKeys::X] = callback.x;
    object[JsonKeys::Y] = callback.y;
    object[JsonKeys::Timestamp] = callback.timestamp;
    object[JsonKeys::WindowId] = callback.originatingSensorWindow;
    return toLine(object);
}

QByteArray encodeReady(int windowCount)
{
    QJsonObject object = baseObject(EventTypes::Ready);
    object[JsonKeys::WindowId] = QString::number(windowCount);
    return toLine(object);
}

QByteArray encodeError(ErrorCode code, const QString& message)
{
    QJsonObject object = baseObject(EventTypes::Error);
    object[JsonKeys::Code] = errorCodeName(code);
    object[JsonKeys::Message] = message;
    return toLine(object);
}

QByteArray encodeShutdownAck()
{
    return toLine(baseObject(EventTypes::ShutdownAck));
}

std::optional<Message> decodeMessage(const QByteArray& line)
{
    const std::optional<QJsonObject> parsed = parseObject(line);
    if (!parsed) {
        qCDebug(lcHelper) << "Ignoring malformed helper line:" << line.left(200);
        return std::nullopt;
    }

    const QJsonObject& object = *parsed;
    const QString eventType = object.value(JsonKeys::EventType).toString();

    Message message;
    if (eventType == EventTypes::Ready) {
        message.type = Message::Type::Ready;
        message.windowCount = object.value(JsonKeys::WindowId).toString().toInt();
        return message;
    }
    if (eventType == EventTypes::Error) {
        message.type = Message::Type::Error;
        message.errorCode = errorCodeFromName(object.value(JsonKeys::Code).toString());
        if (message.errorCode == ErrorCode::None) {
            message.errorCode = ErrorCode::WindowCreationFailed;
        }
        message.errorMessage = object.value(JsonKeys::Message).toString();
        return message;
    }
    if (eventType == EventTypes::ShutdownAck) {
        message.type = Message::Type::ShutdownAck;
        return message;
    }

    const std::optional<DragCallbackKind> kind = dragCallbackKindFromName(eventType);
    if (!kind) {
        qCDebug(lcHelper) << "Ignoring helper line with unknown eventType" << eventType;
        return std::nullopt;
    }

    message.type = Message::Type::DragCallback;
    message.callback.kind = *kind;
    const QString filePath = object.value(JsonKeys::FilePath).toString();
    if (!filePath.isEmpty()) {
        message.callback.filePath = filePath;
    }
    message.callback.x = object.value(JsonKeys::X).toDouble();
    message.callback.y = object.value(JsonKeys::Y).toDouble();
    message.callback.timestamp = object.value(JsonKeys::Timestamp).toDouble();
    message.callback.originatingSensorWindow = object.value(JsonKeys::WindowId).toString();
    return message;
}

QByteArray encodeMove(const QPointF& logicalPosition)
{
    QJsonObject object;
    object[JsonKeys::Command] = QString(HelperCommands::Move);
    object[JsonKeys::X] = logicalPosition.x();
    object[JsonKeys::Y] = logicalPosition.y();
    return toLine(object);
}

QByteArray encodeShutdown()
{
    QJsonObject object;
    object[JsonKeys::Command] = QString(HelperCommands::Shutdown);
    return toLine(object);
}

std::optional<Command> decodeCommand(const QByteArray& line)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed == "shutdown") {
        return Command{Command::Type::Shutdown, QPointF()};
    }

    const std::optional<QJsonObject> parsed = parseObject(trimmed);
    if (!parsed) {
        return std::nullopt;
    }

    const QString command = parsed->value(JsonKeys::Command).toString();
    if (command == HelperCommands::Shutdown) {
        return Command{Command::Type::Shutdown, QPointF()};
    }
    if (command == HelperCommands::Move) {
        const QJsonValue x = parsed->value(JsonKeys::X);
        const QJsonValue y = parsed->value(JsonKeys::Y);
        if (!x.isDouble() || !y.isDouble()) {
            return std::nullopt;
        }
        return Command{Command::Type::Move, QPointF(x.toDouble(), y.toDouble())};
    }
    return std::nullopt;
}

QStringList encodeArguments(const GridLayout& layout, const QPointF& logicalCenter)
{
    auto option = [](QLatin1String name) -> QString {
        return QStringLiteral("--") + name;
    };

    QStringList arguments{option(HelperOptions::Layout), layout.name()};
    if (layout.kind == GridLayout::Kind::Frame) {
        arguments << option(HelperOptions::StripLength) << QString::number(layout.stripLength)
                  << option(HelperOptions::StripThickness) << QString::number(layout.stripThickness)
                  << option(HelperOptions::Gap) << QString::number(layout.gap);
    } else {
        arguments << option(HelperOptions::GridSize) << QString::number(layout.gridSize)
                  << option(HelperOptions::CellSize) << QString::number(layout.cellSize)
                  << option(HelperOptions::Pitch) << QString::number(layout.pitch);
    }
    // "--" keeps negative coordinates from being parsed as options
    arguments << QStringLiteral("--") << QString::number(logicalCenter.x(), 'f', 2)
              << QString::number(logicalCenter.y(), 'f', 2);
    return arguments;
}

void addLayoutOptions(QCommandLineParser* parser)
{
    parser->addOptions({
        {QString(HelperOptions::Layout), QStringLiteral("Sensor layout: frame or grid"), QStringLiteral("name")},
        {QString(HelperOptions::GridSize), QStringLiteral("Cells per side of the grid layout"), QStringLiteral("n")},
        {QString(HelperOptions::CellSize), QStringLiteral("Edge of one grid cell in px"), QStringLiteral("px")},
        {QString(HelperOptions::Pitch), QStringLiteral("Distance between grid cell centers in px"), QStringLiteral("px")},
        {QString(HelperOptions::StripLength), QStringLiteral("Length of a frame strip in px"), QStringLiteral("px")},
        {QString(HelperOptions::StripThickness), QStringLiteral("Thickness of a frame strip in px"), QStringLiteral("px")},
        {QString(HelperOptions::Gap), QStringLiteral("Distance of the frame strips from the pointer in px"),
         QStringLiteral("px")},
    });
}

std::optional<GridLayout> decodeLayout(const QCommandLineParser& parser, const GridLayout& fallback,
                                       QString* errorMessage)
{
    GridLayout layout = fallback;
    if (parser.isSet(HelperOptions::Layout)) {
        const QString name = parser.value(HelperOptions::Layout);
        const std::optional<GridLayout> named = GridLayout::fromName(name);
        if (!named) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Unknown layout %1").arg(name);
            }
            return std::nullopt;
        }
        if (named->kind != fallback.kind) {
            layout = *named;
        }
    }

    if (!applyIntOption(parser, HelperOptions::GridSize, &layout.gridSize, errorMessage)
        || !applyIntOption(parser, HelperOptions::CellSize, &layout.cellSize, errorMessage)
        || !applyIntOption(parser, HelperOptions::Pitch, &layout.pitch, errorMessage)
        || !applyIntOption(parser, HelperOptions::StripLength, &layout.stripLength, errorMessage)
        || !applyIntOption(parser, HelperOptions::StripThickness, &layout.stripThickness, errorMessage)
        || !applyIntOption(parser, HelperOptions::Gap, &layout.gap, errorMessage)) {
        return std::nullopt;
    }

    if (!layout.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid %1 layout geometry").arg(layout.name());
        }
        return std::nullopt;
    }
    return layout;
}

} // namespace HelperProtocol

} // namespace DragSense
