// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QCommandLineParser>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTest>

#include "core/constants.h"
#include "core/helperprotocol.h"

using namespace DragSense;

/**
 * @brief Unit tests for the sensor helper's line protocol
 *
 * Tests cover:
 * - Field set of every stdout line
 * - Decoding of control lines and malformed input
 * - Command parsing, including the bare "shutdown" form
 * - Helper command line carrying the full layout geometry
 */
class TestHelperProtocol : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void callbackLine_hasAllFields()
    {
        DragCallbackEvent callback;
        callback.kind = DragCallbackKind::DroppedFile;
        callback.filePath = QStringLiteral("/home/user/a.txt");
        callback.x = 460;
        callback.y = 435;
        callback.timestamp = 1700000000000.0;
        callback.originatingSensorWindow = QStringLiteral("SensorWindow-r0c1");

        const QByteArray line = HelperProtocol::encodeCallback(callback);
        QVERIFY(line.endsWith('\n'));
        QCOMPARE(line.count('\n'), 1);

        const QJsonObject object = QJsonDocument::fromJson(line).object();
        QCOMPARE(object.value(JsonKeys::EventType).toString(), QStringLiteral("dropped_file"));
        QCOMPARE(object.value(JsonKeys::FilePath).toString(), QStringLiteral("/home/user/a.txt"));
        QCOMPARE(object.value(JsonKeys::X).toDouble(), 460.0);
        QCOMPARE(object.value(JsonKeys::Y).toDouble(), 435.0);
        QCOMPARE(object.value(JsonKeys::Timestamp).toDouble(), 1700000000000.0);
        QVERIFY(object.contains(JsonKeys::Platform));
        QCOMPARE(object.value(JsonKeys::WindowId).toString(), QStringLiteral("SensorWindow-r0c1"));
    }

    void decode_callback()
    {
        const QByteArray line = "{\"eventType\":\"hovered_file\",\"filePath\":\"/x\",\"x\":1.5,\"y\":2,"
                                "\"timestamp\":3,\"platform\":\"linux\",\"windowId\":\"w\"}";
        const std::optional<HelperProtocol::Message> message = HelperProtocol::decodeMessage(line);
        QVERIFY(message.has_value());
        QCOMPARE(message->type, HelperProtocol::Message::Type::DragCallback);
        QCOMPARE(message->callback.kind, DragCallbackKind::HoveredFile);
        QCOMPARE(message->callback.filePath.value_or(QString()), QStringLiteral("/x"));
        QCOMPARE(message->callback.x, 1.5);
        QCOMPARE(message->callback.originatingSensorWindow, QStringLiteral("w"));
    }

    void decode_cancelHasNoPath()
    {
        DragCallbackEvent callback;
        callback.kind = DragCallbackKind::HoverCancelled;
        const std::optional<HelperProtocol::Message> message =
            HelperProtocol::decodeMessage(HelperProtocol::encodeCallback(callback));
        QVERIFY(message.has_value());
        QVERIFY(!message->callback.filePath.has_value());
    }

    void decode_controlLines()
    {
        const std::optional<HelperProtocol::Message> ready = HelperProtocol::decodeMessage(HelperProtocol::encodeReady(24));
        QVERIFY(ready.has_value());
        QCOMPARE(ready->type, HelperProtocol::Message::Type::Ready);
        QCOMPARE(ready->windowCount, 24);

        const std::optional<HelperProtocol::Message> error = HelperProtocol::decodeMessage(
            HelperProtocol::encodeError(ErrorCode::WindowCreationFailed, QStringLiteral("no surface")));
        QVERIFY(error.has_value());
        QCOMPARE(error->type, HelperProtocol::Message::Type::Error);
        QCOMPARE(error->errorCode, ErrorCode::WindowCreationFailed);
        QCOMPARE(error->errorMessage, QStringLiteral("no surface"));

        const std::optional<HelperProtocol::Message> ack =
            HelperProtocol::decodeMessage(HelperProtocol::encodeShutdownAck());
        QVERIFY(ack.has_value());
        QCOMPARE(ack->type, HelperProtocol::Message::Type::ShutdownAck);
    }

    void decode_unknownErrorCodeIsWindowCreationFailed()
    {
        const std::optional<HelperProtocol::Message> error =
            HelperProtocol::decodeMessage("{\"eventType\":\"error\",\"code\":\"Bogus\",\"message\":\"m\"}");
        QVERIFY(error.has_value());
        QCOMPARE(error->errorCode, ErrorCode::WindowCreationFailed);
    }

    void decode_rejectsGarbage()
    {
        QVERIFY(!HelperProtocol::decodeMessage("not json").has_value());
        QVERIFY(!HelperProtocol::decodeMessage("[1,2,3]").has_value());
        QVERIFY(!HelperProtocol::decodeMessage("{\"eventType\":\"teleported\"}").has_value());
    }

    void commands_roundTrip()
    {
        const std::optional<HelperProtocol::Command> move =
            HelperProtocol::decodeCommand(HelperProtocol::encodeMove(QPointF(-12.5, 300)));
        QVERIFY(move.has_value());
        QCOMPARE(move->type, HelperProtocol::Command::Type::Move);
        QCOMPARE(move->position, QPointF(-12.5, 300));

        const std::optional<HelperProtocol::Command> shutdown =
            HelperProtocol::decodeCommand(HelperProtocol::encodeShutdown());
        QVERIFY(shutdown.has_value());
        QCOMPARE(shutdown->type, HelperProtocol::Command::Type::Shutdown);
    }

    void commands_bareShutdownAndInvalidMove()
    {
        const std::optional<HelperProtocol::Command> bare = HelperProtocol::decodeCommand("shutdown\n");
        QVERIFY(bare.has_value());
        QCOMPARE(bare->type, HelperProtocol::Command::Type::Shutdown);

        QVERIFY(!HelperProtocol::decodeCommand("{\"command\":\"move\",\"x\":\"a\",\"y\":1}").has_value());
        QVERIFY(!HelperProtocol::decodeCommand("{\"command\":\"jump\"}").has_value());
    }

    void arguments_carryCustomFrameGeometry()
    {
        const QStringList arguments =
            HelperProtocol::encodeArguments(GridLayout::frame(100, 20, 30), QPointF(-15.5, 240));

        QCommandLineParser parser;
        HelperProtocol::addLayoutOptions(&parser);
        QVERIFY(parser.parse(QStringList{QStringLiteral("dragsense-sensor-helper")} + arguments));

        // Configured geometry must not win over what the host asked for
        QString error;
        const std::optional<GridLayout> layout =
            HelperProtocol::decodeLayout(parser, GridLayout::sparseGrid(7, 10, 20), &error);
        QVERIFY2(layout.has_value(), qPrintable(error));
        QCOMPARE(layout->kind, GridLayout::Kind::Frame);
        QCOMPARE(layout->stripLength, 100);
        QCOMPARE(layout->stripThickness, 20);
        QCOMPARE(layout->gap, 30);

        QCOMPARE(parser.positionalArguments(), (QStringList{QStringLiteral("-15.50"), QStringLiteral("240.00")}));
    }

    void arguments_carryCustomGridGeometry()
    {
        QCommandLineParser parser;
        HelperProtocol::addLayoutOptions(&parser);
        QVERIFY(parser.parse(QStringList{QStringLiteral("helper")}
                             + HelperProtocol::encodeArguments(GridLayout::sparseGrid(3, 16, 32), QPointF(1, 2))));

        const std::optional<GridLayout> layout =
            HelperProtocol::decodeLayout(parser, GridLayout::defaultLayout(), nullptr);
        QVERIFY(layout.has_value());
        QCOMPARE(layout->kind, GridLayout::Kind::SparseGrid);
        QCOMPARE(layout->gridSize, 3);
        QCOMPARE(layout->cellSize, 16);
        QCOMPARE(layout->pitch, 32);
        QCOMPARE(layout->windowCount(), 8);
    }

    void bareArguments_useFallbackLayout()
    {
        QCommandLineParser parser;
        HelperProtocol::addLayoutOptions(&parser);
        QVERIFY(parser.parse(QStringList{QStringLiteral("helper"), QStringLiteral("10"), QStringLiteral("20")}));

        const GridLayout configured = GridLayout::frame(300, 12, 8);
        const std::optional<GridLayout> layout = HelperProtocol::decodeLayout(parser, configured, nullptr);
        QVERIFY(layout.has_value());
        QCOMPARE(layout->stripLength, 300);
        QCOMPARE(layout->stripThickness, 12);
        QCOMPARE(layout->gap, 8);
    }

    void badLayoutArguments_areRejected_data()
    {
        QTest::addColumn<QStringList>("arguments");
        QTest::newRow("unknown layout") << QStringList{QStringLiteral("--layout"), QStringLiteral("spiral")};
        QTest::newRow("non-numeric gap") << QStringList{QStringLiteral("--gap"), QStringLiteral("wide")};
        QTest::newRow("even grid size") << QStringList{QStringLiteral("--layout"), QStringLiteral("grid"),
                                                       QStringLiteral("--grid-size"), QStringLiteral("4")};
        QTest::newRow("zero thickness") << QStringList{QStringLiteral("--thickness"), QStringLiteral("0")};
    }

    void badLayoutArguments_areRejected()
    {
        QFETCH(QStringList, arguments);

        QCommandLineParser parser;
        HelperProtocol::addLayoutOptions(&parser);
        QVERIFY(parser.parse(QStringList{QStringLiteral("helper")} + arguments));

        QString error;
        QVERIFY(!HelperProtocol::decodeLayout(parser, GridLayout::defaultLayout(), &error).has_value());
        QVERIFY(!error.isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestHelperProtocol)
#include "test_helper_protocol.moc"
