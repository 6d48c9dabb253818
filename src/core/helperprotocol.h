// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include "errors.h"
#include "sensorgrid.h"
#include "types.h"
#include <QByteArray>
#include <QPointF>
#include <QStringList>
#include <optional>

class QCommandLineParser;

namespace DragSense {

/**
 * @brief Line protocol between the host and dragsense-sensor-helper
 *
 * Helper stdout: one compact JSON object per line, always carrying
 * eventType, filePath, x, y, timestamp, platform and windowId.
 *   hovered_file / dropped_file / hovered_file_cancelled  - sensor callbacks
 *   ready         - all sensor windows exist; windowId holds the window count
 *   error         - arming failed; extra "code" and "message" fields
 *   shutdown_ack  - windows are gone, the helper exits next
 *
 * Helper stdin: one JSON command per line.
 *   {"command":"move","x":<logical x>,"y":<logical y>}
 *   {"command":"shutdown"}
 * A bare "shutdown" line is accepted as well.
 *
 * Helper command line: the layout and its full geometry as options, then
 * "--" and the logical press position:
 *   --layout frame --strip-length 200 --thickness 24 --gap 40 -- <x> <y>
 *   --layout grid --grid-size 5 --cell 24 --pitch 48 -- <x> <y>
 * Geometry options left out fall back to the helper's configuration.
 */
namespace HelperProtocol {

struct DRAGSENSE_EXPORT Message
{
    enum class Type {
        DragCallback,
        Ready,
        Error,
        ShutdownAck
    };

    Type type = Type::DragCallback;
    DragCallbackEvent callback;     ///< Type::DragCallback
    int windowCount = 0;            ///< Type::Ready
    ErrorCode errorCode = ErrorCode::None;  ///< Type::Error
    QString errorMessage;           ///< Type::Error
};

struct DRAGSENSE_EXPORT Command
{
    enum class Type {
        Move,
        Shutdown
    };

    Type type = Type::Shutdown;
    QPointF position;               ///< Type::Move, logical
};

DRAGSENSE_EXPORT QByteArray encodeCallback(const DragCallbackEvent& callback);
DRAGSENSE_EXPORT QByteArray encodeReady(int windowCount);
DRAGSENSE_EXPORT QByteArray encodeError(ErrorCode code, const QString& message);
DRAGSENSE_EXPORT QByteArray encodeShutdownAck();

/**
 * @brief Parse one helper stdout line (without or with trailing newline)
 * @return std::nullopt for malformed JSON or unknown event types
 */
DRAGSENSE_EXPORT std::optional<Message> decodeMessage(const QByteArray& line);

DRAGSENSE_EXPORT QByteArray encodeMove(const QPointF& logicalPosition);
DRAGSENSE_EXPORT QByteArray encodeShutdown();

/**
 * @brief Parse one helper stdin line
 * @return std::nullopt for anything that is not a known command
 */
DRAGSENSE_EXPORT std::optional<Command> decodeCommand(const QByteArray& line);

/**
 * @brief Arguments the host starts the helper with
 */
DRAGSENSE_EXPORT QStringList encodeArguments(const GridLayout& layout, const QPointF& logicalCenter);

/**
 * @brief Register the layout options on the helper's parser
 */
DRAGSENSE_EXPORT void addLayoutOptions(QCommandLineParser* parser);

/**
 * @brief Layout requested on the helper's command line
 *
 * Starts from @p fallback when --layout is absent or names the same kind,
 * from the built-in defaults of the named kind otherwise, then applies each
 * geometry option that is set.
 *
 * @param errorMessage Set when an option is malformed or the result is invalid
 * @return std::nullopt on error
 */
DRAGSENSE_EXPORT std::optional<GridLayout> decodeLayout(const QCommandLineParser& parser, const GridLayout& fallback,
                                                        QString* errorMessage);

} // namespace HelperProtocol

} // namespace DragSense
