// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include <QColor>
#include <QMetaType>
#include <QString>

namespace DragSense {

/**
 * @brief Error taxonomy for host-facing operations
 *
 * Unknown listener handles are not errors; remove* returns false instead.
 * Starting an already started monitor is a successful no-op.
 */
enum class ErrorCode {
    None = 0,
    PermissionDenied,               ///< Global hook or screen capture refused
    WindowCreationFailed,           ///< Sensor window could not be created; episode aborted
    CaptureFailed,                  ///< Color sample could not be captured
    InvalidArgument,                ///< Wrong type/shape at a public entry point
    MonitorTerminatedUnexpectedly,  ///< Sensor helper exited without acknowledging shutdown
    HelperUnavailable               ///< Helper locator does not name an executable
};

DRAGSENSE_EXPORT QString errorCodeName(ErrorCode code);
DRAGSENSE_EXPORT ErrorCode errorCodeFromName(const QString& name);

/**
 * @brief Result of a fallible operation
 */
struct DRAGSENSE_EXPORT OperationResult
{
    ErrorCode code = ErrorCode::None;
    QString message;

    bool ok() const
    {
        return code == ErrorCode::None;
    }

    static OperationResult success()
    {
        return OperationResult{ErrorCode::None, QString()};
    }

    static OperationResult failure(ErrorCode code, const QString& message)
    {
        return OperationResult{code, message};
    }
};

/**
 * @brief Result of ScreenColorSampler::sampleAt()
 */
struct DRAGSENSE_EXPORT ColorSample
{
    OperationResult status;
    QColor color;               ///< Invalid unless status.ok()

    bool ok() const
    {
        return status.ok() && color.isValid();
    }

    static ColorSample failed(const QString& message)
    {
        return ColorSample{OperationResult::failure(ErrorCode::CaptureFailed, message), QColor()};
    }
};

} // namespace DragSense

Q_DECLARE_METATYPE(DragSense::ErrorCode)
