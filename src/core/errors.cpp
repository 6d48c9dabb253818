// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "errors.h"

namespace DragSense {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("None");
    case ErrorCode::PermissionDenied:
        return QStringLiteral("PermissionDenied");
    case ErrorCode::WindowCreationFailed:
        return QStringLiteral("WindowCreationFailed");
    case ErrorCode::CaptureFailed:
        return QStringLiteral("CaptureFailed");
    case ErrorCode::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case ErrorCode::MonitorTerminatedUnexpectedly:
        return QStringLiteral("MonitorTerminatedUnexpectedly");
    case ErrorCode::HelperUnavailable:
        return QStringLiteral("HelperUnavailable");
    }
    return QString();
}

ErrorCode errorCodeFromName(const QString& name)
{
    static const ErrorCode codes[] = {ErrorCode::PermissionDenied, ErrorCode::WindowCreationFailed,
                                      ErrorCode::CaptureFailed, ErrorCode::InvalidArgument,
                                      ErrorCode::MonitorTerminatedUnexpectedly, ErrorCode::HelperUnavailable};
    for (ErrorCode code : codes) {
        if (errorCodeName(code) == name) {
            return code;
        }
    }
    return ErrorCode::None;
}

} // namespace DragSense
