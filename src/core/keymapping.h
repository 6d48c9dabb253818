// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragsense_export.h"
#include <QString>

namespace DragSense {

/**
 * @brief Keysym to host-facing key identity
 *
 * Codes and names follow the DOM legacy key codes that web hosts know:
 * letters are 65-90 named "A"-"Z", digits 48-57 named "Num0"-"Num9",
 * F1-F12 are 112-123, left and right variants of a modifier share a code
 * ("ShiftLeft"/"ShiftRight" are both 16).
 *
 * A keysym without a table entry keeps its xkb name with code 0. A key
 * without any keysym is reported as "Unknown(<keycode>)" with the X keycode.
 */
namespace KeyMapping {

struct DRAGSENSE_EXPORT KeyIdentity
{
    int code = 0;
    QString name;
};

DRAGSENSE_EXPORT KeyIdentity identify(quint32 keysym, quint32 keycode);

} // namespace KeyMapping

} // namespace DragSense
