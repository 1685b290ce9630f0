///////////////////////////////////////////////////////////////////////////////
// FILE:          TableDump.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Deterministic text and JSON renderings of an action table
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include "ActionTable.h"
#include "DeviceRegistry.h"

#include <string>

namespace simseq {

/**
 * One line per entry, in table order:
 * "<ms with 3 decimals>\t<resource label>\t<payload>".
 */
std::string DumpTableText(const ActionTable& table,
      const DeviceRegistry& registry);

/**
 * {"durationMs": "130.000", "entries": [{"t": "0.000", "target": "cam",
 * "action": "SetDigital", "value": true}, ...]}
 *
 * Times are strings so that no reader ever sees them as floating point.
 */
std::string DumpTableJson(const ActionTable& table,
      const DeviceRegistry& registry, int indent = 2);

} // namespace simseq
