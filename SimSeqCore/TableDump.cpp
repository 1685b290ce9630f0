///////////////////////////////////////////////////////////////////////////////
// FILE:          TableDump.cpp
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
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

#include "TableDump.h"

#include <nlohmann/json.hpp>

#include <sstream>

namespace simseq {

namespace {

nlohmann::json PayloadValueToJson(const ActionPayload& payload)
{
   switch (payload.GetKind())
   {
      case ActionKind::SetDigital:
         return payload.GetDigitalState();
      case ActionKind::SetAnalog:
         return payload.GetAnalogValue();
      case ActionKind::MoveAbsolute:
      case ActionKind::MoveRelative:
         return payload.GetPosition();
      case ActionKind::Custom:
         return payload.GetCustomIndex();
   }
   return nullptr;
}

nlohmann::json EntryToJson(const ActionEntry& entry,
      const DeviceRegistry& registry)
{
   nlohmann::json j;
   j["t"] = entry.timestamp.ToString();
   j["target"] = registry.GetLabel(entry.target);
   j["action"] = ToString(entry.payload.GetKind());
   j["value"] = PayloadValueToJson(entry.payload);
   return j;
}

} // anonymous namespace


std::string
DumpTableText(const ActionTable& table, const DeviceRegistry& registry)
{
   std::ostringstream oss;
   for (const ActionEntry& entry : table.GetEntries())
   {
      oss << entry.timestamp.ToString() << '\t' <<
         registry.GetLabel(entry.target) << '\t' <<
         entry.payload.ToString() << '\n';
   }
   return oss.str();
}


std::string
DumpTableJson(const ActionTable& table, const DeviceRegistry& registry,
      int indent)
{
   nlohmann::json entries = nlohmann::json::array();
   for (const ActionEntry& entry : table.GetEntries())
      entries.push_back(EntryToJson(entry, registry));

   nlohmann::json j;
   j["durationMs"] = table.GetDuration().ToString();
   j["entries"] = entries;
   return j.dump(indent);
}

} // namespace simseq
