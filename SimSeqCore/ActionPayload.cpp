///////////////////////////////////////////////////////////////////////////////
// FILE:          ActionPayload.cpp
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

#include "ActionPayload.h"

#include "Error.h"

#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace simseq {

const char*
ToString(ActionKind kind)
{
   switch (kind)
   {
      case ActionKind::SetDigital: return "SetDigital";
      case ActionKind::SetAnalog: return "SetAnalog";
      case ActionKind::MoveAbsolute: return "MoveAbsolute";
      case ActionKind::MoveRelative: return "MoveRelative";
      case ActionKind::Custom: return "Custom";
   }
   return "Invalid";
}


ActionPayload
ActionPayload::Digital(bool state)
{
   return ActionPayload(ActionKind::SetDigital, state, 0.0, 0);
}


ActionPayload
ActionPayload::Analog(double value)
{
   return ActionPayload(ActionKind::SetAnalog, false, value, 0);
}


ActionPayload
ActionPayload::Absolute(double positionUm)
{
   return ActionPayload(ActionKind::MoveAbsolute, false, positionUm, 0);
}


ActionPayload
ActionPayload::Relative(double offsetUm)
{
   return ActionPayload(ActionKind::MoveRelative, false, offsetUm, 0);
}


ActionPayload
ActionPayload::CustomIndex(long index)
{
   return ActionPayload(ActionKind::Custom, false, 0.0, index);
}


static SeqError
WrongKind(ActionKind actual, const char* requested)
{
   return SeqError(std::string("Action payload is ") + ToString(actual) +
         ", not " + requested);
}


bool
ActionPayload::GetDigitalState() const
{
   if (kind_ != ActionKind::SetDigital)
      throw WrongKind(kind_, "SetDigital");
   return state_;
}


double
ActionPayload::GetAnalogValue() const
{
   if (kind_ != ActionKind::SetAnalog)
      throw WrongKind(kind_, "SetAnalog");
   return value_;
}


double
ActionPayload::GetPosition() const
{
   if (kind_ != ActionKind::MoveAbsolute && kind_ != ActionKind::MoveRelative)
      throw WrongKind(kind_, "a move");
   return value_;
}


long
ActionPayload::GetCustomIndex() const
{
   if (kind_ != ActionKind::Custom)
      throw WrongKind(kind_, "Custom");
   return index_;
}


bool
ActionPayload::operator==(const ActionPayload& rhs) const
{
   if (kind_ != rhs.kind_)
      return false;
   switch (kind_)
   {
      case ActionKind::SetDigital:
         return state_ == rhs.state_;
      case ActionKind::Custom:
         return index_ == rhs.index_;
      default:
         return value_ == rhs.value_;
   }
}


std::string
ActionPayload::ValueString() const
{
   switch (kind_)
   {
      case ActionKind::SetDigital:
         return state_ ? "true" : "false";
      case ActionKind::Custom:
         return std::to_string(index_);
      default:
      {
         // Independent of the global locale so that dumps are reproducible.
         // Shortest of 15 or max_digits10 digits that reads back exactly.
         std::ostringstream oss;
         oss.imbue(std::locale::classic());
         oss << std::setprecision(15) << value_;

         std::istringstream iss(oss.str());
         iss.imbue(std::locale::classic());
         double readBack = 0.0;
         iss >> readBack;
         if (readBack == value_)
            return oss.str();

         std::ostringstream exact;
         exact.imbue(std::locale::classic());
         exact << std::setprecision(std::numeric_limits<double>::max_digits10)
            << value_;
         return exact.str();
      }
   }
}


std::string
ActionPayload::ToString() const
{
   return std::string(simseq::ToString(kind_)) + "(" + ValueString() + ")";
}

} // namespace simseq
