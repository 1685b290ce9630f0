///////////////////////////////////////////////////////////////////////////////
// FILE:          ActionPayload.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Command carried by an action table entry
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

#include <string>

namespace simseq {

enum class ActionKind
{
   SetDigital,
   SetAnalog,
   MoveAbsolute,
   MoveRelative,
   Custom,
};

const char* ToString(ActionKind kind);

/**
 * Tagged value: exactly one of a digital state, an analog setpoint, an
 * absolute or relative position (microns) or a custom index, selected by
 * GetKind(). Immutable once constructed.
 */
class ActionPayload
{
public:
   static ActionPayload Digital(bool state);
   static ActionPayload Analog(double value);
   static ActionPayload Absolute(double positionUm);
   static ActionPayload Relative(double offsetUm);
   static ActionPayload CustomIndex(long index);

   ActionKind GetKind() const { return kind_; }

   // The getters throw SeqError if the payload is of another kind
   bool GetDigitalState() const;
   double GetAnalogValue() const;
   double GetPosition() const; // MoveAbsolute or MoveRelative
   long GetCustomIndex() const;

   bool operator==(const ActionPayload& rhs) const;
   bool operator!=(const ActionPayload& rhs) const { return !(*this == rhs); }

   // "SetDigital(true)", "MoveAbsolute(10)", "Custom(3)", ...
   std::string ToString() const;
   // Argument only, as it appears between the parentheses of ToString()
   std::string ValueString() const;

private:
   ActionPayload(ActionKind kind, bool state, double value, long index) :
      kind_(kind),
      state_(state),
      value_(value),
      index_(index)
   {}

   ActionKind kind_;
   bool state_;
   double value_;
   long index_;
};

} // namespace simseq
