///////////////////////////////////////////////////////////////////////////////
// FILE:          CoreUtils.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Utility functions for use in SimSeqCore
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

#include "../SimSeqDevice/SimSeqDeviceConstants.h"

#include <string>


namespace simseq {

inline std::string ToString(const std::string& d) { return d; }

inline std::string ToString(const char* d)
{
   if (!d)
      return "(null)";
   return d;
}

inline std::string ToString(ResourceType t)
{
   switch (t)
   {
      case UnknownResource: return "Unknown";
      case CameraResource: return "Camera";
      case LightResource: return "Light";
      case StageResource: return "Stage";
      case ModulatorResource: return "Modulator";
   }
   return "Invalid";
}

inline std::string ToString(AnalogDriveMode m)
{
   switch (m)
   {
      case DriveSequenceIndex: return g_Keyword::DriveIndex;
      case DriveAngle: return g_Keyword::DriveAngle;
      case DrivePhase: return g_Keyword::DrivePhase;
   }
   return "Invalid";
}

template <typename T>
inline std::string ToQuotedString(const T& d)
{ return "\"" + ToString(d) + "\""; }

template <>
inline std::string ToQuotedString<const char*>(const char* const& d)
{
   if (!d) // Don't quote if null
      return ToString(d);
   return "\"" + ToString(d) + "\"";
}

} // namespace simseq
