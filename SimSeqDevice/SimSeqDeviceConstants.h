///////////////////////////////////////////////////////////////////////////////
// FILE:          SimSeqDeviceConstants.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqDevice - Device descriptor kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Status codes and keywords shared by resource descriptors
//
// LICENSE:       This file is distributed under the BSD license.
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

#define SIMSEQ_OK                          0
#define SIMSEQ_ERR                         1 // generic, undefined error
#define SIMSEQ_TIMING_UNAVAILABLE          2
#define SIMSEQ_INVALID_PARAMETER           3
#define SIMSEQ_UNSUPPORTED_COMMAND         4

namespace simseq {

enum ResourceType {
   UnknownResource = 0,
   CameraResource,
   LightResource,
   StageResource,
   ModulatorResource,
};

// How a pattern-generator client interprets the per-step command
enum AnalogDriveMode {
   DriveSequenceIndex, // Custom(i): index into a sequence uploaded beforehand
   DriveAngle,         // SetAnalog(angle of step i)
   DrivePhase,         // SetAnalog(phase of step i)
};

namespace g_Keyword {
   const char* const Camera = "camera";
   const char* const Light = "light";
   const char* const Stage = "stage";
   const char* const Modulator = "modulator";

   const char* const DriveIndex = "index";
   const char* const DriveAngle = "angle";
   const char* const DrivePhase = "phase";
} // namespace g_Keyword

} // namespace simseq
