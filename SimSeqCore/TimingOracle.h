///////////////////////////////////////////////////////////////////////////////
// FILE:          TimingOracle.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Timing queries against registered resources
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

#include "ActionPayload.h"
#include "DeviceRegistry.h"
#include "ResourceHandle.h"

#include "../SimSeqDevice/SimSeqTime.h"

#include <string>

namespace simseq {

struct MotionEstimate
{
   Time moveTime;
   Time settleTime;

   Time Total() const { return moveTime + settleTime; }
};


/**
 * Answers "how long will this take" for registered resources.
 *
 * Nothing is cached: every call goes to the resource descriptor, since a
 * camera's readout gap may depend on an exposure set after the previous
 * run. Failed device queries are reported as SeqError with
 * SIMSEQERR_UnavailableTiming; a resource lacking the queried capability
 * gives SIMSEQERR_MissingCapability.
 */
class TimingOracle
{
public:
   explicit TimingOracle(const DeviceRegistry& registry) :
      registry_(registry)
   {}

   MotionEstimate GetMotionTime(ResourceHandle stage,
         double fromUm, double toUm) const;
   Time GetStageSettlingTime(ResourceHandle stage) const;

   Time GetExposureTime(ResourceHandle camera) const;
   Time GetInterExposureGap(ResourceHandle camera) const;
   Time GetResetTime(ResourceHandle camera) const;
   bool IsCameraReady(ResourceHandle camera) const;

   Time GetAnalogSettlingTime(ResourceHandle client) const;

   /**
    * How long the target stays busy after executing the payload.
    *
    * SetDigital(true) on an Exposable: exposure + gap. A move on a
    * Positionable: its settling time (the travel itself is accounted for by
    * the planner's cursor). SetAnalog or Custom on an AnalogSettable: its
    * settling time. Anything else: zero.
    */
   Time GetBusyDuration(ResourceHandle target,
         const ActionPayload& payload) const;

   const DeviceRegistry& GetRegistry() const { return registry_; }

private:
   void ThrowIfError(int code, ResourceHandle handle,
         const std::string& msg) const;

   const DeviceRegistry& registry_;
};

} // namespace simseq
