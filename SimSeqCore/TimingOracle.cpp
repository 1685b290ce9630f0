///////////////////////////////////////////////////////////////////////////////
// FILE:          TimingOracle.cpp
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

#include "TimingOracle.h"

namespace simseq {

void
TimingOracle::ThrowIfError(int code, ResourceHandle handle,
      const std::string& msg) const
{
   if (code == SIMSEQ_OK)
      return;

   std::string label = registry_.GetLabel(handle);
   std::string deviceMsg;
   switch (code)
   {
      case SIMSEQ_TIMING_UNAVAILABLE:
         deviceMsg = "timing parameter not available";
         break;
      case SIMSEQ_INVALID_PARAMETER:
         deviceMsg = "invalid parameter";
         break;
      case SIMSEQ_UNSUPPORTED_COMMAND:
         deviceMsg = "unsupported command";
         break;
      default:
         deviceMsg = "device status " + std::to_string(code);
         break;
   }
   throw SeqError(msg + " for " + ToQuotedString(label),
         SIMSEQERR_UnavailableTiming,
         SeqError("Error in resource " + ToQuotedString(label) + ": " +
            deviceMsg));
}


MotionEstimate
TimingOracle::GetMotionTime(ResourceHandle stage,
      double fromUm, double toUm) const
{
   std::shared_ptr<Positionable> positionable =
      registry_.GetCapability<Positionable>(stage);
   MotionEstimate estimate;
   int ret = positionable->GetMovementTime(fromUm, toUm,
         estimate.moveTime, estimate.settleTime);
   ThrowIfError(ret, stage, "Cannot get movement time");
   return estimate;
}


Time
TimingOracle::GetStageSettlingTime(ResourceHandle stage) const
{
   std::shared_ptr<Positionable> positionable =
      registry_.GetCapability<Positionable>(stage);
   Time settle;
   int ret = positionable->GetSettlingTime(settle);
   ThrowIfError(ret, stage, "Cannot get settling time");
   return settle;
}


Time
TimingOracle::GetExposureTime(ResourceHandle camera) const
{
   std::shared_ptr<Exposable> exposable =
      registry_.GetCapability<Exposable>(camera);
   Time exposure;
   int ret = exposable->GetExposureTime(exposure);
   ThrowIfError(ret, camera, "Cannot get exposure time");
   return exposure;
}


Time
TimingOracle::GetInterExposureGap(ResourceHandle camera) const
{
   std::shared_ptr<Exposable> exposable =
      registry_.GetCapability<Exposable>(camera);
   Time gap;
   int ret = exposable->GetTimeBetweenExposures(gap);
   ThrowIfError(ret, camera, "Cannot get time between exposures");
   return gap;
}


Time
TimingOracle::GetResetTime(ResourceHandle camera) const
{
   std::shared_ptr<Exposable> exposable =
      registry_.GetCapability<Exposable>(camera);
   Time reset;
   int ret = exposable->GetResetTime(reset);
   ThrowIfError(ret, camera, "Cannot get reset time");
   return reset;
}


bool
TimingOracle::IsCameraReady(ResourceHandle camera) const
{
   return registry_.GetCapability<Exposable>(camera)->IsReadyToExpose();
}


Time
TimingOracle::GetAnalogSettlingTime(ResourceHandle client) const
{
   std::shared_ptr<AnalogSettable> settable =
      registry_.GetCapability<AnalogSettable>(client);
   Time settle;
   int ret = settable->GetAnalogSettlingTime(settle);
   ThrowIfError(ret, client, "Cannot get analog settling time");
   return settle;
}


Time
TimingOracle::GetBusyDuration(ResourceHandle target,
      const ActionPayload& payload) const
{
   switch (payload.GetKind())
   {
      case ActionKind::SetDigital:
      {
         std::shared_ptr<Triggerable> triggerable =
            std::dynamic_pointer_cast<Triggerable>(
                  registry_.GetResource(target));
         if (!triggerable)
            return Time::Zero();
         Time busy;
         int ret = triggerable->GetDigitalBusyTime(
               payload.GetDigitalState(), busy);
         ThrowIfError(ret, target, "Cannot get digital busy time");
         return busy;
      }
      case ActionKind::MoveAbsolute:
      case ActionKind::MoveRelative:
         if (!registry_.HasCapability<Positionable>(target))
            return Time::Zero();
         return GetStageSettlingTime(target);
      case ActionKind::SetAnalog:
      case ActionKind::Custom:
         if (!registry_.HasCapability<AnalogSettable>(target))
            return Time::Zero();
         return GetAnalogSettlingTime(target);
   }
   return Time::Zero();
}

} // namespace simseq
