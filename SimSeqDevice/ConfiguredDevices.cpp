///////////////////////////////////////////////////////////////////////////////
// FILE:          ConfiguredDevices.cpp
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqDevice - Device descriptor kit
//-----------------------------------------------------------------------------
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

#include "ConfiguredDevices.h"

#include <cmath>
#include <stdexcept>

namespace simseq {

ConfiguredCamera::ConfiguredCamera(const std::string& label) :
   Resource(label),
   hasExposure_(false),
   hasGap_(false),
   hasReset_(false),
   ready_(true)
{}

void ConfiguredCamera::SetExposureTime(Time exposure)
{
   exposure_ = exposure;
   hasExposure_ = true;
}

void ConfiguredCamera::SetTimeBetweenExposures(Time gap)
{
   gap_ = gap;
   hasGap_ = true;
}

void ConfiguredCamera::SetResetTime(Time reset)
{
   reset_ = reset;
   hasReset_ = true;
}

int ConfiguredCamera::GetExposureTime(Time& exposure) const
{
   if (!hasExposure_)
      return SIMSEQ_TIMING_UNAVAILABLE;
   exposure = exposure_;
   return SIMSEQ_OK;
}

int ConfiguredCamera::GetTimeBetweenExposures(Time& gap) const
{
   if (!hasGap_)
      return SIMSEQ_TIMING_UNAVAILABLE;
   gap = gap_;
   return SIMSEQ_OK;
}

int ConfiguredCamera::GetResetTime(Time& reset) const
{
   if (hasReset_)
   {
      reset = reset_;
      return SIMSEQ_OK;
   }
   // Arming takes one throwaway frame
   return GetDigitalBusyTime(true, reset);
}


const double ConfiguredStageAxis::DefaultVelocityUmPerSec = 1000.0;
const double ConfiguredStageAxis::DefaultSettlingTimeMs = 10.0;

ConfiguredStageAxis::ConfiguredStageAxis(const std::string& label,
      double unitsPerMicron) :
   Resource(label),
   unitsPerMicron_(unitsPerMicron),
   velocity_(DefaultVelocityUmPerSec),
   reportedVelocity_(0.0),
   hasReportedVelocity_(false),
   settle_(Time::FromMsRounded(DefaultSettlingTimeMs))
{}

int ConfiguredStageAxis::Initialize()
{
   if (!(unitsPerMicron_ > 0.0))
      return SIMSEQ_INVALID_PARAMETER;
   if (!(velocity_ > 0.0))
      return SIMSEQ_INVALID_PARAMETER;
   if (hasReportedVelocity_ && !(reportedVelocity_ > 0.0))
      return SIMSEQ_INVALID_PARAMETER;
   return SIMSEQ_OK;
}

void ConfiguredStageAxis::SetReportedVelocity(double umPerSec)
{
   reportedVelocity_ = umPerSec;
   hasReportedVelocity_ = true;
}

double ConfiguredStageAxis::GetEffectiveVelocity() const
{
   return hasReportedVelocity_ ? reportedVelocity_ : velocity_;
}

int ConfiguredStageAxis::GetMovementTime(double fromUm, double toUm,
      Time& moveTime, Time& settleTime) const
{
   const double velocity = GetEffectiveVelocity();
   if (!(velocity > 0.0))
      return SIMSEQ_TIMING_UNAVAILABLE;
   const double distance = std::fabs(toUm - fromUm);
   if (!std::isfinite(distance))
      return SIMSEQ_INVALID_PARAMETER;
   try
   {
      moveTime = Time::FromMsRounded(distance / velocity * 1000.0);
   }
   catch (const std::invalid_argument&)
   {
      return SIMSEQ_INVALID_PARAMETER; // move too long to represent
   }
   settleTime = settle_;
   return SIMSEQ_OK;
}

int ConfiguredStageAxis::GetSettlingTime(Time& settleTime) const
{
   settleTime = settle_;
   return SIMSEQ_OK;
}


const double ConfiguredModulator::DefaultSettlingTimeMs = 10.0;

ConfiguredModulator::ConfiguredModulator(const std::string& label,
      AnalogDriveMode mode) :
   Resource(label),
   mode_(mode),
   settle_(Time::FromMsRounded(DefaultSettlingTimeMs)),
   diffractionAngle_(0.0),
   hasDiffractionAngle_(false)
{}

void ConfiguredModulator::SetDiffractionAngle(double angle)
{
   diffractionAngle_ = angle;
   hasDiffractionAngle_ = true;
}

int ConfiguredModulator::GetAnalogSettlingTime(Time& settleTime) const
{
   settleTime = settle_;
   return SIMSEQ_OK;
}

bool ConfiguredModulator::GetDiffractionAngle(double& angle) const
{
   if (!hasDiffractionAngle_)
      return false;
   angle = diffractionAngle_;
   return true;
}

} // namespace simseq
