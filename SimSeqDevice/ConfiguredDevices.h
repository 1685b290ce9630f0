///////////////////////////////////////////////////////////////////////////////
// FILE:          ConfiguredDevices.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqDevice - Device descriptor kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Resource descriptors whose timing comes from configuration
//                values rather than from a live device
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

#include "SimSeqDevice.h"

#include <string>

namespace simseq {

/**
 * Camera whose exposure, readout gap and reset time are set explicitly.
 *
 * Timing values that have not been set are reported as
 * SIMSEQ_TIMING_UNAVAILABLE. The reset time defaults to exposure + gap.
 */
class ConfiguredCamera : public Resource, public Exposable
{
public:
   explicit ConfiguredCamera(const std::string& label);

   ResourceType GetType() const override { return CameraResource; }

   void SetExposureTime(Time exposure);
   void SetTimeBetweenExposures(Time gap);
   void SetResetTime(Time reset);
   void SetReadyToExpose(bool ready) { ready_ = ready; }

   int GetExposureTime(Time& exposure) const override;
   int GetTimeBetweenExposures(Time& gap) const override;
   int GetResetTime(Time& reset) const override;
   bool IsReadyToExpose() const override { return ready_; }

private:
   Time exposure_;
   Time gap_;
   Time reset_;
   bool hasExposure_;
   bool hasGap_;
   bool hasReset_;
   bool ready_;
};


class ConfiguredLight : public Resource, public Triggerable
{
public:
   explicit ConfiguredLight(const std::string& label,
         double wavelengthNm = 0.0) :
      Resource(label),
      wavelengthNm_(wavelengthNm)
   {}

   ResourceType GetType() const override { return LightResource; }

   double GetWavelength() const { return wavelengthNm_; }

private:
   double wavelengthNm_;
};


/**
 * Stage axis with a constant-velocity motion model.
 *
 * moveTime = |to - from| / velocity, with velocity in um/s and the result in
 * ms. A velocity reported by the device, when known, takes precedence over
 * the configured one.
 */
class ConfiguredStageAxis : public Resource, public Positionable
{
public:
   static const double DefaultVelocityUmPerSec;
   static const double DefaultSettlingTimeMs;

   ConfiguredStageAxis(const std::string& label, double unitsPerMicron);

   ResourceType GetType() const override { return StageResource; }

   // Fails with SIMSEQ_INVALID_PARAMETER unless units-per-micron and
   // velocity are positive
   int Initialize() override;

   void SetVelocity(double umPerSec) { velocity_ = umPerSec; }
   void SetSettlingTime(Time settle) { settle_ = settle; }
   void SetReportedVelocity(double umPerSec);
   void ClearReportedVelocity() { hasReportedVelocity_ = false; }

   double GetUnitsPerMicron() const { return unitsPerMicron_; }
   double GetEffectiveVelocity() const;

   int GetMovementTime(double fromUm, double toUm,
         Time& moveTime, Time& settleTime) const override;
   int GetSettlingTime(Time& settleTime) const override;

private:
   double unitsPerMicron_;
   double velocity_;
   double reportedVelocity_;
   bool hasReportedVelocity_;
   Time settle_;
};


class ConfiguredModulator : public Resource, public AnalogSettable
{
public:
   static const double DefaultSettlingTimeMs;

   explicit ConfiguredModulator(const std::string& label,
         AnalogDriveMode mode = DriveSequenceIndex);

   ResourceType GetType() const override { return ModulatorResource; }

   void SetSettlingTime(Time settle) { settle_ = settle; }
   void SetDiffractionAngle(double angle);

   int GetAnalogSettlingTime(Time& settleTime) const override;
   AnalogDriveMode GetDriveMode() const override { return mode_; }
   bool GetDiffractionAngle(double& angle) const override;

private:
   AnalogDriveMode mode_;
   Time settle_;
   double diffractionAngle_;
   bool hasDiffractionAngle_;
};

} // namespace simseq
