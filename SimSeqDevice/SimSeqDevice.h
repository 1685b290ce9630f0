///////////////////////////////////////////////////////////////////////////////
// FILE:          SimSeqDevice.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqDevice - Device descriptor kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Resource descriptor interfaces. Each controllable device
//                taking part in a schedule is a Resource that implements one
//                or more capability interfaces. The planner only ever talks
//                to descriptors; no call here touches hardware.
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

#include "SimSeqDeviceConstants.h"
#include "SimSeqTime.h"

#include <string>

namespace simseq {

   /**
    * Generic resource interface.
    *
    * Timing queries return SIMSEQ_OK or an error code and deliver their
    * result through an out-parameter, as device adapters do.
    */
   class Resource {
   public:
      explicit Resource(const std::string& label) : label_(label) {}
      virtual ~Resource() {}

      Resource(const Resource&) = delete;
      Resource& operator=(const Resource&) = delete;

      const std::string& GetLabel() const { return label_; }

      virtual ResourceType GetType() const = 0;

      /**
       * Validate configured parameters. Called once by the registry.
       */
      virtual int Initialize() { return SIMSEQ_OK; }

   private:
      const std::string label_;
   };


   /**
    * Digital on/off line (light source enable, camera trigger input).
    */
   class Triggerable {
   public:
      virtual ~Triggerable() {}

      /**
       * How long after a digital command the resource stays busy.
       * Instantaneous by default.
       */
      virtual int GetDigitalBusyTime(bool state, Time& busy) const
      {
         (void)state;
         busy = Time::Zero();
         return SIMSEQ_OK;
      }
   };


   /**
    * Camera-like resource: triggered, then busy for exposure + readout.
    */
   class Exposable : public Triggerable {
   public:
      /**
       * Exposure duration as currently configured on the device.
       */
      virtual int GetExposureTime(Time& exposure) const = 0;
      /**
       * Minimum gap between the end of one exposure and the next trigger.
       * Must be read after the exposure has been set, since readout on many
       * sensors depends on it.
       */
      virtual int GetTimeBetweenExposures(Time& gap) const = 0;
      /**
       * Time needed to arm the camera when it is not ready.
       */
      virtual int GetResetTime(Time& reset) const = 0;
      /**
       * Whether the camera is already armed to accept a trigger.
       */
      virtual bool IsReadyToExpose() const = 0;

      int GetDigitalBusyTime(bool state, Time& busy) const override
      {
         if (!state)
         {
            busy = Time::Zero();
            return SIMSEQ_OK;
         }
         Time exposure, gap;
         int ret = GetExposureTime(exposure);
         if (ret != SIMSEQ_OK)
            return ret;
         ret = GetTimeBetweenExposures(gap);
         if (ret != SIMSEQ_OK)
            return ret;
         busy = exposure + gap;
         return SIMSEQ_OK;
      }
   };


   /**
    * Single positioning axis (typically the Z drive).
    */
   class Positionable {
   public:
      virtual ~Positionable() {}

      /**
       * Estimated motion and settling times for a move between two
       * positions (in microns). Pure function of configured parameters.
       */
      virtual int GetMovementTime(double fromUm, double toUm,
            Time& moveTime, Time& settleTime) const = 0;
      virtual int GetSettlingTime(Time& settleTime) const = 0;
   };


   /**
    * Resource driven by a scalar setpoint, e.g. a spatial light modulator
    * or a polarization rotor.
    */
   class AnalogSettable {
   public:
      virtual ~AnalogSettable() {}

      virtual int GetAnalogSettlingTime(Time& settleTime) const = 0;
      virtual AnalogDriveMode GetDriveMode() const = 0;
      /**
       * Diffraction angle for experiment metadata; false when the device
       * has none.
       */
      virtual bool GetDiffractionAngle(double& angle) const
      {
         (void)angle;
         return false;
      }
   };

} // namespace simseq
