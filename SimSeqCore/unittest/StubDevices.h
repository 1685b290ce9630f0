// Resource stubs with public fields for use in SimSeqCore unit tests. Each
// stub implements one capability set with fixed, directly settable timing and
// status codes.

#pragma once

#include "SimSeqDevice.h"

#include <string>
#include <utility>
#include <vector>

struct StubCamera : simseq::Resource, simseq::Exposable {
   simseq::Time exposure = simseq::Time::FromMs(50);
   simseq::Time gap = simseq::Time::FromMs(10);
   simseq::Time reset = simseq::Time::FromMs(60);
   bool ready = true;
   int exposureStatus = SIMSEQ_OK;
   int gapStatus = SIMSEQ_OK;
   int initStatus = SIMSEQ_OK;
   mutable int exposureQueries = 0;

   explicit StubCamera(const std::string& label) : simseq::Resource(label) {}

   simseq::ResourceType GetType() const override {
      return simseq::CameraResource;
   }
   int Initialize() override { return initStatus; }

   int GetExposureTime(simseq::Time& e) const override {
      ++exposureQueries;
      if (exposureStatus != SIMSEQ_OK)
         return exposureStatus;
      e = exposure;
      return SIMSEQ_OK;
   }
   int GetTimeBetweenExposures(simseq::Time& g) const override {
      if (gapStatus != SIMSEQ_OK)
         return gapStatus;
      g = gap;
      return SIMSEQ_OK;
   }
   int GetResetTime(simseq::Time& r) const override {
      r = reset;
      return SIMSEQ_OK;
   }
   bool IsReadyToExpose() const override { return ready; }
};

struct StubLight : simseq::Resource, simseq::Triggerable {
   explicit StubLight(const std::string& label) : simseq::Resource(label) {}

   simseq::ResourceType GetType() const override {
      return simseq::LightResource;
   }
};

// Reports the same motion estimate for every move
struct StubStage : simseq::Resource, simseq::Positionable {
   simseq::Time moveTime = simseq::Time::FromMs(20);
   simseq::Time settleTime = simseq::Time::FromMs(5);
   int movementStatus = SIMSEQ_OK;
   mutable std::vector<std::pair<double, double>> moves;

   explicit StubStage(const std::string& label) : simseq::Resource(label) {}

   simseq::ResourceType GetType() const override {
      return simseq::StageResource;
   }

   int GetMovementTime(double from, double to,
         simseq::Time& move, simseq::Time& settle) const override {
      moves.push_back(std::make_pair(from, to));
      if (movementStatus != SIMSEQ_OK)
         return movementStatus;
      move = moveTime;
      settle = settleTime;
      return SIMSEQ_OK;
   }
   int GetSettlingTime(simseq::Time& settle) const override {
      settle = settleTime;
      return SIMSEQ_OK;
   }
};

struct StubModulator : simseq::Resource, simseq::AnalogSettable {
   simseq::Time settleTime = simseq::Time::FromMs(10);
   simseq::AnalogDriveMode mode = simseq::DriveSequenceIndex;
   bool hasDiffractionAngle = false;
   double diffractionAngle = 0.0;

   explicit StubModulator(const std::string& label) :
      simseq::Resource(label) {}

   simseq::ResourceType GetType() const override {
      return simseq::ModulatorResource;
   }

   int GetAnalogSettlingTime(simseq::Time& settle) const override {
      settle = settleTime;
      return SIMSEQ_OK;
   }
   simseq::AnalogDriveMode GetDriveMode() const override { return mode; }
   bool GetDiffractionAngle(double& angle) const override {
      if (!hasDiffractionAngle)
         return false;
      angle = diffractionAngle;
      return true;
   }
};

// No capabilities at all
struct StubBareResource : simseq::Resource {
   explicit StubBareResource(const std::string& label) :
      simseq::Resource(label) {}

   simseq::ResourceType GetType() const override {
      return simseq::UnknownResource;
   }
};
