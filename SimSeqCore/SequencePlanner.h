///////////////////////////////////////////////////////////////////////////////
// FILE:          SequencePlanner.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Converts an experiment plan into an action table
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

#include "ActionTable.h"
#include "DeviceRegistry.h"
#include "ExperimentPlan.h"
#include "PatternClientRegistry.h"
#include "TimingOracle.h"
#include "Logging/Logger.h"

#include <map>
#include <string>
#include <vector>

namespace simseq {

struct PlannerSettings
{
   // Added after every exposure so pattern generators can latch before the
   // next trigger
   Time interTriggerDelay = Time::FromMs(5);
   // Re-command the slice position after each burst of exposures
   bool holdPositionAfterBurst = true;
};


/**
 * Builds the action table for one experiment.
 *
 * A planner is used for exactly one Generate() call; the image counts and
 * metadata it collects describe that run. Planning is deterministic: two
 * planners given the same plan and resources produce identical tables.
 */
class SequencePlanner
{
public:
   SequencePlanner(const DeviceRegistry& registry,
         const PatternClientRegistry& clients,
         const TimingOracle& oracle,
         logging::Logger logger,
         const PlannerSettings& settings = PlannerSettings());

   SequencePlanner(const SequencePlanner&) = delete;
   SequencePlanner& operator=(const SequencePlanner&) = delete;

   /**
    * Plan the experiment and return the sealed table.
    *
    * The table's GetDuration() is the repetition period: the final hold
    * time, max(end of the return move + its settle time, time at which
    * every camera is free). With a Z positioner the hold is also emitted
    * as a MoveAbsolute to the start position; without one no entry
    * carries it and the duration is the only place it appears.
    *
    * Errors abort the whole run; no partial table is returned.
    * - SIMSEQERR_ConfigurationError: invalid plan, a resource lacking a
    *   capability, a timing query that could not be answered, or timing
    *   values so large that the schedule overflows (the original error is
    *   chained).
    * - SIMSEQERR_OutOfOrder: planner bug; logged at fatal level.
    * - SIMSEQERR_PlannerReused: Generate() was already called.
    */
   ActionTable Generate(const ExperimentPlan& plan);

   /**
    * Trigger all lights and cameras at cursor and return the time at which
    * the exposure is over and every camera has become free.
    */
   Time Expose(Time cursor, const std::vector<ResourceHandle>& cameras,
         const std::vector<ResourceHandle>& lights, ActionTable& table);

   // Frames scheduled for acquisition, per camera
   long GetImageCount(ResourceHandle camera) const;
   // Frames triggered only to arm a camera that was not ready
   long GetDiscardedImageCount(ResourceHandle camera) const;

   // "SLM diff_angle <deg>" when a driven modulator reports one, else empty
   const std::string& GetExperimentMetadata() const { return metadata_; }

   const PlannerSettings& GetSettings() const { return settings_; }

private:
   struct DrivenClient
   {
      ResourceHandle handle;
      AnalogDriveMode mode;
   };

   std::vector<DrivenClient> ResolveResources(const ExperimentPlan& plan);
   ActionTable GenerateTable(const ExperimentPlan& plan,
         const std::vector<DrivenClient>& clients);
   Time ResetCameras(const std::vector<ResourceHandle>& cameras,
         ActionTable& table);
   ActionPayload ClientPayload(const DrivenClient& client,
         const PatternStep& step, long stepIndex) const;
   void AppendAction(ActionTable& table, Time t, ResourceHandle target,
         const ActionPayload& payload);

   const DeviceRegistry& registry_;
   const PatternClientRegistry& clients_;
   const TimingOracle& oracle_;
   logging::Logger logger_;
   PlannerSettings settings_;

   bool used_;
   std::map<ResourceHandle, long> imageCounts_;
   std::map<ResourceHandle, long> discardedCounts_;
   std::string metadata_;
};

} // namespace simseq
