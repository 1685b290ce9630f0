///////////////////////////////////////////////////////////////////////////////
// FILE:          SequencePlanner.cpp
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

#include "SequencePlanner.h"

#include "CoreUtils.h"
#include "Error.h"

#include <cstdio>

namespace simseq {

SequencePlanner::SequencePlanner(const DeviceRegistry& registry,
      const PatternClientRegistry& clients,
      const TimingOracle& oracle,
      logging::Logger logger,
      const PlannerSettings& settings) :
   registry_(registry),
   clients_(clients),
   oracle_(oracle),
   logger_(logger),
   settings_(settings),
   used_(false)
{}


ActionTable
SequencePlanner::Generate(const ExperimentPlan& plan)
{
   if (used_)
      throw SeqError("A sequence planner can only generate one table",
            SIMSEQERR_PlannerReused);
   used_ = true;

   try
   {
      plan.Validate();
      std::vector<DrivenClient> clients = ResolveResources(plan);
      return GenerateTable(plan, clients);
   }
   catch (const SeqError& e)
   {
      switch (e.GetCode())
      {
         case SIMSEQERR_UnavailableTiming:
            LOG_ERROR(logger_) << "Planning aborted: " << e.GetFullMsg();
            throw SeqError("Cannot plan experiment: a required timing "
                  "parameter is unavailable", SIMSEQERR_ConfigurationError, e);
         case SIMSEQERR_OutOfOrder:
            LOG_FATAL(logger_) << "Internal error while planning: " <<
               e.GetFullMsg();
            throw;
         default:
            LOG_ERROR(logger_) << "Planning aborted: " << e.GetFullMsg();
            throw;
      }
   }
   catch (const TimeUnderflow& e)
   {
      LOG_FATAL(logger_) << "Internal error while planning: " << e.what();
      throw SeqError(e.what(), SIMSEQERR_TimeUnderflow);
   }
   catch (const TimeOverflow& e)
   {
      LOG_ERROR(logger_) << "Planning aborted: " << e.what();
      throw SeqError("Cannot plan experiment: the schedule exceeds the "
            "representable time range", SIMSEQERR_ConfigurationError,
            SeqError(e.what(), SIMSEQERR_TimeOverflow));
   }
}


std::vector<SequencePlanner::DrivenClient>
SequencePlanner::ResolveResources(const ExperimentPlan& plan)
{
   std::vector<DrivenClient> driven;
   try
   {
      for (ResourceHandle camera : plan.cameras)
         registry_.GetCapability<Exposable>(camera);
      for (ResourceHandle light : plan.lights)
         registry_.GetCapability<Triggerable>(light);
      if (plan.HasZPositioner())
         registry_.GetCapability<Positionable>(plan.zPositioner);

      bool haveDiffractionAngle = false;
      for (const std::string& group : plan.patternGroups)
      {
         std::vector<ResourceHandle> groupClients = clients_.GetClients(group);
         if (groupClients.empty())
            LOG_DEBUG(logger_) << "No clients attached to pattern group " <<
               ToQuotedString(group);
         for (ResourceHandle handle : groupClients)
         {
            std::shared_ptr<AnalogSettable> settable =
               registry_.GetCapability<AnalogSettable>(handle);
            DrivenClient client;
            client.handle = handle;
            client.mode = settable->GetDriveMode();
            driven.push_back(client);

            double angle;
            if (!haveDiffractionAngle && settable->GetDiffractionAngle(angle))
            {
               char buf[64];
               std::snprintf(buf, sizeof(buf), "SLM diff_angle %.3f", angle);
               metadata_ = buf;
               haveDiffractionAngle = true;
            }
         }
      }
   }
   catch (const SeqError& e)
   {
      if (e.GetCode() == SIMSEQERR_UnavailableTiming)
         throw;
      throw SeqError("Invalid experiment plan", SIMSEQERR_ConfigurationError,
            e);
   }
   return driven;
}


ActionTable
SequencePlanner::GenerateTable(const ExperimentPlan& plan,
      const std::vector<DrivenClient>& clients)
{
   ActionTable table;
   const bool hasStage = plan.HasZPositioner();
   const long numSlices = plan.SliceCount();

   LOG_INFO(logger_) << "Planning " << numSlices << " Z slice(s) of " <<
      plan.sequence.size() << " step(s) with " << plan.cameras.size() <<
      " camera(s), " << plan.lights.size() << " light(s), " <<
      clients.size() << " pattern client(s)" <<
      (hasStage ? "" : ", no Z positioner");

   Time cursor = ResetCameras(plan.cameras, table);

   double prevAltitude = plan.zStart;
   for (long zIndex = 0; zIndex < numSlices; ++zIndex)
   {
      const double zTarget = plan.SliceTarget(zIndex);
      LOG_DEBUG(logger_) << "Slice " << zIndex << " at Z " << zTarget <<
         " starts at " << cursor.ToString() << " ms";

      if (hasStage)
      {
         // The stage is assumed to rest at the first target already
         MotionEstimate motion;
         if (zIndex > 0)
            motion = oracle_.GetMotionTime(plan.zPositioner,
                  prevAltitude, zTarget);
         AppendAction(table, cursor, plan.zPositioner,
               ActionPayload::Absolute(zTarget));
         cursor += motion.Total();
      }
      prevAltitude = zTarget;

      for (std::size_t i = 0; i < plan.sequence.size(); ++i)
      {
         for (const DrivenClient& client : clients)
            AppendAction(table, cursor, client.handle,
                  ClientPayload(client, plan.sequence[i],
                     static_cast<long>(i)));

         cursor = Expose(cursor, plan.cameras, plan.lights, table);
         cursor += settings_.interTriggerDelay;
      }

      if (hasStage && settings_.holdPositionAfterBurst)
         AppendAction(table, cursor, plan.zPositioner,
               ActionPayload::Absolute(zTarget));
   }

   // Return to the start for the next repetition
   Time returnSettle;
   if (hasStage)
   {
      MotionEstimate motion = oracle_.GetMotionTime(plan.zPositioner,
            prevAltitude, plan.zStart);
      // Unlike slice moves, the return is scheduled where the move ends
      cursor += motion.moveTime;
      AppendAction(table, cursor, plan.zPositioner,
            ActionPayload::Absolute(plan.zStart));
      returnSettle = motion.settleTime;
   }

   // Back-to-back repetitions must not start before every camera is free
   Time cameraReady;
   if (plan.numReps > 1)
   {
      for (ResourceHandle camera : plan.cameras)
         cameraReady = Time::Max(cameraReady,
               table.GetEarliestAvailable(camera));
   }

   const Time holdTime = Time::Max(cursor + returnSettle, cameraReady);
   if (hasStage)
      AppendAction(table, holdTime, plan.zPositioner,
            ActionPayload::Absolute(plan.zStart));
   table.ExtendDuration(holdTime);

   table.Seal();

   LOG_INFO(logger_) << "Planned " << table.Size() << " action(s); "
      "repetition period " << table.GetDuration().ToString() << " ms";
   return table;
}


Time
SequencePlanner::ResetCameras(const std::vector<ResourceHandle>& cameras,
      ActionTable& table)
{
   Time cursor;
   for (ResourceHandle camera : cameras)
   {
      if (oracle_.IsCameraReady(camera))
         continue;

      LOG_DEBUG(logger_) << "Arming camera " <<
         ToQuotedString(registry_.GetLabel(camera));
      AppendAction(table, Time::Zero(), camera, ActionPayload::Digital(true));
      ++discardedCounts_[camera];

      const Time reset = oracle_.GetResetTime(camera);
      cursor = Time::Max(cursor,
            Time::Max(reset, table.GetEarliestAvailable(camera)));
   }
   return cursor;
}


Time
SequencePlanner::Expose(Time cursor, const std::vector<ResourceHandle>& cameras,
      const std::vector<ResourceHandle>& lights, ActionTable& table)
{
   Time acquisitionTime;
   Time lastReady;
   for (ResourceHandle camera : cameras)
   {
      const Time exposure = oracle_.GetExposureTime(camera);
      // Read after the exposure: readout may depend on it
      const Time gap = oracle_.GetInterExposureGap(camera);
      acquisitionTime = Time::Max(acquisitionTime, exposure + gap);
      lastReady = Time::Max(lastReady, table.GetEarliestAvailable(camera));
   }

   for (ResourceHandle light : lights)
      AppendAction(table, cursor, light, ActionPayload::Digital(true));

   for (ResourceHandle camera : cameras)
   {
      AppendAction(table, cursor, camera, ActionPayload::Digital(true));
      ++imageCounts_[camera];
   }

   return Time::Max(lastReady, cursor + acquisitionTime);
}


ActionPayload
SequencePlanner::ClientPayload(const DrivenClient& client,
      const PatternStep& step, long stepIndex) const
{
   switch (client.mode)
   {
      case DriveAngle:
         return ActionPayload::Analog(step.angle);
      case DrivePhase:
         return ActionPayload::Analog(step.phase);
      case DriveSequenceIndex:
      default:
         return ActionPayload::CustomIndex(stepIndex);
   }
}


void
SequencePlanner::AppendAction(ActionTable& table, Time t,
      ResourceHandle target, const ActionPayload& payload)
{
   const Time busy = oracle_.GetBusyDuration(target, payload);
   LOG_TRACE(logger_) << t.ToString() << " ms: " <<
      registry_.GetLabel(target) << " " << payload.ToString();
   table.Append(t, target, payload, busy);
}


long
SequencePlanner::GetImageCount(ResourceHandle camera) const
{
   std::map<ResourceHandle, long>::const_iterator it =
      imageCounts_.find(camera);
   return it == imageCounts_.end() ? 0 : it->second;
}


long
SequencePlanner::GetDiscardedImageCount(ResourceHandle camera) const
{
   std::map<ResourceHandle, long>::const_iterator it =
      discardedCounts_.find(camera);
   return it == discardedCounts_.end() ? 0 : it->second;
}

} // namespace simseq
