///////////////////////////////////////////////////////////////////////////////
// FILE:          PlanConfig.cpp
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

#include "PlanConfig.h"

#include "CoreUtils.h"
#include "Error.h"
#include "LogManager.h"

#include "../SimSeqDevice/ConfiguredDevices.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace simseq {

namespace {

using json = nlohmann::json;

SeqError InvalidConfig(const std::string& msg)
{
   return SeqError(msg, SIMSEQERR_InvalidConfigFile);
}

SeqError BadValue(const std::string& msg)
{
   return SeqError(msg, SIMSEQERR_ConfigurationError);
}

const json& RequireMember(const json& obj, const char* key,
      const std::string& where)
{
   json::const_iterator it = obj.find(key);
   if (it == obj.end())
      throw InvalidConfig("Missing required field " + ToQuotedString(key) +
            " in " + where);
   return *it;
}

const json* FindMember(const json& obj, const char* key)
{
   json::const_iterator it = obj.find(key);
   if (it == obj.end() || it->is_null())
      return nullptr;
   return &*it;
}

void RequireObject(const json& value, const std::string& what)
{
   if (!value.is_object())
      throw InvalidConfig(what + " must be a JSON object");
}

double ReadNumber(const json& value, const std::string& what)
{
   if (!value.is_number())
      throw InvalidConfig(what + " must be a number");
   return value.get<double>();
}

int ReadInt(const json& value, const std::string& what)
{
   if (!value.is_number_integer())
      throw InvalidConfig(what + " must be an integer");
   long long v;
   if (value.is_number_unsigned())
   {
      const unsigned long long u = value.get<unsigned long long>();
      if (u > static_cast<unsigned long long>(std::numeric_limits<int>::max()))
         throw BadValue(what + " is out of range (" + value.dump() + ")");
      v = static_cast<long long>(u);
   }
   else
      v = value.get<long long>();
   if (v < std::numeric_limits<int>::min() ||
         v > std::numeric_limits<int>::max())
      throw BadValue(what + " is out of range (" + value.dump() + ")");
   return static_cast<int>(v);
}

bool ReadBool(const json& value, const std::string& what)
{
   if (!value.is_boolean())
      throw InvalidConfig(what + " must be true or false");
   return value.get<bool>();
}

std::string ReadString(const json& value, const std::string& what)
{
   if (!value.is_string())
      throw InvalidConfig(what + " must be a string");
   return value.get<std::string>();
}

// Milliseconds, as a JSON number or an exact decimal string ("12.125")
Time ReadTime(const json& value, const std::string& what)
{
   if (!value.is_string() && !value.is_number())
      throw InvalidConfig(what + " must be a number of milliseconds");
   try
   {
      if (value.is_string())
         return Time::Parse(value.get<std::string>());
      return Time::FromMsRounded(value.get<double>());
   }
   catch (const std::invalid_argument& e)
   {
      throw BadValue(what + ": " + e.what());
   }
}

std::vector<std::string> ReadStringList(const json& value,
      const std::string& what)
{
   if (!value.is_array())
      throw InvalidConfig(what + " must be a list of strings");
   std::vector<std::string> result;
   for (const json& item : value)
      result.push_back(ReadString(item, "Each entry of " + what));
   return result;
}

AnalogDriveMode ParseDriveMode(const std::string& name,
      const std::string& where)
{
   if (name == g_Keyword::DriveIndex)
      return DriveSequenceIndex;
   if (name == g_Keyword::DriveAngle)
      return DriveAngle;
   if (name == g_Keyword::DrivePhase)
      return DrivePhase;
   throw BadValue("Unknown drive mode " + ToQuotedString(name) + " for " +
         where);
}


std::shared_ptr<Resource> MakeCamera(const std::string& label, const json& d,
      const std::string& where)
{
   std::shared_ptr<ConfiguredCamera> camera =
      std::make_shared<ConfiguredCamera>(label);
   // Missing exposure or readout is reported when the plan needs it
   if (const json* v = FindMember(d, "exposureMs"))
      camera->SetExposureTime(ReadTime(*v, "exposureMs of " + where));
   if (const json* v = FindMember(d, "readoutMs"))
      camera->SetTimeBetweenExposures(ReadTime(*v, "readoutMs of " + where));
   if (const json* v = FindMember(d, "resetMs"))
      camera->SetResetTime(ReadTime(*v, "resetMs of " + where));
   if (const json* v = FindMember(d, "ready"))
      camera->SetReadyToExpose(ReadBool(*v, "ready of " + where));
   return camera;
}

std::shared_ptr<Resource> MakeLight(const std::string& label, const json& d,
      const std::string& where)
{
   double wavelength = 0.0;
   if (const json* v = FindMember(d, "wavelength"))
      wavelength = ReadNumber(*v, "wavelength of " + where);
   return std::make_shared<ConfiguredLight>(label, wavelength);
}

std::shared_ptr<Resource> MakeStage(const std::string& label, const json& d,
      const std::string& where)
{
   const double unitsPerMicron = ReadNumber(
         RequireMember(d, "unitsPerMicron", where),
         "unitsPerMicron of " + where);
   if (!(unitsPerMicron > 0.0))
      throw BadValue("unitsPerMicron of " + where + " must be positive");

   std::shared_ptr<ConfiguredStageAxis> stage =
      std::make_shared<ConfiguredStageAxis>(label, unitsPerMicron);
   if (const json* v = FindMember(d, "velocity"))
      stage->SetVelocity(ReadNumber(*v, "velocity of " + where));
   if (const json* v = FindMember(d, "settlingTimeMs"))
      stage->SetSettlingTime(ReadTime(*v, "settlingTimeMs of " + where));
   if (const json* v = FindMember(d, "reportedVelocity"))
      stage->SetReportedVelocity(ReadNumber(*v,
               "reportedVelocity of " + where));
   return stage;
}

std::shared_ptr<Resource> MakeModulator(const std::string& label,
      const json& d, const std::string& where)
{
   AnalogDriveMode mode = DriveSequenceIndex;
   if (const json* v = FindMember(d, "drive"))
      mode = ParseDriveMode(ReadString(*v, "drive of " + where), where);

   std::shared_ptr<ConfiguredModulator> modulator =
      std::make_shared<ConfiguredModulator>(label, mode);
   if (const json* v = FindMember(d, "settlingTimeMs"))
      modulator->SetSettlingTime(ReadTime(*v, "settlingTimeMs of " + where));
   if (const json* v = FindMember(d, "diffractionAngle"))
      modulator->SetDiffractionAngle(ReadNumber(*v,
               "diffractionAngle of " + where));
   return modulator;
}


void LoadDevices(const json& devices, PlanContext& context,
      logging::Logger& logger)
{
   if (!devices.is_array())
      throw InvalidConfig("\"devices\" must be a list");

   for (std::size_t i = 0; i < devices.size(); ++i)
   {
      const json& d = devices[i];
      const std::string where = "device #" + std::to_string(i);
      RequireObject(d, where);

      const std::string label = ReadString(RequireMember(d, "label", where),
            "label of " + where);
      const std::string type = ReadString(RequireMember(d, "type", where),
            "type of " + where);
      const std::string desc = "device " + ToQuotedString(label);

      std::shared_ptr<Resource> resource;
      if (type == g_Keyword::Camera)
         resource = MakeCamera(label, d, desc);
      else if (type == g_Keyword::Light)
         resource = MakeLight(label, d, desc);
      else if (type == g_Keyword::Stage)
         resource = MakeStage(label, d, desc);
      else if (type == g_Keyword::Modulator)
         resource = MakeModulator(label, d, desc);
      else
         throw BadValue("Unknown device type " + ToQuotedString(type) +
               " for " + desc);

      try
      {
         context.registry.Register(resource);
      }
      catch (const SeqError& e)
      {
         throw SeqError("Cannot register " + desc,
               SIMSEQERR_ConfigurationError, e);
      }
      LOG_DEBUG(logger) << "Registered " << type << " " <<
         ToQuotedString(label);
   }
}


ResourceHandle LookUp(const PlanContext& context, const std::string& label,
      const std::string& where)
{
   try
   {
      return context.registry.GetHandle(label);
   }
   catch (const SeqError& e)
   {
      throw SeqError("Unknown device " + ToQuotedString(label) + " in " +
            where, SIMSEQERR_ConfigurationError, e);
   }
}


void LoadPatternGroups(const json& groups, PlanContext& context,
      logging::Logger& logger)
{
   RequireObject(groups, "\"patternGroups\"");
   for (json::const_iterator it = groups.begin(); it != groups.end(); ++it)
   {
      const std::string where = "pattern group " + ToQuotedString(it.key());
      for (const std::string& label : ReadStringList(it.value(), where))
      {
         context.patternClients.Attach(it.key(),
               LookUp(context, label, where));
         LOG_DEBUG(logger) << "Attached " << ToQuotedString(label) <<
            " to " << where;
      }
   }
}


void LoadExperiment(const json& e, PlanContext& context)
{
   const std::string where = "\"experiment\"";
   RequireObject(e, where);
   ExperimentPlan& plan = context.plan;

   const int numAngles = ReadInt(RequireMember(e, "numAngles", where),
         "numAngles");
   const int numPhases = ReadInt(RequireMember(e, "numPhases", where),
         "numPhases");
   double wavelength = 0.0;
   if (const json* v = FindMember(e, "wavelength"))
      wavelength = ReadNumber(*v, "wavelength");
   plan.sequence = BuildSimSequence(numAngles, numPhases, wavelength);

   if (const json* v = FindMember(e, "zStart"))
      plan.zStart = ReadNumber(*v, "zStart");
   if (const json* v = FindMember(e, "zHeight"))
      plan.zHeight = ReadNumber(*v, "zHeight");
   if (const json* v = FindMember(e, "sliceHeight"))
      plan.sliceHeight = ReadNumber(*v, "sliceHeight");
   if (const json* v = FindMember(e, "numReps"))
      plan.numReps = ReadInt(*v, "numReps");

   if (const json* v = FindMember(e, "cameras"))
   {
      for (const std::string& label : ReadStringList(*v, "cameras"))
         plan.cameras.push_back(LookUp(context, label, "cameras"));
   }
   if (const json* v = FindMember(e, "lights"))
   {
      for (const std::string& label : ReadStringList(*v, "lights"))
         plan.lights.push_back(LookUp(context, label, "lights"));
   }
   if (const json* v = FindMember(e, "zPositioner"))
      plan.zPositioner = LookUp(context, ReadString(*v, "zPositioner"),
            "zPositioner");

   // Without an explicit list, every configured group is driven
   if (const json* v = FindMember(e, "patternGroups"))
      plan.patternGroups = ReadStringList(*v, "patternGroups");
   else
      plan.patternGroups = context.patternClients.GetGroupNames();

   plan.Validate();
}


void LoadPlannerSettings(const json& p, PlannerSettings& settings)
{
   RequireObject(p, "\"planner\"");
   if (const json* v = FindMember(p, "interTriggerDelayMs"))
      settings.interTriggerDelay = ReadTime(*v, "interTriggerDelayMs");
   if (const json* v = FindMember(p, "holdPositionAfterBurst"))
      settings.holdPositionAfterBurst = ReadBool(*v, "holdPositionAfterBurst");
}


void LoadLoggingSettings(const json& l, LoggingSettings& settings)
{
   RequireObject(l, "\"logging\"");
   if (const json* v = FindMember(l, "level"))
      settings.level = LogLevelFromString(ReadString(*v, "logging level"));
   if (const json* v = FindMember(l, "stderr"))
      settings.useStdErr = ReadBool(*v, "logging stderr");
   if (const json* v = FindMember(l, "file"))
      settings.filename = ReadString(*v, "logging file");
}

} // anonymous namespace


std::unique_ptr<PlanContext>
ParsePlanConfig(const std::string& jsonText, logging::Logger logger)
{
   json doc;
   try
   {
      doc = json::parse(jsonText);
   }
   catch (const json::parse_error& e)
   {
      throw InvalidConfig(std::string("Malformed configuration: ") + e.what());
   }
   RequireObject(doc, "The configuration document");

   std::unique_ptr<PlanContext> context(new PlanContext());

   // Logging settings first, so that a bad level is reported even when the
   // rest of the document is also wrong
   if (const json* v = FindMember(doc, "logging"))
      LoadLoggingSettings(*v, context->loggingSettings);

   LoadDevices(RequireMember(doc, "devices", "the configuration"), *context,
         logger);
   if (const json* v = FindMember(doc, "patternGroups"))
      LoadPatternGroups(*v, *context, logger);
   LoadExperiment(RequireMember(doc, "experiment", "the configuration"),
         *context);
   if (const json* v = FindMember(doc, "planner"))
      LoadPlannerSettings(*v, context->plannerSettings);

   LOG_INFO(logger) << "Loaded configuration with " <<
      context->registry.Size() << " device(s), " <<
      context->plan.sequence.size() << " pattern step(s), " <<
      context->plan.SliceCount() << " Z slice(s)";
   return context;
}


std::unique_ptr<PlanContext>
LoadPlanConfig(const std::string& path, logging::Logger logger)
{
   std::ifstream ifs(path.c_str());
   if (!ifs)
      throw SeqError("Cannot open file " + ToQuotedString(path),
            SIMSEQERR_CannotOpenFile);

   std::ostringstream contents;
   contents << ifs.rdbuf();

   LOG_INFO(logger) << "Reading configuration from " << path;
   try
   {
      return ParsePlanConfig(contents.str(), logger);
   }
   catch (const SeqError& e)
   {
      throw SeqError("Cannot load configuration file " + ToQuotedString(path),
            e);
   }
}

} // namespace simseq
