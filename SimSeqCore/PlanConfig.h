///////////////////////////////////////////////////////////////////////////////
// FILE:          PlanConfig.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Loading of an experiment run from a JSON document
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

#include "DeviceRegistry.h"
#include "ExperimentPlan.h"
#include "PatternClientRegistry.h"
#include "SequencePlanner.h"
#include "Logging/Logger.h"
#include "Logging/Metadata.h"

#include <memory>
#include <string>

namespace simseq {

struct LoggingSettings
{
   logging::LogLevel level = logging::LogLevelInfo;
   bool useStdErr = true;
   std::string filename; // empty for no log file
};


/**
 * Everything one run needs: the resources, the pattern-client attachments,
 * the plan referring to them and the planner and logging settings.
 */
struct PlanContext
{
   DeviceRegistry registry;
   PatternClientRegistry patternClients;
   ExperimentPlan plan;
   PlannerSettings plannerSettings;
   LoggingSettings loggingSettings;
};


/**
 * Build a PlanContext from a JSON document.
 *
 * Malformed JSON, a missing required field or a field of the wrong JSON type
 * raises SeqError with SIMSEQERR_InvalidConfigFile; values that are
 * well-formed but unusable (unknown device type or label, negative times,
 * non-positive units-per-micron, ...) raise SIMSEQERR_ConfigurationError.
 */
std::unique_ptr<PlanContext> ParsePlanConfig(const std::string& jsonText,
      logging::Logger logger = logging::Logger());

/**
 * As ParsePlanConfig(), reading the document from a file. Throws
 * SIMSEQERR_CannotOpenFile if the file cannot be read.
 */
std::unique_ptr<PlanContext> LoadPlanConfig(const std::string& path,
      logging::Logger logger = logging::Logger());

} // namespace simseq
