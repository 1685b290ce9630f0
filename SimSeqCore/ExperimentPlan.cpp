///////////////////////////////////////////////////////////////////////////////
// FILE:          ExperimentPlan.cpp
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

#include "ExperimentPlan.h"

#include "Error.h"

#include <cmath>

namespace simseq {

std::vector<PatternStep>
BuildSimSequence(int numAngles, int numPhases, double wavelength)
{
   if (numAngles < 1)
      throw SeqError("Number of angles must be at least 1 (got " +
            std::to_string(numAngles) + ")", SIMSEQERR_ConfigurationError);
   if (numPhases < 1)
      throw SeqError("Number of phases must be at least 1 (got " +
            std::to_string(numPhases) + ")", SIMSEQERR_ConfigurationError);

   std::vector<PatternStep> sequence;
   sequence.reserve(static_cast<std::size_t>(numAngles) * numPhases);
   for (int i = 0; i < numAngles; ++i)
   {
      for (int j = 0; j < numPhases; ++j)
      {
         PatternStep step;
         step.angle = i * 180.0 / numAngles;
         step.phase = j * 360.0 / numPhases;
         step.wavelength = wavelength;
         sequence.push_back(step);
      }
   }
   return sequence;
}


long
ExperimentPlan::NominalSliceCount() const
{
   if (zHeight <= ZHeightThreshold || !(sliceHeight > 0.0))
      return 1;
   // Tolerate quotients that land a hair above an integer
   long count = static_cast<long>(std::ceil(zHeight / sliceHeight - 1e-9));
   return count < 1 ? 1 : count;
}


long
ExperimentPlan::SliceCount() const
{
   long count = NominalSliceCount();
   if (zHeight > ZHeightThreshold)
      ++count;
   return count;
}


void
ExperimentPlan::Validate() const
{
   if (sequence.empty())
      throw SeqError("The pattern sequence is empty",
            SIMSEQERR_ConfigurationError);
   if (numReps < 1)
      throw SeqError("Number of repetitions must be at least 1 (got " +
            std::to_string(numReps) + ")", SIMSEQERR_ConfigurationError);
   if (!(zHeight >= 0.0) || !std::isfinite(zHeight))
      throw SeqError("Z height must be a non-negative number",
            SIMSEQERR_ConfigurationError);
   if (zHeight > ZHeightThreshold && !(sliceHeight > 0.0))
      throw SeqError("Slice height must be positive for a 3D experiment",
            SIMSEQERR_ConfigurationError);
   if (!std::isfinite(zStart) || !std::isfinite(sliceHeight))
      throw SeqError("Z start and slice height must be finite",
            SIMSEQERR_ConfigurationError);
}

} // namespace simseq
