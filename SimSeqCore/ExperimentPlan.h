///////////////////////////////////////////////////////////////////////////////
// FILE:          ExperimentPlan.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Declarative description of a structured-illumination run
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

#include "ResourceHandle.h"

#include <string>
#include <vector>

namespace simseq {

struct PatternStep
{
   double angle;      // degrees
   double phase;      // degrees
   double wavelength; // nm

   bool operator==(const PatternStep& rhs) const
   {
      return angle == rhs.angle && phase == rhs.phase &&
         wavelength == rhs.wavelength;
   }
};

/**
 * numAngles x numPhases steps, angle-major. Step (i, j) has angle
 * i * 180 / numAngles and phase j * 360 / numPhases.
 *
 * Throws SeqError (SIMSEQERR_ConfigurationError) unless both counts are at
 * least 1.
 */
std::vector<PatternStep> BuildSimSequence(int numAngles, int numPhases,
      double wavelength);


/**
 * Below this height (microns) an experiment is treated as 2D.
 */
const double ZHeightThreshold = 1e-6;


struct ExperimentPlan
{
   std::vector<PatternStep> sequence; // visited once per Z slice
   double zStart = 0.0;      // microns
   double zHeight = 0.0;     // microns
   double sliceHeight = 0.0; // microns
   int numReps = 1;

   std::vector<ResourceHandle> cameras;
   std::vector<ResourceHandle> lights;
   ResourceHandle zPositioner; // invalid when there is no stage
   std::vector<std::string> patternGroups; // driven in this order

   bool HasZPositioner() const { return zPositioner.IsValid(); }

   // max(1, ceil(zHeight / sliceHeight))
   long NominalSliceCount() const;
   // Nominal count, plus one for the top of the volume in 3D experiments
   long SliceCount() const;
   double SliceTarget(long zIndex) const
   { return zStart + sliceHeight * zIndex; }

   /**
    * Checks the parameters that do not depend on any resource. Throws
    * SeqError (SIMSEQERR_ConfigurationError).
    */
   void Validate() const;
};

} // namespace simseq
