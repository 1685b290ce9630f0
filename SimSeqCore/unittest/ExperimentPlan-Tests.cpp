#include <catch2/catch_all.hpp>

#include "Error.h"
#include "ExperimentPlan.h"

using namespace simseq;

TEST_CASE("SIM sequence is angle-major", "[ExperimentPlan]")
{
   std::vector<PatternStep> seq = BuildSimSequence(3, 2, 488.0);
   REQUIRE(seq.size() == 6);

   CHECK(seq[0].angle == 0.0);
   CHECK(seq[0].phase == 0.0);
   CHECK(seq[1].angle == 0.0);
   CHECK(seq[1].phase == 180.0);
   CHECK(seq[2].angle == 60.0);
   CHECK(seq[2].phase == 0.0);
   CHECK(seq[5].angle == 120.0);
   CHECK(seq[5].phase == 180.0);
   for (const PatternStep& step : seq)
      CHECK(step.wavelength == 488.0);
}

TEST_CASE("SIM sequence needs at least one angle and phase",
      "[ExperimentPlan]")
{
   CHECK_THROWS_AS(BuildSimSequence(0, 5, 488.0), SeqError);
   CHECK_THROWS_AS(BuildSimSequence(3, 0, 488.0), SeqError);
   CHECK(BuildSimSequence(1, 1, 0.0).size() == 1);
}

TEST_CASE("slice count", "[ExperimentPlan]")
{
   ExperimentPlan plan;
   plan.sequence = BuildSimSequence(1, 1, 0.0);

   SECTION("2D experiment has exactly one slice")
   {
      plan.zHeight = 0.0;
      plan.sliceHeight = 0.0;
      CHECK(plan.NominalSliceCount() == 1);
      CHECK(plan.SliceCount() == 1);
      CHECK_NOTHROW(plan.Validate());
   }

   SECTION("heights below the threshold count as 2D")
   {
      plan.zHeight = 1e-7;
      plan.sliceHeight = 0.1;
      CHECK(plan.SliceCount() == 1);
   }

   SECTION("3D experiment gets one extra slice")
   {
      plan.zHeight = 10.0;
      plan.sliceHeight = 10.0;
      CHECK(plan.NominalSliceCount() == 1);
      CHECK(plan.SliceCount() == 2);

      plan.sliceHeight = 0.1;
      CHECK(plan.NominalSliceCount() == 100);
      CHECK(plan.SliceCount() == 101);

      plan.sliceHeight = 3.0;
      CHECK(plan.NominalSliceCount() == 4);
      CHECK(plan.SliceCount() == 5);
   }

   SECTION("slice targets")
   {
      plan.zStart = 5.0;
      plan.sliceHeight = 2.5;
      CHECK(plan.SliceTarget(0) == 5.0);
      CHECK(plan.SliceTarget(2) == 10.0);
   }
}

TEST_CASE("plan validation", "[ExperimentPlan]")
{
   ExperimentPlan plan;
   plan.sequence = BuildSimSequence(2, 1, 0.0);
   CHECK_NOTHROW(plan.Validate());

   SECTION("empty sequence")
   {
      plan.sequence.clear();
      CHECK_THROWS_AS(plan.Validate(), SeqError);
   }

   SECTION("no repetitions")
   {
      plan.numReps = 0;
      CHECK_THROWS_AS(plan.Validate(), SeqError);
   }

   SECTION("negative height")
   {
      plan.zHeight = -1.0;
      CHECK_THROWS_AS(plan.Validate(), SeqError);
   }

   SECTION("3D experiment without slice height")
   {
      plan.zHeight = 10.0;
      plan.sliceHeight = 0.0;
      try
      {
         plan.Validate();
         FAIL("expected SeqError");
      }
      catch (const SeqError& e)
      {
         CHECK(e.GetCode() == SIMSEQERR_ConfigurationError);
      }
   }
}
