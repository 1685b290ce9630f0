#include <catch2/catch_all.hpp>

#include "SequencePlanner.h"
#include "Error.h"
#include "StubDevices.h"

#include <memory>

using namespace simseq;

namespace {

struct PlannerFixture
{
   DeviceRegistry registry;
   PatternClientRegistry clients;
   TimingOracle oracle;
   std::shared_ptr<StubCamera> camera;
   std::shared_ptr<StubStage> stage;
   ResourceHandle cam;
   ResourceHandle light;
   ExperimentPlan plan;

   PlannerFixture() :
      oracle(registry),
      camera(std::make_shared<StubCamera>("cam")),
      stage(std::make_shared<StubStage>("z"))
   {
      cam = registry.Register(camera);
      light = registry.Register(std::make_shared<StubLight>("488"));
      plan.sequence = BuildSimSequence(2, 1, 488.0);
      plan.cameras.push_back(cam);
      plan.lights.push_back(light);
   }

   ResourceHandle AddStage()
   {
      ResourceHandle z = registry.Register(stage);
      plan.zPositioner = z;
      return z;
   }

   ActionTable Plan(const PlannerSettings& settings = PlannerSettings())
   {
      SequencePlanner planner(registry, clients, oracle, logging::Logger(),
            settings);
      return planner.Generate(plan);
   }
};

std::vector<ActionEntry> EntriesOfKind(const ActionTable& table,
      ResourceHandle target, ActionKind kind)
{
   std::vector<ActionEntry> result;
   for (const ActionEntry& entry : table.GetEntriesFor(target))
   {
      if (entry.payload.GetKind() == kind)
         result.push_back(entry);
   }
   return result;
}

// Timestamp of the first entry at or after t that does not target the stage
Time FirstNonStageAfter(const ActionTable& table, ResourceHandle z, Time t)
{
   for (const ActionEntry& entry : table.GetEntries())
   {
      if (entry.target != z && entry.timestamp >= t)
         return entry.timestamp;
   }
   FAIL("no entry found");
   return Time();
}

} // anonymous namespace

TEST_CASE_METHOD(PlannerFixture, "single slice without stage",
      "[SequencePlanner]")
{
   SequencePlanner planner(registry, clients, oracle, logging::Logger());
   ActionTable table = planner.Generate(plan);

   CHECK(table.IsSealed());
   const std::vector<ActionEntry>& e = table.GetEntries();
   REQUIRE(e.size() == 4);
   CHECK(e[0].timestamp == Time::Zero());
   CHECK(e[0].target == light);
   CHECK(e[0].payload == ActionPayload::Digital(true));
   CHECK(e[1].timestamp == Time::Zero());
   CHECK(e[1].target == cam);
   CHECK(e[2].timestamp == Time::FromMs(65));
   CHECK(e[2].target == light);
   CHECK(e[3].timestamp == Time::FromMs(65));
   CHECK(e[3].target == cam);

   CHECK(table.GetDuration() >= Time::FromMs(125));
   CHECK(table.GetDuration() == Time::FromMs(130));
   CHECK(planner.GetImageCount(cam) == 2);
   CHECK(planner.GetDiscardedImageCount(cam) == 0);
   CHECK(planner.GetImageCount(light) == 0);
   CHECK(planner.GetExperimentMetadata().empty());
}

TEST_CASE_METHOD(PlannerFixture, "repetitions wait for the cameras",
      "[SequencePlanner]")
{
   plan.numReps = 2;
   PlannerSettings settings;
   settings.interTriggerDelay = Time::Zero();
   ActionTable table = Plan(settings);

   // Second trigger at 60, camera free at 120
   CHECK(table.GetEarliestAvailable(cam) == Time::FromMs(120));
   CHECK(table.GetDuration() == Time::FromMs(120));
}

TEST_CASE_METHOD(PlannerFixture, "a new slice starts after the stage settles",
      "[SequencePlanner]")
{
   ResourceHandle z = AddStage();
   plan.zStart = 0.0;
   plan.zHeight = 10.0;
   plan.sliceHeight = 10.0;
   ActionTable table = Plan();

   std::vector<ActionEntry> moves = EntriesOfKind(table, z,
         ActionKind::MoveAbsolute);
   Time sliceMove;
   bool found = false;
   for (const ActionEntry& m : moves)
   {
      if (m.payload == ActionPayload::Absolute(10.0))
      {
         sliceMove = m.timestamp;
         found = true;
         break;
      }
   }
   REQUIRE(found);
   CHECK(sliceMove == Time::FromMs(130));
   CHECK(FirstNonStageAfter(table, z, sliceMove) ==
         sliceMove + Time::FromMs(25));

   // Motion is queried for the slice change and for the return
   REQUIRE(stage->moves.size() == 2);
   CHECK(stage->moves[0] == std::make_pair(0.0, 10.0));
   CHECK(stage->moves[1] == std::make_pair(10.0, 0.0));

   // Slice move, hold, return, final hold
   REQUIRE(moves.size() == 6);
   CHECK(moves[0].timestamp == Time::Zero());
   CHECK(moves[0].payload == ActionPayload::Absolute(0.0));
   CHECK(moves[1].timestamp == Time::FromMs(130));
   CHECK(moves[3].timestamp == Time::FromMs(285));
   CHECK(moves[3].payload == ActionPayload::Absolute(10.0));
   CHECK(moves[4].timestamp == Time::FromMs(305)); // where the return ends
   CHECK(moves[4].payload == ActionPayload::Absolute(0.0));
   CHECK(moves[5].timestamp == Time::FromMs(310));
   CHECK(moves[5].payload == ActionPayload::Absolute(0.0));
   CHECK(table.GetDuration() == Time::FromMs(310));
}

TEST_CASE_METHOD(PlannerFixture, "one slice command per Z slice",
      "[SequencePlanner]")
{
   ResourceHandle z = AddStage();
   plan.zStart = 2.0;
   plan.zHeight = 10.0;
   plan.sliceHeight = 3.0;
   PlannerSettings settings;
   settings.holdPositionAfterBurst = false;

   SequencePlanner planner(registry, clients, oracle, logging::Logger(),
         settings);
   ActionTable table = planner.Generate(plan);

   std::vector<ActionEntry> moves = EntriesOfKind(table, z,
         ActionKind::MoveAbsolute);
   const long slices = plan.SliceCount();
   REQUIRE(slices == 5);
   // Plus the return move and the final hold
   REQUIRE(moves.size() == static_cast<std::size_t>(slices + 2));
   for (long i = 0; i < slices; ++i)
      CHECK(moves[i].payload == ActionPayload::Absolute(plan.SliceTarget(i)));
   CHECK(planner.GetImageCount(cam) == slices * 2);
}

TEST_CASE_METHOD(PlannerFixture, "table invariants", "[SequencePlanner]")
{
   AddStage();
   plan.sequence = BuildSimSequence(3, 5, 488.0);
   plan.zHeight = 4.0;
   plan.sliceHeight = 1.0;
   plan.numReps = 3;
   camera->ready = false;
   ResourceHandle cam2 = registry.Register(std::make_shared<StubCamera>("cam2"));
   plan.cameras.push_back(cam2);
   ActionTable table = Plan();

   SECTION("timestamps never decrease")
   {
      const std::vector<ActionEntry>& e = table.GetEntries();
      for (std::size_t i = 1; i < e.size(); ++i)
         CHECK(e[i - 1].timestamp <= e[i].timestamp);
   }

   SECTION("cameras are never triggered while busy")
   {
      for (ResourceHandle c : plan.cameras)
      {
         std::vector<ActionEntry> triggers = table.GetEntriesFor(c);
         for (std::size_t i = 1; i < triggers.size(); ++i)
            CHECK(triggers[i].timestamp >=
                  triggers[i - 1].timestamp + Time::FromMs(60));
      }
   }

   SECTION("duration covers every camera")
   {
      for (ResourceHandle c : plan.cameras)
         CHECK(table.GetDuration() >= table.GetEarliestAvailable(c));
   }
}

TEST_CASE_METHOD(PlannerFixture, "planning is deterministic",
      "[SequencePlanner]")
{
   AddStage();
   plan.zHeight = 5.0;
   plan.sliceHeight = 2.0;
   ResourceHandle slm = registry.Register(std::make_shared<StubModulator>("slm"));
   clients.Attach("slm", slm);
   plan.patternGroups.push_back("slm");

   ActionTable first = Plan();
   ActionTable second = Plan();
   CHECK(first.GetEntries() == second.GetEntries());
   CHECK(first.GetDuration() == second.GetDuration());
}

TEST_CASE_METHOD(PlannerFixture, "cameras that are not ready are armed first",
      "[SequencePlanner]")
{
   camera->ready = false;
   SequencePlanner planner(registry, clients, oracle, logging::Logger());
   ActionTable table = planner.Generate(plan);

   std::vector<ActionEntry> triggers = table.GetEntriesFor(cam);
   REQUIRE(triggers.size() == 3);
   CHECK(triggers[0].timestamp == Time::Zero());
   CHECK(triggers[1].timestamp == Time::FromMs(60));
   CHECK(triggers[2].timestamp == Time::FromMs(125));
   CHECK(planner.GetDiscardedImageCount(cam) == 1);
   CHECK(planner.GetImageCount(cam) == 2);

   // The light is only fired with real exposures
   CHECK(table.GetEntriesFor(light).size() == 2);
}

TEST_CASE_METHOD(PlannerFixture, "pattern clients follow the sequence",
      "[SequencePlanner]")
{
   plan.sequence = BuildSimSequence(3, 2, 488.0);
   std::shared_ptr<StubModulator> indexed =
      std::make_shared<StubModulator>("slm");
   indexed->hasDiffractionAngle = true;
   indexed->diffractionAngle = 1.25;
   std::shared_ptr<StubModulator> rotor =
      std::make_shared<StubModulator>("rotor");
   rotor->mode = DriveAngle;
   std::shared_ptr<StubModulator> shifter =
      std::make_shared<StubModulator>("shifter");
   shifter->mode = DrivePhase;
   ResourceHandle slm = registry.Register(indexed);
   ResourceHandle rot = registry.Register(rotor);
   ResourceHandle shift = registry.Register(shifter);
   clients.Attach("slm", slm);
   clients.Attach("mechanics", rot);
   clients.Attach("mechanics", shift);
   plan.patternGroups.push_back("slm");
   plan.patternGroups.push_back("mechanics");
   plan.patternGroups.push_back("empty");

   SequencePlanner planner(registry, clients, oracle, logging::Logger());
   ActionTable table = planner.Generate(plan);

   std::vector<ActionEntry> slmEntries = table.GetEntriesFor(slm);
   std::vector<ActionEntry> rotEntries = table.GetEntriesFor(rot);
   std::vector<ActionEntry> shiftEntries = table.GetEntriesFor(shift);
   std::vector<ActionEntry> camEntries = table.GetEntriesFor(cam);
   REQUIRE(slmEntries.size() == 6);
   REQUIRE(rotEntries.size() == 6);
   REQUIRE(shiftEntries.size() == 6);
   REQUIRE(camEntries.size() == 6);

   for (std::size_t i = 0; i < 6; ++i)
   {
      CHECK(slmEntries[i].payload ==
            ActionPayload::CustomIndex(static_cast<long>(i)));
      CHECK(rotEntries[i].payload ==
            ActionPayload::Analog(plan.sequence[i].angle));
      CHECK(shiftEntries[i].payload ==
            ActionPayload::Analog(plan.sequence[i].phase));
      // Patterns are set at the same instant as the trigger they belong to
      CHECK(slmEntries[i].timestamp == camEntries[i].timestamp);
   }

   // Within one instant the pattern comes before the exposure
   const std::vector<ActionEntry>& e = table.GetEntries();
   REQUIRE(e.size() == 30);
   CHECK(e[0].target == slm);
   CHECK(e[1].target == rot);
   CHECK(e[2].target == shift);
   CHECK(e[3].target == light);
   CHECK(e[4].target == cam);

   CHECK(planner.GetExperimentMetadata() == "SLM diff_angle 1.250");
}

TEST_CASE_METHOD(PlannerFixture, "hold commands can be disabled",
      "[SequencePlanner]")
{
   ResourceHandle z = AddStage();

   SECTION("enabled")
   {
      // Slice, hold, return, final hold
      CHECK(EntriesOfKind(Plan(), z, ActionKind::MoveAbsolute).size() == 4);
   }

   SECTION("disabled")
   {
      PlannerSettings settings;
      settings.holdPositionAfterBurst = false;
      CHECK(EntriesOfKind(Plan(settings), z,
               ActionKind::MoveAbsolute).size() == 3);
   }
}

TEST_CASE_METHOD(PlannerFixture, "no stage means no moves", "[SequencePlanner]")
{
   plan.zHeight = 0.0;
   ActionTable table = Plan();
   for (const ActionEntry& entry : table.GetEntries())
   {
      CHECK(entry.payload.GetKind() != ActionKind::MoveAbsolute);
      CHECK(entry.payload.GetKind() != ActionKind::MoveRelative);
      CHECK((entry.target == cam || entry.target == light));
   }
   // The final hold survives only as the duration
   CHECK(table.GetDuration() == Time::FromMs(130));
}

TEST_CASE_METHOD(PlannerFixture, "2D experiment with a stage moves once",
      "[SequencePlanner]")
{
   ResourceHandle z = AddStage();
   plan.zStart = 4.0;
   plan.zHeight = 0.0;
   plan.sliceHeight = 1.0;
   ActionTable table = Plan();

   std::vector<ActionEntry> moves = EntriesOfKind(table, z,
         ActionKind::MoveAbsolute);
   // Slice, hold, return, final hold
   REQUIRE(moves.size() == 4);
   CHECK(moves[0].timestamp == Time::Zero());
   CHECK(moves[0].payload == ActionPayload::Absolute(4.0));
   CHECK(moves[1].timestamp == Time::FromMs(130));
   CHECK(moves[1].payload == ActionPayload::Absolute(4.0));
   CHECK(moves[2].timestamp == Time::FromMs(150));
   CHECK(moves[3].timestamp == Time::FromMs(155));
   CHECK(table.GetDuration() == Time::FromMs(155));

   // Only the return move asks the stage for a motion estimate
   REQUIRE(stage->moves.size() == 1);
   CHECK(stage->moves[0] == std::make_pair(4.0, 4.0));
   CHECK(table.GetEntriesFor(z).size() == 4);
}

TEST_CASE_METHOD(PlannerFixture, "planner errors", "[SequencePlanner]")
{
   SECTION("a planner generates only once")
   {
      SequencePlanner planner(registry, clients, oracle, logging::Logger());
      planner.Generate(plan);
      try
      {
         planner.Generate(plan);
         FAIL("expected SeqError");
      }
      catch (const SeqError& e)
      {
         CHECK(e.GetCode() == SIMSEQERR_PlannerReused);
      }
   }

   SECTION("unavailable timing aborts planning")
   {
      camera->exposureStatus = SIMSEQ_TIMING_UNAVAILABLE;
      try
      {
         Plan();
         FAIL("expected SeqError");
      }
      catch (const SeqError& e)
      {
         CHECK(e.GetCode() == SIMSEQERR_ConfigurationError);
         REQUIRE(e.GetUnderlyingError() != nullptr);
         CHECK(e.GetUnderlyingError()->GetCode() ==
               SIMSEQERR_UnavailableTiming);
      }
   }

   SECTION("unavailable motion timing aborts planning")
   {
      AddStage();
      plan.zHeight = 2.0;
      plan.sliceHeight = 1.0;
      stage->movementStatus = SIMSEQ_TIMING_UNAVAILABLE;
      try
      {
         Plan();
         FAIL("expected SeqError");
      }
      catch (const SeqError& e)
      {
         CHECK(e.GetCode() == SIMSEQERR_ConfigurationError);
         CHECK(e.GetFullMsg().find("\"z\"") != std::string::npos);
      }
   }

   SECTION("timing values too large to schedule")
   {
      camera->exposure = Time::Parse("9000000000000000");
      camera->gap = Time::Parse("9000000000000000");
      try
      {
         Plan();
         FAIL("expected SeqError");
      }
      catch (const SeqError& e)
      {
         CHECK(e.GetCode() == SIMSEQERR_ConfigurationError);
         REQUIRE(e.GetUnderlyingError() != nullptr);
         CHECK(e.GetUnderlyingError()->GetCode() == SIMSEQERR_TimeOverflow);
      }
   }

   SECTION("resources must have the capability they are used for")
   {
      plan.cameras.push_back(light);
      try
      {
         Plan();
         FAIL("expected SeqError");
      }
      catch (const SeqError& e)
      {
         CHECK(e.GetCode() == SIMSEQERR_ConfigurationError);
         REQUIRE(e.GetUnderlyingError() != nullptr);
         CHECK(e.GetUnderlyingError()->GetCode() ==
               SIMSEQERR_MissingCapability);
      }
   }

   SECTION("pattern clients must be settable")
   {
      clients.Attach("slm", light);
      plan.patternGroups.push_back("slm");
      CHECK_THROWS_AS(Plan(), SeqError);
   }

   SECTION("invalid plans are rejected")
   {
      plan.sequence.clear();
      try
      {
         Plan();
         FAIL("expected SeqError");
      }
      catch (const SeqError& e)
      {
         CHECK(e.GetCode() == SIMSEQERR_ConfigurationError);
      }
   }
}

TEST_CASE_METHOD(PlannerFixture, "expose returns when all cameras are free",
      "[SequencePlanner]")
{
   std::shared_ptr<StubCamera> slow = std::make_shared<StubCamera>("slow");
   slow->exposure = Time::FromMs(100);
   ResourceHandle slowCam = registry.Register(slow);
   std::vector<ResourceHandle> cameras;
   cameras.push_back(cam);
   cameras.push_back(slowCam);

   SequencePlanner planner(registry, clients, oracle, logging::Logger());
   ActionTable table;
   CHECK(planner.Expose(Time::Zero(), cameras, plan.lights, table) ==
         Time::FromMs(110));
   CHECK(table.GetEarliestAvailable(cam) == Time::FromMs(60));
   CHECK(table.GetEarliestAvailable(slowCam) == Time::FromMs(110));

   // Commands still go out at the cursor while a camera is busy
   CHECK(planner.Expose(Time::FromMs(110), cameras, plan.lights, table) ==
         Time::FromMs(220));
   CHECK(table.Size() == 6);
}

TEST_CASE_METHOD(PlannerFixture,
      "expose waits for a camera busy past the acquisition",
      "[SequencePlanner]")
{
   ActionTable table;
   table.Append(Time::Zero(), cam, ActionPayload::Digital(true),
         Time::FromMs(500));
   std::vector<ResourceHandle> cameras(1, cam);

   SequencePlanner planner(registry, clients, oracle, logging::Logger());
   const Time end = planner.Expose(Time::FromMs(10), cameras, plan.lights,
         table);

   // Not cursor + 60: the camera was still busy until 500
   CHECK(end == Time::FromMs(500));

   std::vector<ActionEntry> triggers = table.GetEntriesFor(cam);
   REQUIRE(triggers.size() == 2);
   CHECK(triggers[1].timestamp == Time::FromMs(10));
   std::vector<ActionEntry> flashes = table.GetEntriesFor(light);
   REQUIRE(flashes.size() == 1);
   CHECK(flashes[0].timestamp == Time::FromMs(10));
   CHECK(planner.GetImageCount(cam) == 1);
}
