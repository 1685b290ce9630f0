#include <catch2/catch_all.hpp>

#include "ActionPayload.h"
#include "Error.h"

#include <string>

using namespace simseq;

TEST_CASE("payload kinds and values", "[ActionPayload]")
{
   ActionPayload d = ActionPayload::Digital(true);
   CHECK(d.GetKind() == ActionKind::SetDigital);
   CHECK(d.GetDigitalState());

   ActionPayload a = ActionPayload::Analog(60.0);
   CHECK(a.GetKind() == ActionKind::SetAnalog);
   CHECK(a.GetAnalogValue() == 60.0);

   ActionPayload abs = ActionPayload::Absolute(10.5);
   CHECK(abs.GetKind() == ActionKind::MoveAbsolute);
   CHECK(abs.GetPosition() == 10.5);

   ActionPayload rel = ActionPayload::Relative(-2.0);
   CHECK(rel.GetKind() == ActionKind::MoveRelative);
   CHECK(rel.GetPosition() == -2.0);

   ActionPayload c = ActionPayload::CustomIndex(7);
   CHECK(c.GetKind() == ActionKind::Custom);
   CHECK(c.GetCustomIndex() == 7);
}

TEST_CASE("payload getters reject other kinds", "[ActionPayload]")
{
   ActionPayload d = ActionPayload::Digital(false);
   CHECK_THROWS_AS(d.GetAnalogValue(), SeqError);
   CHECK_THROWS_AS(d.GetPosition(), SeqError);
   CHECK_THROWS_AS(d.GetCustomIndex(), SeqError);
   CHECK_THROWS_AS(ActionPayload::CustomIndex(1).GetDigitalState(), SeqError);
   CHECK_THROWS_AS(ActionPayload::Analog(1.0).GetPosition(), SeqError);
}

TEST_CASE("payload equality", "[ActionPayload]")
{
   CHECK(ActionPayload::Digital(true) == ActionPayload::Digital(true));
   CHECK(ActionPayload::Digital(true) != ActionPayload::Digital(false));
   CHECK(ActionPayload::Absolute(1.0) != ActionPayload::Relative(1.0));
   CHECK(ActionPayload::Analog(1.0) != ActionPayload::Absolute(1.0));
   CHECK(ActionPayload::CustomIndex(2) == ActionPayload::CustomIndex(2));
   CHECK(ActionPayload::CustomIndex(2) != ActionPayload::CustomIndex(3));
}

TEST_CASE("payload to string", "[ActionPayload]")
{
   CHECK(ActionPayload::Digital(true).ToString() == "SetDigital(true)");
   CHECK(ActionPayload::Digital(false).ToString() == "SetDigital(false)");
   CHECK(ActionPayload::Analog(60.0).ToString() == "SetAnalog(60)");
   CHECK(ActionPayload::Analog(0.1).ToString() == "SetAnalog(0.1)");
   CHECK(ActionPayload::Absolute(10.0).ToString() == "MoveAbsolute(10)");
   CHECK(ActionPayload::Relative(-2.5).ToString() == "MoveRelative(-2.5)");
   CHECK(ActionPayload::CustomIndex(3).ToString() == "Custom(3)");
   CHECK(ActionPayload::Analog(120.0).ValueString() == "120");

   // Values that need all 17 significant digits still read back exactly
   const double sum = 0.1 + 0.2;
   const std::string text = ActionPayload::Absolute(sum).ValueString();
   CHECK(text == "0.30000000000000004");
   CHECK(std::stod(text) == sum);
   CHECK(ActionPayload::Absolute(1.0 / 3.0).ValueString() ==
         "0.33333333333333331");
   CHECK(std::string(ToString(ActionKind::MoveAbsolute)) == "MoveAbsolute");
}
