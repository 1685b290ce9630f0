#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"

#include <string>
#include <vector>

namespace simseq {
namespace logging {

TEST_CASE("split entry into lines", "[Logging]")
{
   SECTION("empty result")
   {
      const char *testStr = GENERATE(
         "", "\r", "\n", "\r\r", "\r\n", "\n\n",
         "\r\r\r", "\r\r\n", "\r\n\r", "\n\n\n");
      std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 1);
      CHECK(result[0].empty());
   }

   SECTION("single line")
   {
      const char *testStr = GENERATE(
         "X", "X\r", "X\n", "X\r\n", "X\n\n", "X\r\n\r\n", "X\n\r\r");
      std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 1);
      CHECK(result[0] == "X");
   }

   SECTION("two lines")
   {
      const char *testStr = GENERATE(
         "X\rY", "X\nY", "X\r\nY", "X\nY\n", "X\nY\r\n", "X\nY\n\n\n");
      std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 2);
      CHECK(result[0] == "X");
      CHECK(result[1] == "Y");
   }

   SECTION("empty middle line is kept")
   {
      const char *testStr = GENERATE(
         "X\r\rY", "X\n\nY", "X\n\rY", "X\r\n\rY", "X\r\r\nY",
         "X\r\n\r\nY");
      std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 3);
      CHECK(result[0] == "X");
      CHECK(result[1].empty());
      CHECK(result[2] == "Y");
   }

   SECTION("leading blank line is kept")
   {
      std::vector<std::string> result = internal::SplitEntryIntoLines("\nX");
      REQUIRE(result.size() == 2);
      CHECK(result[0].empty());
      CHECK(result[1] == "X");
   }
}

} // namespace logging
} // namespace simseq
