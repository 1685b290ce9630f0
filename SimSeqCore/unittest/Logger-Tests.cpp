#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"

#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace simseq {
namespace logging {

namespace {

class CapturingSink : public LogSink
{
public:
   struct Captured
   {
      LogLevel level;
      std::string label;
      std::string text;
   };
   std::vector<Captured> entries;

   void Consume(const Metadata& metadata, const std::string& text) override
   {
      Captured c;
      c.level = metadata.GetLevel();
      c.label = metadata.GetComponent();
      c.text = text;
      entries.push_back(c);
   }
};

} // anonymous namespace


TEST_CASE("synchronous logger basics", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   c->AddSink(std::make_shared<StdErrLogSink>());

   Logger lgr = c->NewLogger("mylabel");
   CHECK(lgr.GetLabel() == "mylabel");

   lgr(LogLevelDebug, "My entry text\nMy second line");
   for (unsigned i = 0; i < 10; ++i)
      lgr(LogLevelDebug, "More lines!\n\n\n");
}


TEST_CASE("log stream delivers one entry per statement", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   std::shared_ptr<CapturingSink> sink = std::make_shared<CapturingSink>();
   c->AddSink(sink);

   Logger lgr = c->NewLogger("planner");
   LOG_INFO(lgr) << 123 << "ABC" << 456;
   LOG_FATAL(lgr) << "bad";

   REQUIRE(sink->entries.size() == 2);
   CHECK(sink->entries[0].level == LogLevelInfo);
   CHECK(sink->entries[0].label == "planner");
   CHECK(sink->entries[0].text == "123ABC456");
   CHECK(sink->entries[1].level == LogLevelFatal);
   CHECK(sink->entries[1].text == "bad");
}


TEST_CASE("default logger discards entries", "[Logger]")
{
   Logger lgr;
   LOG_ERROR(lgr) << "nobody listens";
   lgr(LogLevelFatal, "still nobody");
   CHECK(lgr.GetLabel().empty());
}


TEST_CASE("level filter", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   std::shared_ptr<CapturingSink> sink = std::make_shared<CapturingSink>();
   c->AddSink(sink, LogLevelWarning);

   Logger lgr = c->NewLogger("x");
   LOG_TRACE(lgr) << "t";
   LOG_DEBUG(lgr) << "d";
   LOG_INFO(lgr) << "i";
   LOG_WARNING(lgr) << "w";
   LOG_ERROR(lgr) << "e";

   REQUIRE(sink->entries.size() == 2);
   CHECK(sink->entries[0].text == "w");
   CHECK(sink->entries[1].text == "e");

   SECTION("level change")
   {
      std::vector<std::shared_ptr<LogSink>> sinks;
      sinks.push_back(sink);
      c->SetSinkLevel(sinks, LogLevelTrace);
      LOG_TRACE(lgr) << "t2";
      REQUIRE(sink->entries.size() == 3);
      CHECK(sink->entries[2].text == "t2");
   }

   SECTION("adding again only changes the level")
   {
      c->AddSink(sink, LogLevelError);
      LOG_WARNING(lgr) << "w2";
      LOG_ERROR(lgr) << "e2";
      REQUIRE(sink->entries.size() == 3);
      CHECK(sink->entries[2].text == "e2");
   }
}


TEST_CASE("removed sink receives nothing", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   std::shared_ptr<CapturingSink> sink = std::make_shared<CapturingSink>();
   c->AddSink(sink);
   c->AddSink(sink); // no duplicate delivery

   Logger lgr = c->NewLogger("x");
   LOG_INFO(lgr) << "one";
   c->RemoveSink(sink);
   LOG_INFO(lgr) << "two";

   REQUIRE(sink->entries.size() == 1);
   CHECK(sink->entries[0].text == "one");
}


TEST_CASE("loggers may be used from several threads", "[Logger]")
{
   std::shared_ptr<LoggingCore> c = std::make_shared<LoggingCore>();
   std::shared_ptr<CapturingSink> sink = std::make_shared<CapturingSink>();
   c->AddSink(sink);

   std::vector<std::thread> threads;
   for (unsigned n = 0; n < 4; ++n)
   {
      threads.emplace_back([c, n]() {
         Logger lgr = c->NewLogger("thread" + std::to_string(n));
         for (unsigned i = 0; i < 50; ++i)
            LOG_DEBUG(lgr) << "entry " << i;
      });
   }
   for (std::thread& t : threads)
      t.join();

   CHECK(sink->entries.size() == 200);
}


TEST_CASE("entry formatting", "[Logger]")
{
   const Metadata metadata("Planner", LogLevelWarning);

   std::ostringstream oss;
   internal::FormatEntry(oss, metadata, "first\nsecond");
   const std::string out = oss.str();

   const std::string::size_type firstEnd = out.find('\n');
   REQUIRE(firstEnd != std::string::npos);
   const std::string first = out.substr(0, firstEnd);
   const std::string second = out.substr(firstEnd + 1);

   // yyyy-mm-ddThh:mm:ss.uuuuuu
   REQUIRE(first.size() > 26);
   CHECK(first[4] == '-');
   CHECK(first[10] == 'T');
   CHECK(first[19] == '.');
   CHECK(first.find(" tid") == 26);

   const std::string::size_type bracket = first.find("[WRN,Planner] first");
   REQUIRE(bracket != std::string::npos);

   // Continuation lines align the bracketed field with the first line
   REQUIRE(second.size() > bracket);
   CHECK(second[bracket] == '[');
   CHECK(second.find("] second\n") == bracket + std::string("[WRN,Planner").size());
   CHECK(second.substr(0, bracket) == std::string(bracket, ' '));
}


TEST_CASE("level strings", "[Logger]")
{
   CHECK(std::string(internal::LevelString(LogLevelTrace)) == "trc");
   CHECK(std::string(internal::LevelString(LogLevelDebug)) == "dbg");
   CHECK(std::string(internal::LevelString(LogLevelInfo)) == "IFO");
   CHECK(std::string(internal::LevelString(LogLevelWarning)) == "WRN");
   CHECK(std::string(internal::LevelString(LogLevelError)) == "ERR");
   CHECK(std::string(internal::LevelString(LogLevelFatal)) == "FTL");
}

} // namespace logging
} // namespace simseq
