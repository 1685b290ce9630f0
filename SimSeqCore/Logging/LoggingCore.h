// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
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

#include "LogSink.h"
#include "Logger.h"
#include "Metadata.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>


namespace simseq
{
namespace logging
{

/**
 * Owns the set of sinks and dispatches entries to them.
 *
 * Each sink is registered with a minimum level. Entries are delivered
 * synchronously on the calling thread; the sink list is guarded so that
 * loggers may be used from any thread.
 */
class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
   struct Route
   {
      std::shared_ptr<LogSink> sink;
      LogLevel minLevel;
   };

   std::mutex routesMutex_;
   std::vector<Route> routes_;

public:
   Logger NewLogger(const std::string& componentLabel);

   // Adding a sink that is already present only updates its level
   void AddSink(std::shared_ptr<LogSink> sink,
         LogLevel minLevel = LogLevelTrace);
   void RemoveSink(std::shared_ptr<LogSink> sink);

   // Change the level of several sinks at once; unknown sinks are skipped
   void SetSinkLevel(const std::vector<std::shared_ptr<LogSink>>& sinks,
         LogLevel minLevel);

   void SendEntry(const std::string& componentLabel, LogLevel level,
         const std::string& text);
};

} // namespace logging
} // namespace simseq
