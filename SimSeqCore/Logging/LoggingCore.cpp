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


#include "LoggingCore.h"

#include <algorithm>


namespace simseq
{
namespace logging
{

void
Logger::operator()(LogLevel level, const std::string& text) const
{
   if (core_)
      core_->SendEntry(label_, level, text);
}


Logger
LoggingCore::NewLogger(const std::string& componentLabel)
{
   return Logger(shared_from_this(), componentLabel);
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink, LogLevel minLevel)
{
   if (!sink)
      return;
   std::lock_guard<std::mutex> lock(routesMutex_);
   for (Route& route : routes_)
   {
      if (route.sink == sink)
      {
         route.minLevel = minLevel;
         return;
      }
   }
   routes_.push_back(Route{ sink, minLevel });
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink)
{
   std::lock_guard<std::mutex> lock(routesMutex_);
   routes_.erase(std::remove_if(routes_.begin(), routes_.end(),
            [&sink](const Route& route) { return route.sink == sink; }),
         routes_.end());
}


void
LoggingCore::SetSinkLevel(const std::vector<std::shared_ptr<LogSink>>& sinks,
      LogLevel minLevel)
{
   std::lock_guard<std::mutex> lock(routesMutex_);
   for (Route& route : routes_)
   {
      if (std::find(sinks.begin(), sinks.end(), route.sink) != sinks.end())
         route.minLevel = minLevel;
   }
}


void
LoggingCore::SendEntry(const std::string& componentLabel, LogLevel level,
      const std::string& text)
{
   const Metadata metadata(componentLabel, level);

   std::lock_guard<std::mutex> lock(routesMutex_);
   for (const Route& route : routes_)
   {
      if (level >= route.minLevel)
         route.sink->Consume(metadata, text);
   }
}

} // namespace logging
} // namespace simseq
