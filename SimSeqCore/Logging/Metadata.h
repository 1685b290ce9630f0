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

#include <chrono>
#include <string>
#include <thread>


namespace simseq
{
namespace logging
{

enum LogLevel
{
   LogLevelTrace,
   LogLevelDebug,
   LogLevelInfo,
   LogLevelWarning,
   LogLevelError,
   LogLevelFatal,
};


/**
 * Everything known about a log entry apart from its text.
 *
 * The entry is stamped with the wall-clock time and the calling thread when
 * the metadata is constructed.
 */
class Metadata
{
public:
   typedef std::chrono::system_clock::time_point TimePoint;

private:
   std::string component_;
   LogLevel level_;
   TimePoint time_;
   std::thread::id thread_;

public:
   Metadata(const std::string& component, LogLevel level) :
      component_(component),
      level_(level),
      time_(std::chrono::system_clock::now()),
      thread_(std::this_thread::get_id())
   {}

   const std::string& GetComponent() const { return component_; }
   LogLevel GetLevel() const { return level_; }
   TimePoint GetTimestamp() const { return time_; }
   std::thread::id GetThreadId() const { return thread_; }
};

} // namespace logging
} // namespace simseq
