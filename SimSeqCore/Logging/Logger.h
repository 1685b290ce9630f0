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

#include "Metadata.h"

#include <memory>
#include <sstream>
#include <string>


namespace simseq
{
namespace logging
{

class LoggingCore;


/**
 * Handle used by a component to emit log entries.
 *
 * Cheap to copy. A default-constructed Logger discards everything, so
 * components can be built without a logging core in tests.
 */
class Logger
{
   std::shared_ptr<LoggingCore> core_;
   std::string label_;

public:
   Logger() {}
   Logger(std::shared_ptr<LoggingCore> core, const std::string& label) :
      core_(core),
      label_(label)
   {}

   void operator()(LogLevel level, const std::string& text) const;

   const std::string& GetLabel() const { return label_; }
};


namespace internal
{

// Collects one entry and sends it when destroyed, so that
// LOG_INFO(lgr) << a << b; produces a single entry.
class LogStream
{
   const Logger& logger_;
   LogLevel level_;
   std::ostringstream strm_;

public:
   LogStream(const Logger& logger, LogLevel level) :
      logger_(logger),
      level_(level)
   {}

   ~LogStream()
   {
      try
      {
         logger_(level_, strm_.str());
      }
      catch (const std::exception&)
      {
         // A failing sink must not terminate the process from a destructor
      }
   }

   LogStream(const LogStream&) = delete;
   LogStream& operator=(const LogStream&) = delete;

   template <typename T>
   LogStream& operator<<(const T& value)
   {
      strm_ << value;
      return *this;
   }
};

} // namespace internal

} // namespace logging
} // namespace simseq


#define LOG_WITH_LEVEL(logger, level) \
   ::simseq::logging::internal::LogStream((logger), (level))

#define LOG_TRACE(logger) \
   LOG_WITH_LEVEL((logger), ::simseq::logging::LogLevelTrace)
#define LOG_DEBUG(logger) \
   LOG_WITH_LEVEL((logger), ::simseq::logging::LogLevelDebug)
#define LOG_INFO(logger) \
   LOG_WITH_LEVEL((logger), ::simseq::logging::LogLevelInfo)
#define LOG_WARNING(logger) \
   LOG_WITH_LEVEL((logger), ::simseq::logging::LogLevelWarning)
#define LOG_ERROR(logger) \
   LOG_WITH_LEVEL((logger), ::simseq::logging::LogLevelError)
#define LOG_FATAL(logger) \
   LOG_WITH_LEVEL((logger), ::simseq::logging::LogLevelFatal)
