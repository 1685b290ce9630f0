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


#include "LogManager.h"

#include "CoreUtils.h"
#include "Error.h"

#include <utility>
#include <vector>

namespace simseq
{

namespace
{

struct LevelName
{
   logging::LogLevel level;
   const char* name;
};

const LevelName levelNames[] = {
   { logging::LogLevelTrace, "trace" },
   { logging::LogLevelDebug, "debug" },
   { logging::LogLevelInfo, "info" },
   { logging::LogLevelWarning, "warning" },
   { logging::LogLevelError, "error" },
   { logging::LogLevelFatal, "fatal" },
};

} // anonymous namespace


const LogManager::LogFileHandle LogManager::StdErrHandle;
const LogManager::LogFileHandle LogManager::PrimaryHandle;


const char*
StringForLogLevel(logging::LogLevel level)
{
   for (const LevelName& entry : levelNames)
   {
      if (entry.level == level)
         return entry.name;
   }
   return "(unknown)";
}


logging::LogLevel
LogLevelFromString(const std::string& name)
{
   for (const LevelName& entry : levelNames)
   {
      if (name == entry.name)
         return entry.level;
   }
   throw SeqError("Unknown log level " + ToQuotedString(name),
         SIMSEQERR_ConfigurationError);
}


LogManager::LogManager() :
   loggingCore_(std::make_shared<logging::LoggingCore>()),
   internalLogger_(loggingCore_->NewLogger("LogManager")),
   primaryLogLevel_(logging::LogLevelInfo),
   nextSecondaryHandle_(0)
{}


std::shared_ptr<logging::LogSink>
LogManager::OpenFile(const std::string& filename, bool truncate,
      const char* role)
{
   try
   {
      return std::make_shared<logging::FileLogSink>(filename, !truncate);
   }
   catch (const logging::CannotOpenFileException&)
   {
      LOG_ERROR(internalLogger_) << "Failed to open " <<
         ToQuotedString(filename) << " as " << role << " log file";
      throw SeqError("Cannot open file " + ToQuotedString(filename),
            SIMSEQERR_CannotOpenFile);
   }
}


// The new sink is attached before any sink it replaces is detached, so that
// no entry is lost while switching files.
void
LogManager::Install(LogFileHandle handle, const Destination& destination,
      logging::LogLevel level)
{
   loggingCore_->AddSink(destination.sink, level);

   std::map<LogFileHandle, Destination>::iterator it =
      destinations_.find(handle);
   if (it != destinations_.end())
   {
      loggingCore_->RemoveSink(it->second.sink);
      it->second = destination;
   }
   else
   {
      destinations_.insert(std::make_pair(handle, destination));
   }
}


void
LogManager::Uninstall(LogFileHandle handle)
{
   std::map<LogFileHandle, Destination>::iterator it =
      destinations_.find(handle);
   if (it == destinations_.end())
      return;
   loggingCore_->RemoveSink(it->second.sink);
   destinations_.erase(it);
}


void
LogManager::SetUseStdErr(bool flag)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (flag == (destinations_.count(StdErrHandle) > 0))
      return;

   if (flag)
   {
      Destination stdErr;
      stdErr.sink = std::make_shared<logging::StdErrLogSink>();
      stdErr.followsPrimaryLevel = true;
      Install(StdErrHandle, stdErr, primaryLogLevel_);
      LOG_DEBUG(internalLogger_) << "Enabled logging to stderr";
   }
   else
   {
      LOG_DEBUG(internalLogger_) << "Disabling logging to stderr";
      Uninstall(StdErrHandle);
   }
}


bool
LogManager::IsUsingStdErr() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return destinations_.count(StdErrHandle) > 0;
}


void
LogManager::SetPrimaryLogFilename(const std::string& filename, bool truncate)
{
   std::lock_guard<std::mutex> lock(mutex_);

   std::map<LogFileHandle, Destination>::const_iterator current =
      destinations_.find(PrimaryHandle);
   const std::string currentName = (current == destinations_.end()) ?
      std::string() : current->second.filename;
   if (filename == currentName)
      return;

   if (filename.empty())
   {
      LOG_INFO(internalLogger_) << "Disabling primary log file";
      Uninstall(PrimaryHandle);
      return;
   }

   Destination primary;
   primary.filename = filename;
   primary.sink = OpenFile(filename, truncate, "primary");
   primary.followsPrimaryLevel = true;
   Install(PrimaryHandle, primary, primaryLogLevel_);

   LOG_INFO(internalLogger_) << "Primary log file is now " << filename;
}


std::string
LogManager::GetPrimaryLogFilename() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   std::map<LogFileHandle, Destination>::const_iterator it =
      destinations_.find(PrimaryHandle);
   return it == destinations_.end() ? std::string() : it->second.filename;
}


bool
LogManager::IsUsingPrimaryLogFile() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return destinations_.count(PrimaryHandle) > 0;
}


void
LogManager::SetPrimaryLogLevel(logging::LogLevel level)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (level == primaryLogLevel_)
      return;

   const logging::LogLevel oldLevel = primaryLogLevel_;
   primaryLogLevel_ = level;

   std::vector<std::shared_ptr<logging::LogSink>> followers;
   for (const auto& entry : destinations_)
   {
      if (entry.second.followsPrimaryLevel)
         followers.push_back(entry.second.sink);
   }
   loggingCore_->SetSinkLevel(followers, level);

   LOG_INFO(internalLogger_) << "Switched primary log level from " <<
      StringForLogLevel(oldLevel) << " to " << StringForLogLevel(level);
}


logging::LogLevel
LogManager::GetPrimaryLogLevel() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return primaryLogLevel_;
}


LogManager::LogFileHandle
LogManager::AddSecondaryLogFile(logging::LogLevel level,
      const std::string& filename, bool truncate)
{
   std::lock_guard<std::mutex> lock(mutex_);

   Destination secondary;
   secondary.filename = filename;
   secondary.sink = OpenFile(filename, truncate, "secondary");
   secondary.followsPrimaryLevel = false;

   const LogFileHandle handle = nextSecondaryHandle_++;
   Install(handle, secondary, level);

   LOG_INFO(internalLogger_) << "Added secondary log file " << filename <<
      " with log level " << StringForLogLevel(level);
   return handle;
}


void
LogManager::RemoveSecondaryLogFile(LogFileHandle handle)
{
   std::lock_guard<std::mutex> lock(mutex_);

   std::map<LogFileHandle, Destination>::const_iterator it =
      destinations_.find(handle);
   if (handle < 0 || it == destinations_.end())
   {
      LOG_ERROR(internalLogger_) << "Cannot remove secondary log file (" <<
         handle << ": no such handle)";
      return;
   }

   LOG_INFO(internalLogger_) << "Removing secondary log file " <<
      it->second.filename;
   Uninstall(handle);
}


void
LogManager::AddSink(std::shared_ptr<logging::LogSink> sink,
      logging::LogLevel minLevel)
{
   loggingCore_->AddSink(sink, minLevel);
}


void
LogManager::RemoveSink(std::shared_ptr<logging::LogSink> sink)
{
   loggingCore_->RemoveSink(sink);
}


logging::Logger
LogManager::NewLogger(const std::string& label)
{
   return loggingCore_->NewLogger(label);
}

} // namespace simseq
