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

#include "Logging/Logging.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace simseq
{

/**
 * Facade to the logging subsystem.
 *
 * Every destination (stderr, the primary file, secondary files) is one
 * entry in a table keyed by handle. Stderr and the primary file follow the
 * primary log level; each secondary file keeps the level it was added with.
 */
class LogManager
{
public:
   typedef int LogFileHandle;

private:
   static const LogFileHandle StdErrHandle = -2;
   static const LogFileHandle PrimaryHandle = -1;

   struct Destination
   {
      std::string filename; // Empty for stderr
      std::shared_ptr<logging::LogSink> sink;
      bool followsPrimaryLevel;
   };

   std::shared_ptr<logging::LoggingCore> loggingCore_;
   logging::Logger internalLogger_;

   mutable std::mutex mutex_;
   logging::LogLevel primaryLogLevel_;
   std::map<LogFileHandle, Destination> destinations_;
   LogFileHandle nextSecondaryHandle_;

public:
   LogManager();

   void SetUseStdErr(bool flag);
   bool IsUsingStdErr() const;

   // Empty filename closes the primary file.
   // Throws SeqError (SIMSEQERR_CannotOpenFile) if the file cannot be opened
   void SetPrimaryLogFilename(const std::string& filename, bool truncate);
   std::string GetPrimaryLogFilename() const;
   bool IsUsingPrimaryLogFile() const;

   void SetPrimaryLogLevel(logging::LogLevel level);
   logging::LogLevel GetPrimaryLogLevel() const;

   LogFileHandle AddSecondaryLogFile(logging::LogLevel level,
         const std::string& filename, bool truncate = true);
   void RemoveSecondaryLogFile(LogFileHandle handle);

   // Sinks not managed through files (e.g. capturing sinks in tests)
   void AddSink(std::shared_ptr<logging::LogSink> sink,
         logging::LogLevel minLevel = logging::LogLevelTrace);
   void RemoveSink(std::shared_ptr<logging::LogSink> sink);

   logging::Logger NewLogger(const std::string& label);

private:
   std::shared_ptr<logging::LogSink> OpenFile(const std::string& filename,
         bool truncate, const char* role);
   void Install(LogFileHandle handle, const Destination& destination,
         logging::LogLevel level);
   void Uninstall(LogFileHandle handle);
};

/**
 * Parse "trace", "debug", "info", "warning", "error" or "fatal".
 * Throws SeqError (SIMSEQERR_ConfigurationError) otherwise.
 */
logging::LogLevel LogLevelFromString(const std::string& name);
const char* StringForLogLevel(logging::LogLevel level);

} // namespace simseq
