// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//
// DESCRIPTION:   Log entry filters and sinks
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

#include <exception>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>


namespace simseq
{
namespace logging
{

namespace internal
{

// Split entry text into lines. "\r\n", "\r" and "\n" all end a line;
// trailing line endings do not produce empty lines, but an empty entry
// yields one empty line.
std::vector<std::string> SplitEntryIntoLines(const std::string& text);

// Write an entry as one or more lines:
//    yyyy-mm-ddThh:mm:ss.uuuuuu tid<id> [LVL,component] first line
//                                       [                ] next line
void FormatEntry(std::ostream& stream, const Metadata& metadata,
      const std::string& text);

const char* LevelString(LogLevel level);

} // namespace internal


/**
 * Destination for log entries.
 *
 * LoggingCore applies each sink's minimum level and serializes calls to
 * Consume(), so implementations need no locking of their own.
 */
class LogSink
{
public:
   virtual ~LogSink() {}

   virtual void Consume(const Metadata& metadata, const std::string& text) = 0;
};


class StdErrLogSink : public LogSink
{
public:
   void Consume(const Metadata& metadata, const std::string& text) override;
};


class CannotOpenFileException : public std::exception
{
public:
   const char* what() const noexcept override
   { return "Cannot open log file"; }
};


class FileLogSink : public LogSink
{
   std::string filename_;
   std::ofstream fileStream_;

public:
   // Throws CannotOpenFileException
   FileLogSink(const std::string& filename, bool append = false);
   ~FileLogSink();

   const std::string& GetFilename() const { return filename_; }
   void Consume(const Metadata& metadata, const std::string& text) override;
};

} // namespace logging
} // namespace simseq
