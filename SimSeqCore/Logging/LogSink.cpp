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

#include "LogSink.h"

#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>


namespace simseq
{
namespace logging
{
namespace internal
{

namespace
{

std::string
FormatTimestamp(Metadata::TimePoint tp)
{
   using namespace std::chrono;
   const auto sinceEpoch = duration_cast<microseconds>(tp.time_since_epoch());
   const auto wholeSecs = duration_cast<seconds>(sinceEpoch);
   const long fracUs = static_cast<long>((sinceEpoch - wholeSecs).count());

   std::time_t t(wholeSecs.count());
   std::tm tmstruct;
#ifdef _WIN32
   localtime_s(&tmstruct, &t);
#else
   localtime_r(&t, &tmstruct);
#endif

   char buf[40];
   std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S",
         &tmstruct);
   std::snprintf(buf + len, sizeof(buf) - len, ".%06ld", fracUs);
   return buf;
}

} // anonymous namespace


const char*
LevelString(LogLevel level)
{
   switch (level)
   {
      case LogLevelTrace: return "trc";
      case LogLevelDebug: return "dbg";
      case LogLevelInfo: return "IFO";
      case LogLevelWarning: return "WRN";
      case LogLevelError: return "ERR";
      case LogLevelFatal: return "FTL";
   }
   return "???";
}


std::vector<std::string>
SplitEntryIntoLines(const std::string& text)
{
   std::vector<std::string> lines;
   std::string current;
   for (std::string::size_type i = 0; i < text.size(); ++i)
   {
      const char ch = text[i];
      if (ch == '\r' || ch == '\n')
      {
         lines.push_back(current);
         current.clear();
         if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            ++i;
      }
      else
      {
         current += ch;
      }
   }
   if (!current.empty())
      lines.push_back(current);

   // Trailing blank lines carry no information
   while (lines.size() > 1 && lines.back().empty())
      lines.pop_back();
   if (lines.empty())
      lines.push_back(std::string());
   return lines;
}


void
FormatEntry(std::ostream& stream, const Metadata& metadata,
      const std::string& text)
{
   std::ostringstream tid;
   tid << metadata.GetThreadId();

   std::string prefix = FormatTimestamp(metadata.GetTimestamp());
   prefix += " tid" + tid.str() + ' ';
   const std::string::size_type open = prefix.size();
   prefix += '[';
   prefix += LevelString(metadata.GetLevel());
   prefix += ',';
   prefix += metadata.GetComponent();
   const std::string::size_type close = prefix.size();
   prefix += ']';

   std::string continuation(close + 1, ' ');
   continuation[open] = '[';
   continuation[close] = ']';

   const std::vector<std::string> lines = SplitEntryIntoLines(text);
   for (std::vector<std::string>::size_type i = 0; i < lines.size(); ++i)
   {
      stream << (i == 0 ? prefix : continuation);
      if (!lines[i].empty())
         stream << ' ' << lines[i];
      stream << '\n';
   }
}

} // namespace internal


void
StdErrLogSink::Consume(const Metadata& metadata, const std::string& text)
{
   internal::FormatEntry(std::clog, metadata, text);
   std::clog.flush();
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename)
{
   std::ios_base::openmode mode = std::ios_base::out;
   mode |= (append ? std::ios_base::app : std::ios_base::trunc);

   fileStream_.open(filename_.c_str(), mode);
   if (!fileStream_)
      throw CannotOpenFileException();
}


FileLogSink::~FileLogSink()
{
   fileStream_.close();
}


void
FileLogSink::Consume(const Metadata& metadata, const std::string& text)
{
   internal::FormatEntry(fileStream_, metadata, text);
   fileStream_.flush();
}

} // namespace logging
} // namespace simseq
