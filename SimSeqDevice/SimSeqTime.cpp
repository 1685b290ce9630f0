///////////////////////////////////////////////////////////////////////////////
// FILE:          SimSeqTime.cpp
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqDevice - Device descriptor kit
//-----------------------------------------------------------------------------
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "SimSeqTime.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace simseq {

Time
Time::FromUsRounded(double us)
{
   if (std::isnan(us))
      throw std::invalid_argument("Time cannot be NaN");
   if (us < 0.0)
      throw std::invalid_argument("Time cannot be negative");
   if (us >= static_cast<double>(std::numeric_limits<long long>::max()))
      throw std::invalid_argument("Time is out of range");
   return Time(std::llround(us), 0);
}


Time
Time::Parse(const std::string& decimalMs)
{
   const std::string invalid = "Invalid decimal time string: \"" +
      decimalMs + "\"";

   std::string::size_type pos = 0;
   const std::string::size_type len = decimalMs.size();
   if (pos < len && decimalMs[pos] == '+')
      ++pos;
   if (pos == len)
      throw std::invalid_argument(invalid);

   long long whole = 0;
   bool haveDigits = false;
   while (pos < len && std::isdigit(static_cast<unsigned char>(decimalMs[pos])))
   {
      if (whole > (std::numeric_limits<long long>::max() / 1000LL - 9) / 10)
         throw std::invalid_argument("Decimal time string out of range: \"" +
               decimalMs + "\"");
      whole = whole * 10 + (decimalMs[pos] - '0');
      haveDigits = true;
      ++pos;
   }

   long long fracUs = 0;
   if (pos < len && decimalMs[pos] == '.')
   {
      ++pos;
      int nFrac = 0;
      while (pos < len &&
            std::isdigit(static_cast<unsigned char>(decimalMs[pos])))
      {
         if (++nFrac > 3)
            throw std::invalid_argument(invalid);
         fracUs = fracUs * 10 + (decimalMs[pos] - '0');
         haveDigits = true;
         ++pos;
      }
      for (; nFrac < 3; ++nFrac)
         fracUs *= 10;
   }

   if (!haveDigits || pos != len)
      throw std::invalid_argument(invalid);

   return Time(whole * 1000LL + fracUs, 0);
}


std::string
Time::ToString() const
{
   long long ms = microseconds_ / 1000LL;
   long long fracUs = microseconds_ - ms * 1000LL;

   std::ostringstream s;
   s << ms << '.' << std::setfill('0') << std::right << std::setw(3) << fracUs;
   return s.str();
}

} // namespace simseq
