///////////////////////////////////////////////////////////////////////////////
// FILE:          SimSeqTime.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqDevice - Device descriptor kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Exact, non-negative experiment time
//
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

#pragma once

#include <limits>
#include <stdexcept>
#include <string>

namespace simseq {

/**
 * Thrown when a subtraction would produce a negative Time.
 */
class TimeUnderflow : public std::underflow_error
{
public:
   explicit TimeUnderflow(const std::string& what) :
      std::underflow_error(what)
   {}
};


/**
 * Thrown when a sum or conversion exceeds the representable range
 * (about 292 000 years).
 */
class TimeOverflow : public std::overflow_error
{
public:
   explicit TimeOverflow(const std::string& what) :
      std::overflow_error(what)
   {}
};


/**
 * Milliseconds since experiment start, stored as an integer count of
 * microseconds.
 *
 * Values are never negative. Sums of any number of Times are exact, so a
 * schedule computed twice from the same inputs is bit-identical.
 */
class Time
{
   long long microseconds_;

   explicit Time(long long us, int) : microseconds_(us) {}

   static long long CheckedSum(long long a, long long b)
   {
      if (a > std::numeric_limits<long long>::max() - b)
         throw TimeOverflow("Time addition overflow: " +
               Time(a, 0).ToString() + " + " + Time(b, 0).ToString());
      return a + b;
   }

public:
   Time() : microseconds_(0LL) {}

   static Time Zero() { return Time(); }

   static Time FromUs(long long us)
   {
      if (us < 0)
         throw std::invalid_argument("Time cannot be negative");
      return Time(us, 0);
   }

   static Time FromMs(long long ms)
   {
      if (ms < 0)
         throw std::invalid_argument("Time cannot be negative");
      if (ms > std::numeric_limits<long long>::max() / 1000LL)
         throw TimeOverflow("Time out of range: " + std::to_string(ms) +
               " ms");
      return Time(ms * 1000LL, 0);
   }

   // The only entry points from floating point. Used once, where a value
   // comes out of configuration or a motion estimate; everything downstream
   // is integer arithmetic.
   static Time FromUsRounded(double us);
   static Time FromMsRounded(double ms) { return FromUsRounded(ms * 1000.0); }

   /**
    * Parse decimal milliseconds ("65", "0.5", "12.125").
    *
    * At most three fractional digits are accepted (the resolution is one
    * microsecond). Throws std::invalid_argument on malformed input.
    */
   static Time Parse(const std::string& decimalMs);

   // Both throw TimeOverflow instead of wrapping
   Time operator+(const Time& other) const
   {
      return Time(CheckedSum(microseconds_, other.microseconds_), 0);
   }

   Time& operator+=(const Time& other)
   {
      microseconds_ = CheckedSum(microseconds_, other.microseconds_);
      return *this;
   }

   // Throws TimeUnderflow if other > *this
   Time operator-(const Time& other) const
   {
      if (other.microseconds_ > microseconds_)
         throw TimeUnderflow("Time subtraction underflow: " + ToString() +
               " - " + other.ToString());
      return Time(microseconds_ - other.microseconds_, 0);
   }

   bool operator>(const Time& other) const
   {
      return microseconds_ > other.microseconds_;
   }

   bool operator>=(const Time& other) const
   {
      return microseconds_ >= other.microseconds_;
   }

   bool operator<(const Time& other) const
   {
      return microseconds_ < other.microseconds_;
   }

   bool operator<=(const Time& other) const
   {
      return microseconds_ <= other.microseconds_;
   }

   bool operator==(const Time& other) const
   {
      return microseconds_ == other.microseconds_;
   }

   bool operator!=(const Time& other) const
   {
      return !(*this == other);
   }

   long long GetUs() const { return microseconds_; }

   // Rounded half up to whole milliseconds, for executors that only take
   // integer milliseconds
   long long GetMsRounded() const
   {
      return microseconds_ / 1000LL + (microseconds_ % 1000LL >= 500LL ? 1 : 0);
   }

   /**
    * Decimal milliseconds with exactly three fractional digits ("65.000").
    */
   std::string ToString() const;

   static Time Max(const Time& a, const Time& b) { return a < b ? b : a; }
};

} // namespace simseq
