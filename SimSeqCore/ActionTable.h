///////////////////////////////////////////////////////////////////////////////
// FILE:          ActionTable.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Time-ordered ledger of scheduled resource commands
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

#include "ActionPayload.h"
#include "ResourceHandle.h"

#include "../SimSeqDevice/SimSeqTime.h"

#include <map>
#include <vector>

namespace simseq {

struct ActionEntry
{
   Time timestamp;
   ResourceHandle target;
   ActionPayload payload;

   ActionEntry(Time t, ResourceHandle h, const ActionPayload& p) :
      timestamp(t),
      target(h),
      payload(p)
   {}

   bool operator==(const ActionEntry& rhs) const
   {
      return timestamp == rhs.timestamp && target == rhs.target &&
         payload == rhs.payload;
   }
   bool operator!=(const ActionEntry& rhs) const { return !(*this == rhs); }
};


/**
 * Append-only list of (time, resource, command) entries.
 *
 * Per resource, timestamps never decrease in append order; entries for
 * different resources interleave freely. Each entry records how long its
 * target stays busy afterwards, which is what GetEarliestAvailable()
 * reports.
 *
 * Seal() stable-sorts the entries by timestamp (ties keep append order) and
 * freezes the table. The sealed table is what is handed to the executor.
 */
class ActionTable
{
public:
   ActionTable() : sealed_(false) {}

   /**
    * Throws SeqError with SIMSEQERR_OutOfOrder if timestamp is earlier than
    * the last entry already appended for the same target, and
    * SIMSEQERR_TableSealed after Seal().
    */
   void Append(Time timestamp, ResourceHandle target,
         const ActionPayload& payload, Time busyDuration = Time());

   /**
    * Timestamp of the last entry for target plus that entry's busy
    * duration; zero for a resource without entries.
    */
   Time GetEarliestAvailable(ResourceHandle target) const;

   const std::vector<ActionEntry>& GetEntries() const { return entries_; }
   std::vector<ActionEntry> GetEntriesFor(ResourceHandle target) const;
   std::size_t Size() const { return entries_.size(); }
   bool IsEmpty() const { return entries_.empty(); }

   void Seal();
   bool IsSealed() const { return sealed_; }

   /**
    * Total duration of one run of the table (the executor repeats the
    * table with this period). Never decreases; always at least the last
    * timestamp.
    */
   void ExtendDuration(Time t);
   Time GetDuration() const;

private:
   struct ResourceState
   {
      Time lastTimestamp;
      Time busyUntil;
   };

   std::vector<ActionEntry> entries_;
   std::map<ResourceHandle, ResourceState> resourceStates_;
   Time duration_;
   bool sealed_;
};

} // namespace simseq
