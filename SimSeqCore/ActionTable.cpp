///////////////////////////////////////////////////////////////////////////////
// FILE:          ActionTable.cpp
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
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

#include "ActionTable.h"

#include "Error.h"

#include <algorithm>

namespace simseq {

void
ActionTable::Append(Time timestamp, ResourceHandle target,
      const ActionPayload& payload, Time busyDuration)
{
   if (sealed_)
      throw SeqError("Cannot append to a sealed action table",
            SIMSEQERR_TableSealed);

   std::map<ResourceHandle, ResourceState>::iterator it =
      resourceStates_.find(target);
   if (it != resourceStates_.end() && timestamp < it->second.lastTimestamp)
   {
      throw SeqError("Out-of-order append for resource " +
            std::to_string(target.GetId()) + ": " + payload.ToString() +
            " at " + timestamp.ToString() + " ms precedes the entry at " +
            it->second.lastTimestamp.ToString() + " ms",
            SIMSEQERR_OutOfOrder);
   }

   entries_.push_back(ActionEntry(timestamp, target, payload));

   ResourceState& state = resourceStates_[target];
   state.lastTimestamp = timestamp;
   state.busyUntil = timestamp + busyDuration;
}


Time
ActionTable::GetEarliestAvailable(ResourceHandle target) const
{
   std::map<ResourceHandle, ResourceState>::const_iterator it =
      resourceStates_.find(target);
   if (it == resourceStates_.end())
      return Time::Zero();
   return it->second.busyUntil;
}


std::vector<ActionEntry>
ActionTable::GetEntriesFor(ResourceHandle target) const
{
   std::vector<ActionEntry> result;
   for (const ActionEntry& entry : entries_)
   {
      if (entry.target == target)
         result.push_back(entry);
   }
   return result;
}


void
ActionTable::Seal()
{
   if (sealed_)
      return;
   std::stable_sort(entries_.begin(), entries_.end(),
         [](const ActionEntry& a, const ActionEntry& b)
         { return a.timestamp < b.timestamp; });
   sealed_ = true;
}


void
ActionTable::ExtendDuration(Time t)
{
   if (sealed_)
      throw SeqError("Cannot change the duration of a sealed action table",
            SIMSEQERR_TableSealed);
   duration_ = Time::Max(duration_, t);
}


Time
ActionTable::GetDuration() const
{
   Time last;
   for (const ActionEntry& entry : entries_)
      last = Time::Max(last, entry.timestamp);
   return Time::Max(duration_, last);
}

} // namespace simseq
