///////////////////////////////////////////////////////////////////////////////
// FILE:          PatternClientRegistry.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Pattern-generator clients attached to executor groups
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

#include "ResourceHandle.h"

#include <map>
#include <string>
#include <vector>

namespace simseq {

/**
 * Per-group list of attached analog clients, in attachment order.
 *
 * Attachment can change between runs, so the planner reads it at the start
 * of every Generate() rather than caching it.
 */
class PatternClientRegistry
{
public:
   // Attaching a client already in the group has no effect
   void Attach(const std::string& group, ResourceHandle client);
   // Returns false if the client was not attached to the group
   bool Detach(const std::string& group, ResourceHandle client);

   // Empty for unknown groups
   std::vector<ResourceHandle> GetClients(const std::string& group) const;
   std::vector<std::string> GetGroupNames() const;

private:
   std::map<std::string, std::vector<ResourceHandle>> groups_;
};

} // namespace simseq
