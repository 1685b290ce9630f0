///////////////////////////////////////////////////////////////////////////////
// FILE:          PatternClientRegistry.cpp
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

#include "PatternClientRegistry.h"

#include <algorithm>

namespace simseq {

void
PatternClientRegistry::Attach(const std::string& group, ResourceHandle client)
{
   std::vector<ResourceHandle>& clients = groups_[group];
   if (std::find(clients.begin(), clients.end(), client) == clients.end())
      clients.push_back(client);
}


bool
PatternClientRegistry::Detach(const std::string& group, ResourceHandle client)
{
   std::map<std::string, std::vector<ResourceHandle>>::iterator it =
      groups_.find(group);
   if (it == groups_.end())
      return false;

   std::vector<ResourceHandle>& clients = it->second;
   std::vector<ResourceHandle>::iterator found =
      std::find(clients.begin(), clients.end(), client);
   if (found == clients.end())
      return false;
   clients.erase(found);
   return true;
}


std::vector<ResourceHandle>
PatternClientRegistry::GetClients(const std::string& group) const
{
   std::map<std::string, std::vector<ResourceHandle>>::const_iterator it =
      groups_.find(group);
   if (it == groups_.end())
      return std::vector<ResourceHandle>();
   return it->second;
}


std::vector<std::string>
PatternClientRegistry::GetGroupNames() const
{
   std::vector<std::string> names;
   for (const auto& group : groups_)
      names.push_back(group.first);
   return names;
}

} // namespace simseq
