///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceRegistry.cpp
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

#include "DeviceRegistry.h"

namespace simseq {

ResourceHandle
DeviceRegistry::Register(std::shared_ptr<Resource> resource)
{
   if (!resource)
      throw SeqError("Cannot register a null resource",
            SIMSEQERR_ConfigurationError);

   const std::string& label = resource->GetLabel();
   if (label.empty())
      throw SeqError("Cannot register a resource with an empty label",
            SIMSEQERR_ConfigurationError);
   if (HasLabel(label))
      throw SeqError("The label " + ToQuotedString(label) +
            " is already in use", SIMSEQERR_DuplicateLabel);

   int ret = resource->Initialize();
   if (ret != SIMSEQ_OK)
      throw SeqError("Failed to initialize resource " +
            ToQuotedString(label) + " (device status " +
            std::to_string(ret) + ")", SIMSEQERR_ConfigurationError);

   resources_.push_back(resource);
   ResourceHandle handle(static_cast<unsigned>(resources_.size()));
   labelToHandle_.insert(std::make_pair(label, handle));
   return handle;
}


std::shared_ptr<Resource>
DeviceRegistry::GetResource(ResourceHandle handle) const
{
   if (!handle.IsValid() || handle.GetId() > resources_.size())
      throw SeqError("No resource with handle " +
            std::to_string(handle.GetId()), SIMSEQERR_NoSuchResource);
   return resources_[handle.GetId() - 1];
}


ResourceHandle
DeviceRegistry::GetHandle(const std::string& label) const
{
   std::map<std::string, ResourceHandle>::const_iterator it =
      labelToHandle_.find(label);
   if (it == labelToHandle_.end())
      throw SeqError("No resource with label " + ToQuotedString(label),
            SIMSEQERR_NoSuchResource);
   return it->second;
}


bool
DeviceRegistry::HasLabel(const std::string& label) const
{
   return labelToHandle_.count(label) > 0;
}


std::string
DeviceRegistry::GetLabel(ResourceHandle handle) const
{
   return GetResource(handle)->GetLabel();
}


ResourceType
DeviceRegistry::GetType(ResourceHandle handle) const
{
   return GetResource(handle)->GetType();
}


std::vector<ResourceHandle>
DeviceRegistry::GetHandles() const
{
   std::vector<ResourceHandle> handles;
   handles.reserve(resources_.size());
   for (unsigned i = 1; i <= resources_.size(); ++i)
      handles.push_back(ResourceHandle(i));
   return handles;
}


std::vector<ResourceHandle>
DeviceRegistry::GetHandlesOfType(ResourceType type) const
{
   std::vector<ResourceHandle> handles;
   for (unsigned i = 1; i <= resources_.size(); ++i)
   {
      if (resources_[i - 1]->GetType() == type)
         handles.push_back(ResourceHandle(i));
   }
   return handles;
}

} // namespace simseq
