///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceRegistry.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Resources taking part in one experiment run
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

#include "CoreUtils.h"
#include "Error.h"
#include "ResourceHandle.h"

#include "../SimSeqDevice/SimSeqDevice.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace simseq {

/**
 * Owns the resources of one run and maps labels to handles.
 *
 * The registry is passed explicitly to whoever needs it; there is no
 * process-wide device directory.
 */
class DeviceRegistry
{
public:
   DeviceRegistry() {}

   DeviceRegistry(const DeviceRegistry&) = delete;
   DeviceRegistry& operator=(const DeviceRegistry&) = delete;

   /**
    * Add a resource. Initialize() is called on it; a failing initialization
    * or a label already in use is a configuration error.
    */
   ResourceHandle Register(std::shared_ptr<Resource> resource);

   std::shared_ptr<Resource> GetResource(ResourceHandle handle) const;
   ResourceHandle GetHandle(const std::string& label) const;
   bool HasLabel(const std::string& label) const;
   std::string GetLabel(ResourceHandle handle) const;
   ResourceType GetType(ResourceHandle handle) const;

   // Handles in registration order
   std::vector<ResourceHandle> GetHandles() const;
   std::vector<ResourceHandle> GetHandlesOfType(ResourceType type) const;

   std::size_t Size() const { return resources_.size(); }

   /**
    * Capability interface (Exposable, Positionable, ...) of a resource.
    * Throws SIMSEQERR_MissingCapability if the resource lacks it.
    */
   template <class TCapability>
   std::shared_ptr<TCapability> GetCapability(ResourceHandle handle) const
   {
      std::shared_ptr<Resource> resource = GetResource(handle);
      std::shared_ptr<TCapability> capability =
         std::dynamic_pointer_cast<TCapability>(resource);
      if (!capability)
         throw SeqError("Resource " + ToQuotedString(resource->GetLabel()) +
               " (" + ToString(resource->GetType()) +
               ") lacks the required capability",
               SIMSEQERR_MissingCapability);
      return capability;
   }

   template <class TCapability>
   bool HasCapability(ResourceHandle handle) const
   {
      return std::dynamic_pointer_cast<TCapability>(GetResource(handle)) !=
         nullptr;
   }

private:
   std::vector<std::shared_ptr<Resource>> resources_;
   std::map<std::string, ResourceHandle> labelToHandle_;
};

} // namespace simseq
