///////////////////////////////////////////////////////////////////////////////
// FILE:          ResourceHandle.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Opaque identifier of a registered resource
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

namespace simseq {

class DeviceRegistry;

/**
 * Identifies a resource within one DeviceRegistry.
 *
 * Handles are issued by the registry in registration order, starting at 1.
 * A default-constructed handle is invalid.
 */
class ResourceHandle
{
   friend class DeviceRegistry;

   unsigned id_;

   explicit ResourceHandle(unsigned id) : id_(id) {}

public:
   ResourceHandle() : id_(0) {}

   bool IsValid() const { return id_ != 0; }
   unsigned GetId() const { return id_; }

   bool operator==(const ResourceHandle& rhs) const { return id_ == rhs.id_; }
   bool operator!=(const ResourceHandle& rhs) const { return id_ != rhs.id_; }
   bool operator<(const ResourceHandle& rhs) const { return id_ < rhs.id_; }
};

} // namespace simseq
