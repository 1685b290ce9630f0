///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.cpp
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

#include "Error.h"

namespace simseq {

SeqError::SeqError(const std::string& msg, Code code) :
   message_(msg),
   code_(code)
{}


SeqError::SeqError(const std::string& msg, Code code,
      const SeqError& underlyingError) :
   message_(msg),
   code_(code),
   underlying_(new SeqError(underlyingError))
{}


SeqError::SeqError(const std::string& msg, const SeqError& underlyingError) :
   message_(msg),
   code_(SIMSEQERR_GENERIC),
   underlying_(new SeqError(underlyingError))
{}


SeqError::SeqError(const SeqError& other) :
   std::exception(other),
   message_(other.message_),
   code_(other.code_),
   underlying_(other.underlying_ ? new SeqError(*other.underlying_) : nullptr)
{}


SeqError&
SeqError::operator=(const SeqError& rhs)
{
   if (this == &rhs)
      return *this;
   message_ = rhs.message_;
   code_ = rhs.code_;
   underlying_.reset(rhs.underlying_ ? new SeqError(*rhs.underlying_) : nullptr);
   return *this;
}


std::string
SeqError::GetMsg() const
{
   if (!message_.empty())
      return message_;
   if (code_ == SIMSEQERR_OK)
      return "No error";
   return "Error (code " + std::to_string(code_) + ")";
}


std::string
SeqError::GetFullMsg() const
{
   if (underlying_)
      return GetMsg() + " [ " + underlying_->GetFullMsg() + " ]";
   return GetMsg();
}


SeqError::Code
SeqError::GetSpecificCode() const
{
   if (code_ != SIMSEQERR_GENERIC)
      return code_;
   if (underlying_)
      return underlying_->GetSpecificCode();
   return SIMSEQERR_GENERIC;
}


const SeqError*
SeqError::GetUnderlyingError() const
{
   return underlying_.get();
}

} // namespace simseq
