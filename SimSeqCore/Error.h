///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Exception class for core errors
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

#include "ErrorCodes.h"

#include <exception>
#include <memory>
#include <string>

namespace simseq {

/// Core error class. Exceptions thrown by the core are of this type.
/**
 * Errors may be chained: an error raised while handling another (e.g. a
 * configuration error caused by a timing query that could not be answered)
 * keeps the original as its underlying error.
 */
class SeqError : public std::exception
{
public:
   typedef int Code;

   /// Construct with a message and (optionally) an error code.
   SeqError(const std::string& msg, Code code = SIMSEQERR_GENERIC);

   /// Construct with a message, an error code and an underlying error.
   SeqError(const std::string& msg, Code code, const SeqError& underlyingError);

   /// Construct with a message and an underlying error, keeping the
   /// underlying error's code as the specific code.
   SeqError(const std::string& msg, const SeqError& underlyingError);

   SeqError(const SeqError& other);
   SeqError& operator=(const SeqError& rhs);

   virtual ~SeqError() noexcept {}

   /// Implements std::exception interface.
   virtual const char* what() const noexcept { return message_.c_str(); }

   /// Get the error message for this error.
   virtual std::string GetMsg() const;

   /// Get a message containing the messages from all chained errors.
   virtual std::string GetFullMsg() const;

   /// Get the error code for this error.
   virtual Code GetCode() const { return code_; }

   /// Get the first specific (non-generic) code in the chain.
   virtual Code GetSpecificCode() const;

   /// Access the underlying error, or nullptr if there is none.
   virtual const SeqError* GetUnderlyingError() const;

private:
   std::string message_;
   Code code_;
   std::unique_ptr<SeqError> underlying_;
};

} // namespace simseq
