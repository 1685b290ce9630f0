///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.h
// PROJECT:       SimSeq
// SUBSYSTEM:     SimSeqCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Error codes carried by SeqError
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

#define SIMSEQERR_OK                       0
#define SIMSEQERR_GENERIC                  1 // unspecified error
#define SIMSEQERR_ConfigurationError       2
#define SIMSEQERR_OutOfOrder               3
#define SIMSEQERR_UnavailableTiming        4
#define SIMSEQERR_TimeUnderflow            5
#define SIMSEQERR_NoSuchResource           6
#define SIMSEQERR_MissingCapability        7
#define SIMSEQERR_DuplicateLabel           8
#define SIMSEQERR_TableSealed              9
#define SIMSEQERR_PlannerReused           10
#define SIMSEQERR_CannotOpenFile          11
#define SIMSEQERR_InvalidConfigFile       12
#define SIMSEQERR_TimeOverflow            13
