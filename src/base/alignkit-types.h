// base/alignkit-types.h

// Copyright 2009-2011  Microsoft Corporation;  Saarland University
//           2026       Alignkit Authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#ifndef ALIGNKIT_BASE_ALIGNKIT_TYPES_H_
#define ALIGNKIT_BASE_ALIGNKIT_TYPES_H_ 1

#include <stdint.h>

namespace alignkit {

// Precision of audio samples and of option values given in seconds.
// Times inside alignment records are always double.
#if (ALIGNKIT_DOUBLEPRECISION != 0)
typedef double BaseFloat;
#else
typedef float BaseFloat;
#endif

// Fixed-width integer names, as OpenFst used to provide them.
typedef int8_t int8;
typedef int16_t int16;
typedef int32_t int32;
typedef int64_t int64;
typedef uint8_t uint8;
typedef uint16_t uint16;
typedef uint32_t uint32;
typedef uint64_t uint64;

}  // namespace alignkit

#endif  // ALIGNKIT_BASE_ALIGNKIT_TYPES_H_
