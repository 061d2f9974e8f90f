// base/alignkit-utils.h

// Copyright 2009-2011  Microsoft Corporation
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

#ifndef ALIGNKIT_BASE_ALIGNKIT_UTILS_H_
#define ALIGNKIT_BASE_ALIGNKIT_UTILS_H_ 1

#include <cstdlib>

namespace alignkit {

/// Blocks the calling thread for "seconds", which may be fractional.
void Sleep(double seconds);

}  // namespace alignkit

// Put in the private section of classes that own a file or a thread.
#define ALIGNKIT_DISALLOW_COPY_AND_ASSIGN(type)  \
  type(const type&) = delete;                   \
  type &operator = (const type&) = delete

// Base-10 integer and floating point conversion, used by the text parsers.
#define ALIGNKIT_STRTOLL(cur_cstr, end_cstr) strtoll(cur_cstr, end_cstr, 10)
#define ALIGNKIT_STRTOD(cur_cstr, end_cstr) strtod(cur_cstr, end_cstr)

#endif  // ALIGNKIT_BASE_ALIGNKIT_UTILS_H_
