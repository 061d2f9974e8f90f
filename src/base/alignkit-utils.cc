// base/alignkit-utils.cc

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

#include <chrono>
#include <thread>

#include "base/alignkit-utils.h"

namespace alignkit {

void Sleep(double seconds) {
  if (seconds <= 0.0)
    return;
  std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

}  // namespace alignkit
