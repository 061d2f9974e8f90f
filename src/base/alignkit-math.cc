// base/alignkit-math.cc

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

#include <stdlib.h>

#include <mutex>

#include "base/alignkit-math.h"

namespace alignkit {

// rand() is not thread safe.
static std::mutex global_rand_mutex;

int Rand(RandomState *state) {
  if (state != NULL)
    return rand_r(&state->seed);
  std::lock_guard<std::mutex> lock(global_rand_mutex);
  return rand();
}

// The offset keeps rand_r() seeded from rand() from repeating the sequence
// of the global generator on some C libraries.
RandomState::RandomState(): seed(Rand() + 27437) { }

bool WithProb(BaseFloat prob, RandomState *state) {
  // Slightly more than 1.0 is allowed, from roundoff.
  ALIGNKIT_ASSERT(prob >= 0 && prob <= 1.1);
  if (prob <= 0.0) return false;
  if (prob >= 1.0) return true;
  // Very small probabilities are resolved in two steps, since prob * RAND_MAX
  // would be too coarse.
  if (prob * RAND_MAX < 128.0)
    return Rand(state) < RAND_MAX / 128 && WithProb(prob * 128.0, state);
  return Rand(state) < (RAND_MAX + 1.0) * prob;
}

int32 RandInt(int32 first, int32 last, RandomState *state) {
  ALIGNKIT_ASSERT(last >= first);
  if (first == last) return first;
  int32 range = last - first + 1;
  return first + static_cast<int32>(Rand(state)) % range;
}

}  // namespace alignkit
