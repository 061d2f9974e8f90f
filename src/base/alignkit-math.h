// base/alignkit-math.h

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

#ifndef ALIGNKIT_BASE_ALIGNKIT_MATH_H_
#define ALIGNKIT_BASE_ALIGNKIT_MATH_H_ 1

#include <cmath>
#include <cstdlib>
#include <limits>

#include "base/alignkit-types.h"
#include "base/alignkit-error.h"

#define ALIGNKIT_ISFINITE(x) std::isfinite(x)

namespace alignkit {

/// Per-thread generator state.  Each worker thread that needs random numbers
/// should own one; calls with state == NULL share a global generator under
/// a lock.
struct RandomState {
  RandomState();
  unsigned seed;
};

/// Returns a value in [0, RAND_MAX].
int Rand(RandomState *state = NULL);

/// Returns a value in [first, last]; the distribution is only approximately
/// uniform.
int32 RandInt(int32 first, int32 last, RandomState *state = NULL);

/// Returns true with probability "prob".
bool WithProb(BaseFloat prob, RandomState *state = NULL);

/// Returns a value in the open interval (0, 1).
inline float RandUniform(RandomState *state = NULL) {
  return static_cast<float>((Rand(state) + 1.0) / (RAND_MAX + 2.0));
}

/// True if |a - b| <= relative_tolerance * (|a| + |b|).  Equal infinities
/// compare equal; NaN never does.
inline bool ApproxEqual(double a, double b,
                        double relative_tolerance = 0.001) {
  if (a == b) return true;
  double diff = std::abs(a - b);
  if (!std::isfinite(diff)) return false;
  return diff <= relative_tolerance * (std::abs(a) + std::abs(b));
}

inline void AssertEqual(double a, double b,
                        double relative_tolerance = 0.001) {
  ALIGNKIT_ASSERT(ApproxEqual(a, b, relative_tolerance));
}

/// Rounds half away from zero.
inline int64 RoundToInt64(double x) {
  return static_cast<int64>(std::llround(x));
}

/// Index of the sample nearest to time "seconds" at "samp_freq" Hz.  Not
/// clamped to the length of any signal.
inline int64 SecondsToSample(double seconds, BaseFloat samp_freq) {
  return RoundToInt64(seconds * samp_freq);
}

inline double SampleToSeconds(int64 sample, BaseFloat samp_freq) {
  return sample / static_cast<double>(samp_freq);
}

}  // namespace alignkit

#endif  // ALIGNKIT_BASE_ALIGNKIT_MATH_H_
