// base/timer.h

// Copyright 2026  Alignkit Authors

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

#ifndef ALIGNKIT_BASE_TIMER_H_
#define ALIGNKIT_BASE_TIMER_H_

#include <chrono>

namespace alignkit {

/// Wall-clock stopwatch for the "Time taken" summaries of the programs.
/// Uses a monotonic clock, so it is unaffected by changes to the system time.
class Timer {
 public:
  Timer() { Reset(); }

  void Reset() { start_ = std::chrono::steady_clock::now(); }

  /// Seconds since construction or the last Reset().
  double Elapsed() const {
    std::chrono::duration<double> d = std::chrono::steady_clock::now() - start_;
    return d.count();
  }

 private:
  std::chrono::steady_clock::time_point start_;
};

}  // namespace alignkit

#endif  // ALIGNKIT_BASE_TIMER_H_
