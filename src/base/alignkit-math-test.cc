// base/alignkit-math-test.cc
// Copyright 2009-2011  Microsoft Corporation;  Yanmin Qian;  Jan Silovsky
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
#include <iostream>

#include "base/alignkit-math.h"
#include "base/timer.h"

namespace alignkit {

void UnitTestRand() {
  // Testing random-number generation.
  std::cout << "Testing random-number generation.  "
            << "If there is an error this may not terminate.\n";
  for (int i = 1; i < 10; i++) {
    {  // test RandUniform.
      ALIGNKIT_ASSERT(RandUniform() >= 0 && RandUniform() <= 1);
      float sum = RandUniform()-0.5;
      for (int j = 0; ; j++) {
        sum += RandUniform()-0.5;
        if (std::abs(sum) < 0.5*sqrt((double)j)) break;
      }
    }
    {  // test RandInt().
      ALIGNKIT_ASSERT(RandInt(0, 3) >= 0 && RandInt(0, 3) <= 3);
      int minint = rand() % 200;
      int maxint = minint + 1 + rand()  % 20;

      float sum = RandInt(minint, maxint) +  0.5*(minint+maxint);
      for (int j = 0; ; j++) {
        sum += RandInt(minint, maxint) - 0.5*(minint+maxint);
        if (std::abs((float)sum) < 0.5*sqrt((double)j)*(maxint-minint)) break;
      }
    }
    {  // test RandomState.
      RandomState state;
      int32 r = RandInt(5, 9, &state);
      ALIGNKIT_ASSERT(r >= 5 && r <= 9);
    }
  }
  ALIGNKIT_ASSERT(!WithProb(0.0) && WithProb(1.0));
}

void UnitTestApproxEqual() {
  ALIGNKIT_ASSERT(ApproxEqual(1.0, 1.0005));
  ALIGNKIT_ASSERT(!ApproxEqual(1.0, 1.1));
  ALIGNKIT_ASSERT(ApproxEqual(std::numeric_limits<double>::infinity(),
                              std::numeric_limits<double>::infinity()));
  ALIGNKIT_ASSERT(!ApproxEqual(std::numeric_limits<double>::quiet_NaN(), 1.0));
}

void UnitTestRoundToInt64() {
  ALIGNKIT_ASSERT(RoundToInt64(0.5 * 16000) == 8000);
  ALIGNKIT_ASSERT(RoundToInt64(2.0 * 16000) == 32000);
  ALIGNKIT_ASSERT(RoundToInt64(0.49999) == 0);
  ALIGNKIT_ASSERT(RoundToInt64(2.5) == 3);
  ALIGNKIT_ASSERT(RoundToInt64(0.0) == 0);
}

void UnitTestSampleConversion() {
  ALIGNKIT_ASSERT(SecondsToSample(0.5, 16000) == 8000);
  ALIGNKIT_ASSERT(SecondsToSample(1.2, 16000) == 19200);
  ALIGNKIT_ASSERT(SecondsToSample(0.0, 22050) == 0);
  // 1/44100 s rounds to exactly one sample.
  ALIGNKIT_ASSERT(SecondsToSample(1.0 / 44100, 44100) == 1);
  AssertEqual(SampleToSeconds(24000, 16000), 1.5);
  ALIGNKIT_ASSERT(SampleToSeconds(0, 8000) == 0.0);
}

void UnitTestTimer() {
  Timer timer;
  Sleep(0.05);
  double elapsed = timer.Elapsed();
  ALIGNKIT_ASSERT(elapsed >= 0.04 && elapsed < 5.0);
}

}  // end namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestRand();
  UnitTestApproxEqual();
  UnitTestRoundToInt64();
  UnitTestSampleConversion();
  UnitTestTimer();
  std::cout << "Test OK.\n";
}
