// align/silence-trimmer-test.cc

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

#include "align/silence-trimmer.h"

namespace alignkit {

// A wave whose sample i on channel c has the value 1000 * c + i, so the
// samples kept by trimming can be checked.
static WaveData RampWave(BaseFloat samp_freq, int64 num_samples,
                         int32 num_channels) {
  std::vector<std::vector<BaseFloat> > data(num_channels);
  for (int32 c = 0; c < num_channels; c++)
    for (int64 i = 0; i < num_samples; i++)
      data[c].push_back(static_cast<BaseFloat>(1000 * c + i % 1000));
  return WaveData(samp_freq, data);
}

static AlignmentRecord MakeRecord(double s1, double e1, double s2 = -1.0,
                                  double e2 = -1.0) {
  AlignmentRecord record;
  record.utt_id = "utt";
  record.words.push_back(WordSpan("one", s1, e1));
  if (s2 >= 0.0)
    record.words.push_back(WordSpan("two", s2, e2));
  return record;
}

void UnitTestBoundaries() {
  SilenceTrimmerOptions opts;
  opts.padding = 0.0;
  int64 begin = -1, end = -1;
  AlignmentRecord record = MakeRecord(0.5, 1.0, 1.2, 2.0);
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(record, 16000, 40000, opts,
                                        &begin, &end) == kTrimmed);
  ALIGNKIT_ASSERT(begin == 8000 && end == 32000);

  opts.padding = 0.1;
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(record, 16000, 40000, opts,
                                        &begin, &end) == kTrimmed);
  ALIGNKIT_ASSERT(begin == 6400 && end == 33600);

  // Padding is clamped to the audio.
  AlignmentRecord wide = MakeRecord(0.05, 2.45);
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(wide, 16000, 40000, opts,
                                        &begin, &end) == kTrimmed);
  ALIGNKIT_ASSERT(begin == 0 && end == 40000);

  // Word times beyond the end of the audio.
  AlignmentRecord late = MakeRecord(2.0, 3.0);
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(late, 16000, 40000, opts,
                                        &begin, &end) == kTrimmed);
  ALIGNKIT_ASSERT(begin == 30400 && end == 40000);

  AlignmentRecord outside = MakeRecord(3.0, 3.5);
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(outside, 16000, 40000, opts,
                                        &begin, &end) == kTrimSkippedEmpty);

  opts.padding = 0.0;
  AlignmentRecord short_record = MakeRecord(1.0, 1.2);
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(short_record, 16000, 40000, opts,
                                        &begin, &end) ==
                  kTrimSkippedTooShort);
  opts.min_duration = 0.15;
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(short_record, 16000, 40000, opts,
                                        &begin, &end) == kTrimmed);
  ALIGNKIT_ASSERT(begin == 16000 && end == 19200);

  AlignmentRecord unaligned;
  unaligned.utt_id = "empty";
  ALIGNKIT_ASSERT(ComputeTrimBoundaries(unaligned, 16000, 40000, opts,
                                        &begin, &end) ==
                  kTrimSkippedUnaligned);
}

void UnitTestTrimSilence() {
  SilenceTrimmerOptions opts;
  opts.padding = 0.0;
  WaveData wave = RampWave(16000, 40000, 2), trimmed;
  AlignmentRecord record = MakeRecord(0.5, 1.0, 1.2, 2.0);
  ALIGNKIT_ASSERT(TrimSilence(record, wave, opts, &trimmed) == kTrimmed);
  ALIGNKIT_ASSERT(trimmed.NumChannels() == 2);
  ALIGNKIT_ASSERT(trimmed.NumSamples() == 24000);
  ALIGNKIT_ASSERT(trimmed.SampFreq() == 16000);
  AssertEqual(trimmed.Duration(), 1.5);
  for (int32 c = 0; c < 2; c++) {
    ALIGNKIT_ASSERT(trimmed.Data()[c][0] == 1000 * c + 8000 % 1000);
    ALIGNKIT_ASSERT(trimmed.Data()[c][23999] == 1000 * c + 31999 % 1000);
  }

  // Unaligned and too-short records leave the output alone.
  WaveData untouched;
  AlignmentRecord unaligned;
  unaligned.utt_id = "u";
  ALIGNKIT_ASSERT(TrimSilence(unaligned, wave, opts, &untouched) ==
                  kTrimSkippedUnaligned);
  ALIGNKIT_ASSERT(untouched.NumSamples() == 0);
  ALIGNKIT_ASSERT(TrimSilence(MakeRecord(1.0, 1.1), wave, opts,
                              &untouched) == kTrimSkippedTooShort);
  ALIGNKIT_ASSERT(untouched.NumSamples() == 0);
}

void UnitTestOptionsCheck() {
  SilenceTrimmerOptions opts;
  opts.Check();
  opts.padding = -0.1;
  try {
    opts.Check();
    ALIGNKIT_ERR << "Expected failure.";
  } catch (const AlignkitFatalError &e) {
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("--padding") !=
                    std::string::npos);
  }
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestBoundaries();
  UnitTestTrimSilence();
  UnitTestOptionsCheck();
  std::cout << "Test OK.\n";
  return 0;
}
