// align/silence-trimmer.cc

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

#include <algorithm>

#include "align/silence-trimmer.h"

namespace alignkit {

TrimStatus ComputeTrimBoundaries(const AlignmentRecord &record,
                                 BaseFloat samp_freq,
                                 int64 num_samples,
                                 const SilenceTrimmerOptions &opts,
                                 int64 *begin,
                                 int64 *end) {
  if (!record.IsAligned())
    return kTrimSkippedUnaligned;
  ALIGNKIT_ASSERT(samp_freq > 0 && num_samples >= 0);

  double duration = SampleToSeconds(num_samples, samp_freq);
  double start_time = std::max(0.0, record.Start() - opts.padding),
      end_time = std::min(duration, record.End() + opts.padding);
  if (end_time <= start_time)
    return kTrimSkippedEmpty;

  int64 begin_samp = SecondsToSample(start_time, samp_freq),
      end_samp = SecondsToSample(end_time, samp_freq);
  begin_samp = std::max(begin_samp, static_cast<int64>(0));
  end_samp = std::min(end_samp, num_samples);
  if (end_samp <= begin_samp)
    return kTrimSkippedEmpty;
  if ((end_samp - begin_samp) < opts.min_duration * samp_freq)
    return kTrimSkippedTooShort;

  *begin = begin_samp;
  *end = end_samp;
  return kTrimmed;
}

TrimStatus TrimSilence(const AlignmentRecord &record,
                       const WaveData &wave,
                       const SilenceTrimmerOptions &opts,
                       WaveData *trimmed) {
  int64 begin = 0, end = 0;
  TrimStatus status = ComputeTrimBoundaries(record, wave.SampFreq(),
                                            wave.NumSamples(), opts,
                                            &begin, &end);
  if (status == kTrimmed) {
    ALIGNKIT_VLOG(2) << "Trimming " << record.utt_id << " to samples ["
                     << begin << ", " << end << ") of " << wave.NumSamples();
    wave.ExtractRange(begin, end, trimmed);
  }
  return status;
}

}  // namespace alignkit
