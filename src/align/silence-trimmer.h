// align/silence-trimmer.h

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

#ifndef ALIGNKIT_ALIGN_SILENCE_TRIMMER_H_
#define ALIGNKIT_ALIGN_SILENCE_TRIMMER_H_

#include "base/alignkit-common.h"
#include "itf/options-itf.h"
#include "feat/wave-reader.h"
#include "align/alignment-record.h"

namespace alignkit {

/// \addtogroup align_group
/// @{

struct SilenceTrimmerOptions {
  double padding;
  double min_duration;
  SilenceTrimmerOptions(): padding(0.1), min_duration(0.5) { }
  void Register(OptionsItf *opts) {
    opts->Register("padding", &padding, "Seconds of audio to keep before the "
                   "first word and after the last word");
    opts->Register("min-duration", &min_duration, "Trimmed audio shorter "
                   "than this many seconds is skipped");
  }
  void Check() const {
    if (!(padding >= 0.0) || !(min_duration >= 0.0))
      ALIGNKIT_ERR << "--padding and --min-duration must be >= 0, got "
                   << padding << " and " << min_duration;
  }
};

enum TrimStatus {
  kTrimmed = 0,
  kTrimSkippedUnaligned,  // record has no words.
  kTrimSkippedEmpty,      // nothing left after clamping.
  kTrimSkippedTooShort    // shorter than --min-duration.
};

/// Computes the sample range [*begin, *end) to keep for "record" in audio
/// of num_samples samples at samp_freq Hz.  The range runs from the first
/// word's start minus the padding to the last word's end plus the padding,
/// clamped to the audio; a time t maps to sample round(t * samp_freq).
/// *begin and *end are only meaningful if kTrimmed is returned.
TrimStatus ComputeTrimBoundaries(const AlignmentRecord &record,
                                 BaseFloat samp_freq,
                                 int64 num_samples,
                                 const SilenceTrimmerOptions &opts,
                                 int64 *begin,
                                 int64 *end);

/// Cuts the trimmed range out of "wave" (all channels) into *trimmed.
/// *trimmed is left untouched unless kTrimmed is returned.
TrimStatus TrimSilence(const AlignmentRecord &record,
                       const WaveData &wave,
                       const SilenceTrimmerOptions &opts,
                       WaveData *trimmed);

/// @} end "addtogroup align_group"

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_SILENCE_TRIMMER_H_
