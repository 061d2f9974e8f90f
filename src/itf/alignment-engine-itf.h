// itf/alignment-engine-itf.h

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

#ifndef ALIGNKIT_ITF_ALIGNMENT_ENGINE_ITF_H_
#define ALIGNKIT_ITF_ALIGNMENT_ENGINE_ITF_H_ 1

#include <string>
#include <vector>

#include "base/alignkit-common.h"
#include "feat/wave-reader.h"

namespace alignkit {

/// Time interval of one word, in seconds from the start of the audio.
struct WordTiming {
  double start;
  double end;
  WordTiming(): start(0.0), end(0.0) { }
  WordTiming(double start, double end): start(start), end(end) { }
};

/// Everything an engine gets for one utterance.  The words are the
/// cleaned transcript, in order.
struct AlignmentRequest {
  std::string utt_id;
  const WaveData *wave;
  std::vector<std::string> words;
  AlignmentRequest(): wave(NULL) { }
};

/// AlignmentEngine is the interface to a forced aligner.  Align() is called
/// once per utterance, possibly from several threads at once, so
/// implementations must not keep per-call state in members.
class AlignmentEngine {
 public:
  /// On success, sets "timings" to exactly one interval per word of
  /// request.words (in word order) and returns true.  Returns false if the
  /// engine could not align the utterance (crash, timeout, no output);
  /// "timings" is then undefined.  Must not throw for per-utterance
  /// problems.
  virtual bool Align(const AlignmentRequest &request,
                     std::vector<WordTiming> *timings) = 0;

  virtual ~AlignmentEngine() { }
};

}  // namespace alignkit

#endif  // ALIGNKIT_ITF_ALIGNMENT_ENGINE_ITF_H_
