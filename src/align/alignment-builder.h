// align/alignment-builder.h

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

#ifndef ALIGNKIT_ALIGN_ALIGNMENT_BUILDER_H_
#define ALIGNKIT_ALIGN_ALIGNMENT_BUILDER_H_

#include <string>
#include <vector>

#include "base/alignkit-common.h"
#include "itf/alignment-engine-itf.h"
#include "align/alignment-record.h"

namespace alignkit {

/// Outcome of aligning one utterance.  Everything except kAligned produces
/// an unaligned (empty) record.
enum AlignmentStatus {
  kAligned = 0,
  kEngineFailed,        // the engine reported failure or timed out.
  kWordCountMismatch,   // number of timings != number of words.
  kMalformedTimings,    // timings out of order, overlapping or inverted.
  kNoWords,             // the cleaned transcript has no words.
  kNumAlignmentStatus
};

const char *AlignmentStatusToString(AlignmentStatus status);

/// Turns the engine output for one utterance into an AlignmentRecord.
/// "timings" is NULL if the engine failed.  The record always gets utt_id
/// and the speaker (if has_speaker); its words are filled in only if the
/// return value is kAligned.  Per-utterance problems are logged as warnings
/// and never throw.
AlignmentStatus BuildAlignmentRecord(const std::string &utt_id,
                                     bool has_speaker,
                                     const std::string &speaker,
                                     const std::vector<std::string> &words,
                                     const std::vector<WordTiming> *timings,
                                     AlignmentRecord *record);


/// Counts of utterances by AlignmentStatus, for the end-of-stage summary.
class AlignmentStats {
 public:
  AlignmentStats() { Reset(); }

  void Reset();

  void Add(AlignmentStatus status);

  int32 NumTotal() const { return num_total_; }
  int32 NumAligned() const { return counts_[kAligned]; }
  int32 NumFailed() const { return num_total_ - counts_[kAligned]; }
  int32 Count(AlignmentStatus status) const { return counts_[status]; }

  /// Logs "total, aligned, failed" and the per-status breakdown.
  void Print() const;

 private:
  int32 num_total_;
  int32 counts_[kNumAlignmentStatus];
};

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_ALIGNMENT_BUILDER_H_
