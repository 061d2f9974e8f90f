// align/alignment-builder.cc

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

#include "align/alignment-builder.h"

namespace alignkit {

const char *AlignmentStatusToString(AlignmentStatus status) {
  switch (status) {
    case kAligned: return "aligned";
    case kEngineFailed: return "engine-failed";
    case kWordCountMismatch: return "word-count-mismatch";
    case kMalformedTimings: return "malformed-timings";
    case kNoWords: return "no-words";
    default:
      ALIGNKIT_ERR << "Invalid alignment status " << static_cast<int32>(status);
  }
  return "";  // suppress compiler warning.
}

AlignmentStatus BuildAlignmentRecord(const std::string &utt_id,
                                     bool has_speaker,
                                     const std::string &speaker,
                                     const std::vector<std::string> &words,
                                     const std::vector<WordTiming> *timings,
                                     AlignmentRecord *record) {
  record->utt_id = utt_id;
  record->has_speaker = has_speaker;
  record->speaker = (has_speaker ? speaker : "");
  record->ClearWords();

  if (words.empty()) {
    ALIGNKIT_WARN << "No words in transcript of utterance " << utt_id;
    return kNoWords;
  }
  if (timings == NULL) {
    ALIGNKIT_WARN << "Alignment failed for utterance " << utt_id;
    return kEngineFailed;
  }
  if (timings->size() != words.size()) {
    ALIGNKIT_WARN << "Aligner returned " << timings->size()
                  << " timings for " << words.size() << " words in utterance "
                  << utt_id;
    return kWordCountMismatch;
  }

  std::vector<WordSpan> spans;
  spans.reserve(words.size());
  for (size_t i = 0; i < words.size(); i++)
    spans.push_back(WordSpan(words[i], (*timings)[i].start,
                             (*timings)[i].end));

  std::string why;
  if (!CheckWordSpans(spans, &why)) {
    ALIGNKIT_WARN << "Malformed alignment for utterance " << utt_id << ": "
                  << why;
    return kMalformedTimings;
  }
  record->words.swap(spans);
  return kAligned;
}


void AlignmentStats::Reset() {
  num_total_ = 0;
  for (int32 i = 0; i < kNumAlignmentStatus; i++)
    counts_[i] = 0;
}

void AlignmentStats::Add(AlignmentStatus status) {
  ALIGNKIT_ASSERT(status >= 0 && status < kNumAlignmentStatus);
  num_total_++;
  counts_[status]++;
}

void AlignmentStats::Print() const {
  ALIGNKIT_LOG << "Aligned " << NumAligned() << " of " << NumTotal()
               << " utterances, " << NumFailed() << " failed.";
  for (int32 i = 1; i < kNumAlignmentStatus; i++) {
    if (counts_[i] != 0) {
      AlignmentStatus status = static_cast<AlignmentStatus>(i);
      ALIGNKIT_LOG << "  " << AlignmentStatusToString(status) << ": "
                   << counts_[i];
    }
  }
}

}  // namespace alignkit
