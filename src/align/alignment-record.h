// align/alignment-record.h

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

#ifndef ALIGNKIT_ALIGN_ALIGNMENT_RECORD_H_
#define ALIGNKIT_ALIGN_ALIGNMENT_RECORD_H_

#include <string>
#include <vector>

#include "base/alignkit-common.h"

namespace alignkit {

/// \addtogroup align_group
/// @{

/// One phone of an aligned word; times are in seconds.
struct PhoneSpan {
  std::string phone;
  double start;
  double end;
  PhoneSpan(): start(0.0), end(0.0) { }
  PhoneSpan(const std::string &phone, double start, double end):
      phone(phone), start(start), end(end) { }
  bool operator == (const PhoneSpan &other) const {
    return phone == other.phone && start == other.start && end == other.end;
  }
};

/// One aligned word.  "phones" is empty unless the aligner reported
/// phone-level timing.
struct WordSpan {
  std::string text;
  double start;
  double end;
  std::vector<PhoneSpan> phones;
  WordSpan(): start(0.0), end(0.0) { }
  WordSpan(const std::string &text, double start, double end):
      text(text), start(start), end(end) { }
  bool operator == (const WordSpan &other) const {
    return text == other.text && start == other.start && end == other.end &&
        phones == other.phones;
  }
};

/// The forced alignment of one utterance.  An empty "words" vector is the
/// one and only marker for "not aligned"; consumers test IsAligned() and
/// skip such records.
struct AlignmentRecord {
  std::string utt_id;
  bool has_speaker;
  std::string speaker;  // only meaningful if has_speaker.
  std::vector<WordSpan> words;

  AlignmentRecord(): has_speaker(false) { }

  bool IsAligned() const { return !words.empty(); }

  /// Start of the first word; requires IsAligned().
  double Start() const {
    ALIGNKIT_ASSERT(IsAligned());
    return words.front().start;
  }
  /// End of the last word; requires IsAligned().
  double End() const {
    ALIGNKIT_ASSERT(IsAligned());
    return words.back().end;
  }

  void SetSpeaker(const std::string &spk) {
    speaker = spk;
    has_speaker = true;
  }

  /// Drops the word spans, turning this into an unaligned record.
  void ClearWords() { words.clear(); }

  bool operator == (const AlignmentRecord &other) const {
    return utt_id == other.utt_id && has_speaker == other.has_speaker &&
        (!has_speaker || speaker == other.speaker) && words == other.words;
  }
};

/// Returns true if the word spans satisfy the alignment invariants: each
/// start is finite and >= 0, each end is finite and > start, and each word
/// starts no earlier than the previous word ends (so starts are
/// non-decreasing and spans do not overlap).  Phone spans, if present, must
/// satisfy the same conditions among themselves and lie within their word.
/// On failure, and if "why" is non-NULL, a description of the first
/// violation is put in *why.
bool CheckWordSpans(const std::vector<WordSpan> &words, std::string *why);

/// Returns true if "utt_id" is usable as an utterance id: nonempty, no
/// whitespace and no '|'.
bool IsValidUtteranceId(const std::string &utt_id);

/// @} end "addtogroup align_group"

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_ALIGNMENT_RECORD_H_
