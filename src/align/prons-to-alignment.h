// align/prons-to-alignment.h

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

#ifndef ALIGNKIT_ALIGN_PRONS_TO_ALIGNMENT_H_
#define ALIGNKIT_ALIGN_PRONS_TO_ALIGNMENT_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "base/alignkit-common.h"
#include "itf/options-itf.h"
#include "align/alignment-record.h"
#include "align/utterance-metadata.h"

namespace alignkit {

struct PronsConversionOptions {
  double frames_per_second;
  PronsConversionOptions(): frames_per_second(100.0) { }
  void Register(OptionsItf *opts) {
    opts->Register("frames-per-second", &frames_per_second, "Frame rate of "
                   "the alignment, in frames per second");
  }
};

/// One line of a phones.prons file as written by phones-to-prons and
/// prons-to-wordali style tools:
///   <utt> <start-frame> <d1,d2,...> <word> <p1> <p2> ...
/// with one duration (in frames) per phone.
struct PronEntry {
  std::string utt;
  int32 start_frame;
  std::vector<int32> durations;
  std::string word;
  std::vector<std::string> phones;
};

/// Returns false if the line is malformed (too few fields, bad numbers,
/// non-positive durations, or a duration count that differs from the phone
/// count).
bool ParsePronsLine(const std::string &line, PronEntry *entry);

/// Removes a word-position suffix (_B, _E, _I or _S) from a phone name,
/// e.g. "AH0_B" -> "AH0".
std::string StripWordPositionSuffix(const std::string &phone);

/// Converts phones.prons output of a Kaldi alignment into AlignmentRecords.
/// The lexicon's silence word <eps> is not a word and is dropped.
class PronsToAlignmentConverter {
 public:
  explicit PronsToAlignmentConverter(const PronsConversionOptions &opts);

  /// Reads the map "<prons-utt-id> <utt-id>" from the file.  Repeated
  /// prons ids are fatal.
  void ReadUttMap(const std::string &rxfilename);

  /// Reads a phones.prons file.  Malformed lines, and utterances not in the
  /// utterance map, are fatal with the line named.
  void ReadProns(const std::string &rxfilename);

  /// Adds one parsed line; "utt_id" is the mapped id.
  void AddPron(const std::string &utt_id, const PronEntry &entry);

  /// Outputs one record per utterance.  If "metadata" is non-NULL the
  /// records follow metadata order, utterances with no prons get unaligned
  /// records, and the speaker comes from the metadata; utterances with
  /// prons but no metadata entry are fatal.  Otherwise records follow the
  /// order of first appearance in the prons.  Utterances whose spans fail
  /// CheckWordSpans() are logged and output unaligned.
  void GetRecords(const UtteranceMetadata *metadata,
                  std::vector<AlignmentRecord> *records) const;

 private:
  PronsConversionOptions opts_;
  std::unordered_map<std::string, std::string> utt_map_;
  std::vector<std::string> utt_order_;
  std::unordered_map<std::string, std::vector<WordSpan> > utt_words_;
};

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_PRONS_TO_ALIGNMENT_H_
