// align/phoneme-encoder.h

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

#ifndef ALIGNKIT_ALIGN_PHONEME_ENCODER_H_
#define ALIGNKIT_ALIGN_PHONEME_ENCODER_H_

#include <set>
#include <string>
#include <vector>

#include "base/alignkit-common.h"
#include "itf/options-itf.h"
#include "itf/phonemizer-itf.h"
#include "align/alignment-record.h"
#include "align/phoneme-table.h"

namespace alignkit {

/// \addtogroup align_group
/// @{

struct PhonemeEncoderOptions {
  std::string language;
  std::string skip_phones;
  bool split_stress;
  bool use_aligned_phones;
  bool output_speaker;

  PhonemeEncoderOptions(): language("en-us"), skip_phones("SIL,SPN,NSN"),
                           split_stress(true), use_aligned_phones(false),
                           output_speaker(false) { }

  void Register(OptionsItf *opts) {
    opts->Register("language", &language, "Language code passed to the "
                   "phonemizer");
    opts->Register("skip-phones", &skip_phones, "Comma-separated list of "
                   "phones that are dropped before encoding");
    opts->Register("split-stress", &split_stress, "If true, leading IPA "
                   "stress marks become separate phonemes");
    opts->Register("use-aligned-phones", &use_aligned_phones, "If true, use "
                   "the phones stored in the alignments instead of "
                   "phonemizing the words");
    opts->Register("output-speaker", &output_speaker, "If true, write rows "
                   "as id|speaker|ids");
  }
};

/// Turns aligned utterances into rows of phoneme ids.  Expanding a record to
/// phoneme symbols only reads the encoder and the phonemizer, so it can run
/// in several threads; assigning ids modifies the table and must be done in
/// one thread, in corpus order, for the ids to be reproducible.
class PhonemeEncoder {
 public:
  /// "phonemizer" may be NULL if opts.use_aligned_phones is true.  It is
  /// not owned.
  PhonemeEncoder(const PhonemeEncoderOptions &opts,
                 const Phonemizer *phonemizer);

  /// Outputs the phoneme symbols of the record's words, concatenated in
  /// word order, with stress marks split and skipped phones removed.
  /// Returns the number of words that could not be phonemized (they
  /// contribute nothing).  An unaligned record gives no phonemes.  Dies if
  /// a phoneme from the record or the phonemizer contains whitespace.
  int32 ExpandPhonemes(const AlignmentRecord &record,
                       std::vector<std::string> *phonemes) const;

  /// Maps the symbols to ids, adding unseen symbols to the table.
  void Encode(const std::vector<std::string> &phonemes,
              PhonemeTable *table,
              std::vector<int32> *ids) const;

  /// Returns "id|i1 i2 ..." or, with --output-speaker, "id|speaker|i1 ...",
  /// without the newline.  Dies if the speaker is wanted and the record has
  /// none.
  std::string FormatRow(const AlignmentRecord &record,
                        const std::vector<int32> &ids) const;

  /// ExpandPhonemes(), Encode() and FormatRow() in one go.  Returns false
  /// if the record is unaligned, in which case there is no row and the
  /// table is unchanged.
  bool EncodeRecord(const AlignmentRecord &record,
                    PhonemeTable *table,
                    std::string *row) const;

  const PhonemeEncoderOptions &Options() const { return opts_; }

 private:
  // Appends one phone (after stress splitting and skipping) to *phonemes.
  void AppendPhone(const std::string &phone,
                   std::vector<std::string> *phonemes) const;

  PhonemeEncoderOptions opts_;
  const Phonemizer *phonemizer_;
  std::set<std::string> skip_phones_;
};

/// Splits leading IPA stress marks (primary U+02C8, secondary U+02CC) off
/// "phone": e.g. "ˈa" gives "ˈ", "a".  A phone that is only stress marks
/// gives just the marks.
void SplitStress(const std::string &phone, std::vector<std::string> *out);

/// @} end "addtogroup align_group"

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_PHONEME_ENCODER_H_
