// align/phoneme-encoder.cc

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

#include "align/phoneme-encoder.h"
#include "util/text-utils.h"

namespace alignkit {

// UTF-8 encodings of U+02C8 and U+02CC.
static const char *kPrimaryStress = "\xcb\x88";
static const char *kSecondaryStress = "\xcb\x8c";

void SplitStress(const std::string &phone, std::vector<std::string> *out) {
  size_t pos = 0;
  while (pos + 2 <= phone.size() &&
         (phone.compare(pos, 2, kPrimaryStress) == 0 ||
          phone.compare(pos, 2, kSecondaryStress) == 0)) {
    out->push_back(phone.substr(pos, 2));
    pos += 2;
  }
  if (pos < phone.size())
    out->push_back(phone.substr(pos));
}

PhonemeEncoder::PhonemeEncoder(const PhonemeEncoderOptions &opts,
                               const Phonemizer *phonemizer):
    opts_(opts), phonemizer_(phonemizer) {
  if (phonemizer_ == NULL && !opts_.use_aligned_phones)
    ALIGNKIT_ERR << "A phonemizer is needed unless --use-aligned-phones=true";
  std::vector<std::string> skip;
  SplitStringToVector(opts_.skip_phones, ",", true, &skip);
  for (size_t i = 0; i < skip.size(); i++) {
    Trim(&skip[i]);
    if (!skip[i].empty())
      skip_phones_.insert(skip[i]);
  }
}

void PhonemeEncoder::AppendPhone(const std::string &phone,
                                 std::vector<std::string> *phonemes) const {
  if (phone.empty() || skip_phones_.count(phone) != 0)
    return;
  if (!opts_.split_stress) {
    phonemes->push_back(phone);
    return;
  }
  std::vector<std::string> pieces;
  SplitStress(phone, &pieces);
  for (size_t i = 0; i < pieces.size(); i++)
    if (skip_phones_.count(pieces[i]) == 0)
      phonemes->push_back(pieces[i]);
}

int32 PhonemeEncoder::ExpandPhonemes(
    const AlignmentRecord &record,
    std::vector<std::string> *phonemes) const {
  phonemes->clear();
  int32 num_unknown = 0;
  std::vector<std::string> word_phones;
  for (size_t i = 0; i < record.words.size(); i++) {
    const WordSpan &word = record.words[i];
    if (opts_.use_aligned_phones) {
      for (size_t j = 0; j < word.phones.size(); j++)
        AppendPhone(word.phones[j].phone, phonemes);
      continue;
    }
    if (!phonemizer_->Phonemize(word.text, opts_.language, &word_phones)) {
      ALIGNKIT_VLOG(1) << "No pronunciation for word " << word.text
                       << " in utterance " << record.utt_id;
      num_unknown++;
      continue;
    }
    for (size_t j = 0; j < word_phones.size(); j++)
      AppendPhone(word_phones[j], phonemes);
  }
  for (size_t i = 0; i < phonemes->size(); i++)
    if (!IsToken((*phonemes)[i]))
      ALIGNKIT_ERR << "Utterance " << record.utt_id << " has phoneme \""
                   << (*phonemes)[i] << "\", which is not a valid symbol "
                   << "(it contains whitespace)";
  return num_unknown;
}

void PhonemeEncoder::Encode(const std::vector<std::string> &phonemes,
                            PhonemeTable *table,
                            std::vector<int32> *ids) const {
  ids->resize(phonemes.size());
  for (size_t i = 0; i < phonemes.size(); i++)
    (*ids)[i] = table->GetOrAddId(phonemes[i]);
}

std::string PhonemeEncoder::FormatRow(const AlignmentRecord &record,
                                      const std::vector<int32> &ids) const {
  std::ostringstream os;
  os << record.utt_id << '|';
  if (opts_.output_speaker) {
    if (!record.has_speaker)
      ALIGNKIT_ERR << "Speaker output requested but utterance "
                   << record.utt_id << " has no speaker";
    os << record.speaker << '|';
  }
  for (size_t i = 0; i < ids.size(); i++) {
    if (i > 0) os << ' ';
    os << ids[i];
  }
  return os.str();
}

bool PhonemeEncoder::EncodeRecord(const AlignmentRecord &record,
                                  PhonemeTable *table,
                                  std::string *row) const {
  if (!record.IsAligned())
    return false;
  std::vector<std::string> phonemes;
  ExpandPhonemes(record, &phonemes);
  std::vector<int32> ids;
  Encode(phonemes, table, &ids);
  *row = FormatRow(record, ids);
  return true;
}

}  // namespace alignkit
