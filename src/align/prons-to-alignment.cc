// align/prons-to-alignment.cc

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

#include "align/prons-to-alignment.h"
#include "util/alignkit-io.h"
#include "util/text-utils.h"

namespace alignkit {

bool ParsePronsLine(const std::string &line, PronEntry *entry) {
  std::vector<std::string> fields;
  SplitStringToVector(line, " \t\r", true, &fields);
  if (fields.size() < 4)
    return false;
  entry->utt = fields[0];
  if (!ConvertStringToInteger(fields[1], &entry->start_frame) ||
      entry->start_frame < 0)
    return false;
  if (!SplitStringToIntegers(fields[2], ",", false, &entry->durations))
    return false;
  for (size_t i = 0; i < entry->durations.size(); i++)
    if (entry->durations[i] <= 0) return false;
  entry->word = fields[3];
  entry->phones.assign(fields.begin() + 4, fields.end());
  return entry->phones.size() == entry->durations.size();
}

std::string StripWordPositionSuffix(const std::string &phone) {
  size_t n = phone.size();
  if (n > 2 && phone[n - 2] == '_') {
    char c = phone[n - 1];
    if (c == 'B' || c == 'E' || c == 'I' || c == 'S')
      return phone.substr(0, n - 2);
  }
  return phone;
}


PronsToAlignmentConverter::PronsToAlignmentConverter(
    const PronsConversionOptions &opts): opts_(opts) {
  if (!(opts_.frames_per_second > 0))
    ALIGNKIT_ERR << "--frames-per-second must be positive, got "
                 << opts_.frames_per_second;
}

void PronsToAlignmentConverter::ReadUttMap(const std::string &rxfilename) {
  Input ki(rxfilename);
  std::istream &is = ki.Stream();
  std::string line;
  int32 line_number = 0;
  while (std::getline(is, line)) {
    line_number++;
    std::vector<std::string> fields;
    SplitStringToVector(line, " \t\r", true, &fields);
    if (fields.empty()) continue;
    if (fields.size() != 2 || !IsValidUtteranceId(fields[1]))
      ALIGNKIT_ERR << "Bad line " << line_number << " in utterance map "
                   << PrintableRxfilename(rxfilename) << ": " << line;
    if (!utt_map_.insert(std::make_pair(fields[0], fields[1])).second)
      ALIGNKIT_ERR << "Utterance " << fields[0] << " appears twice in "
                   << PrintableRxfilename(rxfilename) << ", line "
                   << line_number;
  }
  if (is.bad())
    ALIGNKIT_ERR << "Error reading " << PrintableRxfilename(rxfilename);
}

void PronsToAlignmentConverter::ReadProns(const std::string &rxfilename) {
  Input ki(rxfilename);
  std::istream &is = ki.Stream();
  std::string line;
  int32 line_number = 0;
  while (std::getline(is, line)) {
    line_number++;
    Trim(&line);
    if (line.empty()) continue;
    PronEntry entry;
    if (!ParsePronsLine(line, &entry))
      ALIGNKIT_ERR << "Bad line " << line_number << " in prons file "
                   << PrintableRxfilename(rxfilename) << ": " << line;
    std::unordered_map<std::string, std::string>::const_iterator iter =
        utt_map_.find(entry.utt);
    if (iter == utt_map_.end())
      ALIGNKIT_ERR << "Utterance " << entry.utt << " on line " << line_number
                   << " of " << PrintableRxfilename(rxfilename)
                   << " is not in the utterance map";
    AddPron(iter->second, entry);
  }
  if (is.bad())
    ALIGNKIT_ERR << "Error reading " << PrintableRxfilename(rxfilename);
}

void PronsToAlignmentConverter::AddPron(const std::string &utt_id,
                                        const PronEntry &entry) {
  if (utt_words_.count(utt_id) == 0) {
    utt_order_.push_back(utt_id);
    utt_words_[utt_id];  // an utterance may consist only of <eps>.
  }
  if (entry.word == "<eps>")
    return;

  double fps = opts_.frames_per_second;
  WordSpan word;
  word.text = entry.word;
  int32 frame = entry.start_frame;
  word.start = frame / fps;
  for (size_t i = 0; i < entry.phones.size(); i++) {
    PhoneSpan phone;
    phone.phone = StripWordPositionSuffix(entry.phones[i]);
    phone.start = frame / fps;
    frame += entry.durations[i];
    phone.end = frame / fps;
    word.phones.push_back(phone);
  }
  word.end = frame / fps;
  utt_words_[utt_id].push_back(word);
}

void PronsToAlignmentConverter::GetRecords(
    const UtteranceMetadata *metadata,
    std::vector<AlignmentRecord> *records) const {
  records->clear();
  std::vector<std::string> order;
  if (metadata != NULL) {
    for (size_t i = 0; i < utt_order_.size(); i++)
      if (metadata->Find(utt_order_[i]) == NULL)
        ALIGNKIT_ERR << "Utterance " << utt_order_[i]
                     << " has prons but no metadata";
    const std::vector<MetadataEntry> &entries = metadata->Entries();
    for (size_t i = 0; i < entries.size(); i++)
      order.push_back(entries[i].utt_id);
  } else {
    order = utt_order_;
  }

  int32 num_missing = 0;
  for (size_t i = 0; i < order.size(); i++) {
    AlignmentRecord record;
    record.utt_id = order[i];
    if (metadata != NULL) {
      const MetadataEntry *entry = metadata->Find(order[i]);
      if (entry->has_speaker)
        record.SetSpeaker(entry->speaker);
    }
    std::unordered_map<std::string, std::vector<WordSpan> >::const_iterator
        iter = utt_words_.find(order[i]);
    if (iter == utt_words_.end()) {
      ALIGNKIT_VLOG(1) << "No alignment for utterance " << order[i];
      num_missing++;
    } else {
      std::string why;
      if (CheckWordSpans(iter->second, &why))
        record.words = iter->second;
      else
        ALIGNKIT_WARN << "Malformed alignment for utterance " << order[i]
                      << ": " << why;
    }
    records->push_back(record);
  }
  if (num_missing > 0)
    ALIGNKIT_LOG << num_missing << " utterances were not aligned.";
}

}  // namespace alignkit
