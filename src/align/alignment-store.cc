// align/alignment-store.cc

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

#include <nlohmann/json.hpp>

#include "align/alignment-store.h"
#include "util/text-utils.h"

namespace alignkit {

using nlohmann::json;

std::string AlignmentRecordToJson(const AlignmentRecord &record) {
  json j;
  j["id"] = record.utt_id;
  if (record.has_speaker)
    j["speaker"] = record.speaker;
  else
    j["speaker"] = nullptr;
  j["words"] = json::array();
  for (size_t i = 0; i < record.words.size(); i++) {
    const WordSpan &word = record.words[i];
    json jword;
    jword["text"] = word.text;
    jword["start"] = word.start;
    jword["end"] = word.end;
    if (!word.phones.empty()) {
      jword["phones"] = json::array();
      for (size_t k = 0; k < word.phones.size(); k++) {
        json jphone;
        jphone["phone"] = word.phones[k].phone;
        jphone["start"] = word.phones[k].start;
        jphone["end"] = word.phones[k].end;
        jword["phones"].push_back(jphone);
      }
    }
    j["words"].push_back(jword);
  }
  try {
    return j.dump();
  } catch (const json::type_error &e) {
    // dump() rejects strings that are not valid UTF-8.
    ALIGNKIT_ERR << "Cannot write alignment of utterance " << record.utt_id
                 << ": " << e.what();
  }
}

namespace {

// Gets a required string member.
bool GetString(const json &j, const char *key, const std::string &context,
               std::string *value, std::string *why) {
  json::const_iterator it = j.find(key);
  if (it == j.end()) {
    *why = context + ": missing key \"" + key + "\"";
    return false;
  }
  if (!it->is_string()) {
    *why = context + ": \"" + key + "\" is not a string";
    return false;
  }
  *value = it->get<std::string>();
  return true;
}

// Gets a required numeric member.
bool GetNumber(const json &j, const char *key, const std::string &context,
               double *value, std::string *why) {
  json::const_iterator it = j.find(key);
  if (it == j.end()) {
    *why = context + ": missing key \"" + key + "\"";
    return false;
  }
  if (!it->is_number()) {
    *why = context + ": \"" + key + "\" is not a number";
    return false;
  }
  *value = it->get<double>();
  return true;
}

bool ParsePhone(const json &j, const std::string &context,
                PhoneSpan *phone, std::string *why) {
  if (!j.is_object()) {
    *why = context + " is not an object";
    return false;
  }
  if (!GetString(j, "phone", context, &phone->phone, why))
    return false;
  if (!IsToken(phone->phone)) {
    *why = context + ": phone symbol \"" + phone->phone +
        "\" is empty or contains whitespace";
    return false;
  }
  return GetNumber(j, "start", context, &phone->start, why) &&
      GetNumber(j, "end", context, &phone->end, why);
}

bool ParseWord(const json &j, const std::string &context,
               WordSpan *word, std::string *why) {
  if (!j.is_object()) {
    *why = context + " is not an object";
    return false;
  }
  if (!GetString(j, "text", context, &word->text, why) ||
      !GetNumber(j, "start", context, &word->start, why) ||
      !GetNumber(j, "end", context, &word->end, why))
    return false;
  word->phones.clear();
  json::const_iterator it = j.find("phones");
  if (it != j.end()) {
    if (!it->is_array()) {
      *why = context + ": \"phones\" is not an array";
      return false;
    }
    word->phones.resize(it->size());
    for (size_t k = 0; k < it->size(); k++) {
      std::ostringstream phone_context;
      phone_context << context << ", phone " << k;
      if (!ParsePhone((*it)[k], phone_context.str(), &(word->phones[k]), why))
        return false;
    }
  }
  return true;
}

}  // namespace

bool AlignmentRecordFromJson(const std::string &line,
                             AlignmentRecord *record,
                             std::string *why) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error &e) {
    *why = std::string("invalid JSON: ") + e.what();
    return false;
  }
  if (!j.is_object()) {
    *why = "record is not a JSON object";
    return false;
  }
  if (!GetString(j, "id", "record", &record->utt_id, why))
    return false;
  if (!IsValidUtteranceId(record->utt_id)) {
    *why = "invalid utterance id \"" + record->utt_id + "\"";
    return false;
  }

  json::const_iterator spk = j.find("speaker");
  if (spk == j.end()) {
    *why = "record: missing key \"speaker\"";
    return false;
  } else if (spk->is_null()) {
    record->has_speaker = false;
    record->speaker.clear();
  } else if (spk->is_string()) {
    record->SetSpeaker(spk->get<std::string>());
  } else {
    *why = "record: \"speaker\" is neither a string nor null";
    return false;
  }

  json::const_iterator words = j.find("words");
  if (words == j.end()) {
    *why = "record: missing key \"words\"";
    return false;
  }
  if (!words->is_array()) {
    *why = "record: \"words\" is not an array";
    return false;
  }
  record->words.resize(words->size());
  for (size_t i = 0; i < words->size(); i++) {
    std::ostringstream context;
    context << "word " << i;
    if (!ParseWord((*words)[i], context.str(), &(record->words[i]), why))
      return false;
  }
  std::string span_error;
  if (!CheckWordSpans(record->words, &span_error)) {
    *why = "bad spans: " + span_error;
    return false;
  }
  return true;
}


AlignmentWriter::AlignmentWriter(const std::string &wxfilename) {
  if (!Open(wxfilename))
    ALIGNKIT_ERR << "Failed to open alignment file "
                 << PrintableWxfilename(wxfilename) << " for writing";
}

bool AlignmentWriter::Open(const std::string &wxfilename) {
  std::lock_guard<std::mutex> lock(mutex_);
  filename_ = wxfilename;
  return output_.Open(wxfilename, false);
}

void AlignmentWriter::Write(const AlignmentRecord &record) {
  if (!WriteJsonLine(AlignmentRecordToJson(record)))
    ALIGNKIT_ERR << "Error writing alignment of " << record.utt_id << " to "
                 << PrintableWxfilename(filename_);
}

bool AlignmentWriter::WriteJsonLine(const std::string &line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!output_.IsOpen())
    return false;
  std::ostream &os = output_.Stream();
  os << line << '\n';
  os.flush();
  return !os.fail();
}

bool AlignmentWriter::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  return output_.Close();
}

AlignmentWriter::~AlignmentWriter() {
  if (!Close())
    ALIGNKIT_ERR << "Error closing alignment file "
                 << PrintableWxfilename(filename_);
}


SequentialAlignmentReader::SequentialAlignmentReader(
    const std::string &rxfilename): line_number_(0), done_(true) {
  if (!Open(rxfilename))
    ALIGNKIT_ERR << "Failed to open alignment file "
                 << PrintableRxfilename(rxfilename);
}

bool SequentialAlignmentReader::Open(const std::string &rxfilename) {
  Close();
  filename_ = rxfilename;
  if (!input_.Open(rxfilename))
    return false;
  done_ = false;
  ReadNextRecord();
  return true;
}

const std::string &SequentialAlignmentReader::Key() const {
  ALIGNKIT_ASSERT(!done_);
  return record_.utt_id;
}

const AlignmentRecord &SequentialAlignmentReader::Value() const {
  ALIGNKIT_ASSERT(!done_);
  return record_;
}

void SequentialAlignmentReader::Next() {
  ALIGNKIT_ASSERT(!done_);
  ReadNextRecord();
}

void SequentialAlignmentReader::ReadNextRecord() {
  std::istream &is = input_.Stream();
  std::string line;
  while (std::getline(is, line)) {
    line_number_++;
    Trim(&line);
    if (line.empty()) continue;
    std::string why;
    if (!AlignmentRecordFromJson(line, &record_, &why)) {
      ALIGNKIT_ERR << "Error parsing alignment file "
                   << PrintableRxfilename(filename_) << ", line "
                   << line_number_ << ": " << why;
    }
    if (!seen_ids_.insert(record_.utt_id).second) {
      ALIGNKIT_ERR << "Duplicate utterance id " << record_.utt_id
                   << " in alignment file " << PrintableRxfilename(filename_)
                   << ", line " << line_number_;
    }
    return;
  }
  if (is.bad())
    ALIGNKIT_ERR << "Error reading alignment file "
                 << PrintableRxfilename(filename_);
  done_ = true;
}

void SequentialAlignmentReader::Close() {
  input_.Close();
  line_number_ = 0;
  done_ = true;
  seen_ids_.clear();
}

}  // namespace alignkit
