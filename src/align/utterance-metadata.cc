// align/utterance-metadata.cc

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

#include "align/utterance-metadata.h"
#include "align/alignment-record.h"
#include "util/alignkit-io.h"
#include "util/text-utils.h"

namespace alignkit {

bool ParseMetadataLine(const std::string &line, bool has_speaker,
                       MetadataEntry *entry) {
  std::vector<std::string> fields;
  SplitStringToVector(line, "|", false, &fields);
  size_t num_fields = (has_speaker ? 3 : 2);
  if (fields.size() != num_fields)
    return false;
  if (!IsValidUtteranceId(fields[0]))
    return false;
  entry->utt_id = fields[0];
  entry->has_speaker = has_speaker;
  if (has_speaker) {
    entry->speaker = fields[1];
    entry->text = fields[2];
  } else {
    entry->speaker.clear();
    entry->text = fields[1];
  }
  return true;
}

void WriteMetadataLine(const MetadataEntry &entry, std::ostream &os) {
  os << entry.utt_id << '|';
  if (entry.has_speaker)
    os << entry.speaker << '|';
  os << entry.text << '\n';
}


void UtteranceMetadata::Read(const std::string &rxfilename,
                             bool has_speaker) {
  entries_.clear();
  index_.clear();
  has_speaker_ = has_speaker;

  Input ki(rxfilename);
  std::istream &is = ki.Stream();
  std::string line;
  int32 line_number = 0;
  while (std::getline(is, line)) {
    line_number++;
    Trim(&line);
    if (line.empty()) continue;
    if (!IsValidUtf8(line))
      ALIGNKIT_ERR << "Line " << line_number << " of metadata file "
                   << PrintableRxfilename(rxfilename)
                   << " is not valid UTF-8; convert the file with iconv";
    MetadataEntry entry;
    if (!ParseMetadataLine(line, has_speaker, &entry)) {
      ALIGNKIT_ERR << "Bad line " << line_number << " in metadata file "
                   << PrintableRxfilename(rxfilename) << " (expected "
                   << (has_speaker ? "id|speaker|text" : "id|text")
                   << "): " << line;
    }
    if (index_.count(entry.utt_id) != 0) {
      ALIGNKIT_ERR << "Duplicate utterance id " << entry.utt_id
                   << " on line " << line_number << " of metadata file "
                   << PrintableRxfilename(rxfilename);
    }
    index_[entry.utt_id] = entries_.size();
    entries_.push_back(entry);
  }
  if (is.bad())
    ALIGNKIT_ERR << "Error reading metadata file "
                 << PrintableRxfilename(rxfilename);
  ALIGNKIT_VLOG(1) << "Read " << entries_.size() << " utterances from "
                   << PrintableRxfilename(rxfilename);
}

void UtteranceMetadata::Add(const MetadataEntry &entry) {
  if (!index_.insert(std::make_pair(entry.utt_id, entries_.size())).second)
    ALIGNKIT_ERR << "Duplicate utterance id " << entry.utt_id;
  entries_.push_back(entry);
}

const MetadataEntry *UtteranceMetadata::Find(const std::string &utt_id) const {
  std::unordered_map<std::string, size_t>::const_iterator iter =
      index_.find(utt_id);
  if (iter == index_.end()) return NULL;
  return &(entries_[iter->second]);
}


void AudioFileIndex::Read(const std::string &rxfilename) {
  paths_.clear();
  Input ki(rxfilename);
  std::istream &is = ki.Stream();
  std::string line;
  int32 line_number = 0;
  while (std::getline(is, line)) {
    line_number++;
    Trim(&line);
    if (line.empty()) continue;
    std::string utt_id = FileStem(line);
    if (utt_id.empty())
      ALIGNKIT_ERR << "Line " << line_number << " of audio list "
                   << PrintableRxfilename(rxfilename)
                   << " does not name a file: " << line;
    if (!paths_.insert(std::make_pair(utt_id, line)).second)
      ALIGNKIT_ERR << "Two audio files for utterance " << utt_id
                   << " in " << PrintableRxfilename(rxfilename)
                   << ", second on line " << line_number << ": " << line;
  }
  if (is.bad())
    ALIGNKIT_ERR << "Error reading audio list "
                 << PrintableRxfilename(rxfilename);
}

bool AudioFileIndex::Find(const std::string &utt_id,
                          std::string *path) const {
  std::unordered_map<std::string, std::string>::const_iterator iter =
      paths_.find(utt_id);
  if (iter != paths_.end()) {
    *path = iter->second;
    return true;
  }
  if (!fallback_dir_.empty()) {
    std::string candidate = JoinPath(fallback_dir_, utt_id + ".wav");
    if (FileExists(candidate)) {
      *path = candidate;
      return true;
    }
  }
  return false;
}

}  // namespace alignkit
