// align/utterance-metadata.h

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

#ifndef ALIGNKIT_ALIGN_UTTERANCE_METADATA_H_
#define ALIGNKIT_ALIGN_UTTERANCE_METADATA_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "base/alignkit-common.h"
#include "itf/options-itf.h"

namespace alignkit {

/// \addtogroup align_group
/// @{

struct MetadataOptions {
  bool has_speaker;
  MetadataOptions(): has_speaker(false) { }
  void Register(OptionsItf *opts) {
    opts->Register("has-speaker", &has_speaker, "If true, metadata lines are "
                   "id|speaker|text instead of id|text");
  }
};

/// One line of a metadata file.
struct MetadataEntry {
  std::string utt_id;
  bool has_speaker;
  std::string speaker;
  std::string text;
  MetadataEntry(): has_speaker(false) { }
};

/// Parses one line, "id|text" or (if has_speaker) "id|speaker|text".  The
/// line must have exactly that many '|'-separated fields and a valid
/// utterance id.  Returns false on error.
bool ParseMetadataLine(const std::string &line, bool has_speaker,
                       MetadataEntry *entry);

/// Writes the entry as one metadata line, including the newline.
void WriteMetadataLine(const MetadataEntry &entry, std::ostream &os);


/// The metadata of a corpus, read once and then looked up by utterance id.
/// File order is kept.
class UtteranceMetadata {
 public:
  UtteranceMetadata(): has_speaker_(false) { }

  /// Reads a metadata file.  Blank lines are ignored.  A malformed line or
  /// a repeated utterance id is fatal; the error names the file and line.
  void Read(const std::string &rxfilename, bool has_speaker);

  /// Adds one entry; dies if the id is already present.
  void Add(const MetadataEntry &entry);

  /// Returns NULL if utt_id is not present.
  const MetadataEntry *Find(const std::string &utt_id) const;

  int32 NumUtterances() const { return entries_.size(); }

  /// Entries in file order.
  const std::vector<MetadataEntry> &Entries() const { return entries_; }

  bool HasSpeaker() const { return has_speaker_; }

 private:
  bool has_speaker_;
  std::vector<MetadataEntry> entries_;
  std::unordered_map<std::string, size_t> index_;
};


/// Maps utterance ids to audio files.  The list file has one path per line
/// and the file name without its extension is the utterance id.  If a
/// fallback directory is set, ids not in the list are looked up as
/// <dir>/<id>.wav.
class AudioFileIndex {
 public:
  AudioFileIndex() { }

  /// Reads the list; two paths with the same id are fatal.
  void Read(const std::string &rxfilename);

  void SetFallbackDir(const std::string &dir) { fallback_dir_ = dir; }

  /// Outputs the audio path of utt_id and returns true, or returns false
  /// if there is none.
  bool Find(const std::string &utt_id, std::string *path) const;

  int32 NumFiles() const { return paths_.size(); }

 private:
  std::unordered_map<std::string, std::string> paths_;
  std::string fallback_dir_;
};

/// @} end "addtogroup align_group"

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_UTTERANCE_METADATA_H_
