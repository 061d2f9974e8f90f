// align/alignment-store.h

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

#ifndef ALIGNKIT_ALIGN_ALIGNMENT_STORE_H_
#define ALIGNKIT_ALIGN_ALIGNMENT_STORE_H_

#include <mutex>
#include <string>
#include <unordered_set>

#include "base/alignkit-common.h"
#include "util/alignkit-io.h"
#include "align/alignment-record.h"

// The alignment store is a JSON-lines file with one AlignmentRecord per
// line:
//
//  {"id": "u1", "speaker": null, "words": [
//     {"text": "hello", "start": 0.0, "end": 0.4,
//      "phones": [{"phone": "h", "start": 0.0, "end": 0.1}, ...]}, ...]}
//
// (shown wrapped; each record is on a single line).  "speaker" is a string
// or null, "phones" may be absent, and an empty "words" array is an
// unaligned utterance.

namespace alignkit {

/// \addtogroup align_group
/// @{

/// Serializes the record as one line of JSON, without the newline.  Dies if
/// a string in the record is not valid UTF-8.
std::string AlignmentRecordToJson(const AlignmentRecord &record);

/// Parses one line of JSON.  The schema is checked strictly: missing keys,
/// values of the wrong type and spans that fail CheckWordSpans() are errors.
/// Returns false and sets *why on error.
bool AlignmentRecordFromJson(const std::string &line,
                             AlignmentRecord *record,
                             std::string *why);


/// Writes records to an alignment file, one line each, flushing after every
/// record so that a crash loses at most the record being written.  Write()
/// may be called from several threads.
class AlignmentWriter {
 public:
  AlignmentWriter() { }

  /// Dies if the file cannot be opened.
  explicit AlignmentWriter(const std::string &wxfilename);

  /// Returns false, with a warning, on failure.
  bool Open(const std::string &wxfilename);

  bool IsOpen() const { return output_.IsOpen(); }

  /// Dies on write error.
  void Write(const AlignmentRecord &record);

  /// Writes a line produced by AlignmentRecordToJson().  Returns false if
  /// the file is not open or the write fails; for callers that must not
  /// throw.
  bool WriteJsonLine(const std::string &line);

  const std::string &Filename() const { return filename_; }

  /// Returns false on error.
  bool Close();

  /// Dies if Close() fails.
  ~AlignmentWriter();

 private:
  std::mutex mutex_;
  Output output_;
  std::string filename_;
  ALIGNKIT_DISALLOW_COPY_AND_ASSIGN(AlignmentWriter);
};


/// Reads an alignment file in order, one record at a time, in the style of
/// the sequential table readers:
///
///  for (SequentialAlignmentReader reader(filename); !reader.Done();
///       reader.Next()) {
///    const AlignmentRecord &record = reader.Value();
///    ...
///  }
///
/// Blank lines are skipped.  A line that does not parse, or that repeats an
/// utterance id seen earlier in the file, is fatal; the error names the file
/// and the 1-based line number.  Records before that line have already been
/// returned by Value().
class SequentialAlignmentReader {
 public:
  SequentialAlignmentReader(): line_number_(0), done_(true) { }

  /// Dies if the file cannot be opened, or if the first line is bad.
  explicit SequentialAlignmentReader(const std::string &rxfilename);

  /// Returns false, with a warning, if the file cannot be opened.  Reading
  /// starts again from the beginning if the file was already open.
  bool Open(const std::string &rxfilename);

  bool IsOpen() const { return input_.IsOpen(); }

  /// Returns true if there are no more records.
  bool Done() const { return done_; }

  /// Utterance id of the current record.  Requires !Done().
  const std::string &Key() const;

  /// The current record.  Requires !Done().
  const AlignmentRecord &Value() const;

  /// Moves to the next record.  Requires !Done().
  void Next();

  /// Line of the current record.
  int32 LineNumber() const { return line_number_; }

  void Close();

 private:
  // Reads lines until the next record or end of file.
  void ReadNextRecord();

  Input input_;
  std::string filename_;
  int32 line_number_;
  bool done_;
  AlignmentRecord record_;
  std::unordered_set<std::string> seen_ids_;
  ALIGNKIT_DISALLOW_COPY_AND_ASSIGN(SequentialAlignmentReader);
};

/// @} end "addtogroup align_group"

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_ALIGNMENT_STORE_H_
