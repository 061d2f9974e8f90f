// align/align-pipeline.h

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

#ifndef ALIGNKIT_ALIGN_ALIGN_PIPELINE_H_
#define ALIGNKIT_ALIGN_ALIGN_PIPELINE_H_

#include <string>

#include "base/alignkit-common.h"
#include "itf/alignment-engine-itf.h"
#include "itf/phonemizer-itf.h"
#include "util/alignkit-thread.h"
#include "align/alignment-builder.h"
#include "align/alignment-store.h"
#include "align/phoneme-encoder.h"
#include "align/phoneme-table.h"
#include "align/silence-trimmer.h"
#include "align/utterance-metadata.h"

// The three stages of the toolkit.  Each one processes a whole corpus with
// a TaskSequencer: the per-utterance work runs in parallel and the output is
// written in input order.  Structural problems (missing audio, unknown
// utterance ids, unreadable or unwritable files) are fatal.

namespace alignkit {

/// Aligns every utterance of "metadata": cleans its text with "phonemizer",
/// reads its audio, calls "engine" and writes the record built from the
/// result to "writer".  If clean_metadata is non-NULL, the metadata with
/// cleaned text is written to it.  Utterances that fail to align give
/// unaligned records and are counted in *stats.  A record that cannot be
/// serialized or written is fatal, after the running tasks finish.
void AlignCorpus(const UtteranceMetadata &metadata,
                 const AudioFileIndex &audio_files,
                 const Phonemizer &phonemizer,
                 AlignmentEngine *engine,
                 const TaskSequencerConfig &config,
                 AlignmentWriter *writer,
                 std::ostream *clean_metadata,
                 AlignmentStats *stats);


struct TrimStats {
  int32 num_records;
  int32 num_trimmed;
  int32 num_unaligned;
  int32 num_empty;
  int32 num_too_short;
  int32 num_without_record;  // metadata entries with no alignment record.
  TrimStats(): num_records(0), num_trimmed(0), num_unaligned(0),
               num_empty(0), num_too_short(0), num_without_record(0) { }
  void Add(TrimStatus status);
  void Print() const;
};

/// Trims the audio of every aligned record in the alignment file and writes
/// it to <output_dir>/<id>.wav, plus <output_dir>/metadata.csv with the
/// metadata of the trimmed utterances in alignment-file order.  A record
/// whose id is not in "metadata" is fatal.
void TrimCorpus(const std::string &alignments_rxfilename,
                const UtteranceMetadata &metadata,
                const AudioFileIndex &audio_files,
                const SilenceTrimmerOptions &opts,
                const TaskSequencerConfig &config,
                const std::string &output_dir,
                TrimStats *stats);


struct EncodeStats {
  int32 num_records;
  int32 num_encoded;
  int32 num_unaligned;
  int32 num_unknown_words;
  EncodeStats(): num_records(0), num_encoded(0), num_unaligned(0),
                 num_unknown_words(0) { }
  void Print() const;
};

/// Writes one row of phoneme ids per aligned record of the alignment file
/// to "os".  Phonemization runs in parallel; ids are assigned in file order,
/// so the table ends up the same for any number of threads.
void EncodeCorpus(const std::string &alignments_rxfilename,
                  const PhonemeEncoder &encoder,
                  const TaskSequencerConfig &config,
                  PhonemeTable *table,
                  std::ostream &os,
                  EncodeStats *stats);

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_ALIGN_PIPELINE_H_
