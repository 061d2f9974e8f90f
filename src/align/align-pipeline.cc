// align/align-pipeline.cc

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

#include "align/align-pipeline.h"
#include "feat/wave-reader.h"
#include "util/alignkit-io.h"
#include "util/text-utils.h"

namespace alignkit {

// This class is used to parallelize alignment over multiple threads.  The
// engine runs, and the record is built and serialized, in operator (); the
// destructor writes the line in the order the tasks were created.  Errors
// are kept in *error rather than thrown, since the destructor must not
// throw.
class AlignUtteranceTask {
 public:
  AlignUtteranceTask(AlignmentEngine *engine,
                     const MetadataEntry &entry,
                     const std::vector<std::string> &words,
                     WaveData *wave,  // swapped into the task.
                     AlignmentWriter *writer,
                     std::ostream *clean_metadata,
                     AlignmentStats *stats,
                     std::string *error):
      engine_(engine), entry_(entry), words_(words), writer_(writer),
      clean_metadata_(clean_metadata), stats_(stats), error_out_(error),
      status_(kEngineFailed) {
    wave_.Swap(wave);
  }

  void operator () () {
    bool engine_ok = false;
    std::vector<WordTiming> timings;
    if (!words_.empty()) {
      AlignmentRequest request;
      request.utt_id = entry_.utt_id;
      request.wave = &wave_;
      request.words = words_;
      try {
        engine_ok = engine_->Align(request, &timings);
      } catch (const std::exception &e) {
        ALIGNKIT_WARN << "Aligner threw an exception on utterance "
                      << entry_.utt_id << ": " << e.what();
        engine_ok = false;
      }
      wave_.Clear();
    }
    try {
      AlignmentRecord record;
      status_ = BuildAlignmentRecord(entry_.utt_id, entry_.has_speaker,
                                     entry_.speaker, words_,
                                     (engine_ok ? &timings : NULL), &record);
      json_line_ = AlignmentRecordToJson(record);
    } catch (const AlignkitFatalError &e) {
      error_ = e.AlignkitMessage();
    }
  }

  ~AlignUtteranceTask() {
    if (error_.empty() && !writer_->WriteJsonLine(json_line_))
      error_ = "Error writing alignment of " + entry_.utt_id + " to " +
          PrintableWxfilename(writer_->Filename());
    if (!error_.empty()) {
      if (error_out_->empty())
        *error_out_ = error_;
      return;
    }
    stats_->Add(status_);
    ALIGNKIT_VLOG(1) << "Utterance " << entry_.utt_id << ": "
                     << AlignmentStatusToString(status_);
    if (clean_metadata_ != NULL) {
      MetadataEntry clean(entry_);
      JoinVectorToString(words_, " ", true, &clean.text);
      WriteMetadataLine(clean, *clean_metadata_);
    }
  }

 private:
  AlignmentEngine *engine_;
  MetadataEntry entry_;
  std::vector<std::string> words_;
  WaveData wave_;
  AlignmentWriter *writer_;
  std::ostream *clean_metadata_;
  AlignmentStats *stats_;
  std::string *error_out_;
  AlignmentStatus status_;
  std::string json_line_;
  std::string error_;
};

void AlignCorpus(const UtteranceMetadata &metadata,
                 const AudioFileIndex &audio_files,
                 const Phonemizer &phonemizer,
                 AlignmentEngine *engine,
                 const TaskSequencerConfig &config,
                 AlignmentWriter *writer,
                 std::ostream *clean_metadata,
                 AlignmentStats *stats) {
  const std::vector<MetadataEntry> &entries = metadata.Entries();
  std::string error;
  {
    TaskSequencer<AlignUtteranceTask> sequencer(config);
    for (size_t i = 0; i < entries.size(); i++) {
      const MetadataEntry &entry = entries[i];
      std::string audio_path;
      if (!audio_files.Find(entry.utt_id, &audio_path))
        ALIGNKIT_ERR << "No audio file for utterance " << entry.utt_id;

      std::vector<std::string> words;
      phonemizer.CleanText(entry.text, &words);
      WaveData wave;
      if (!words.empty())
        ReadWaveFile(audio_path, &wave);
      sequencer.Run(new AlignUtteranceTask(engine, entry, words, &wave,
                                           writer, clean_metadata, stats,
                                           &error));
    }
    // Destructor of "sequencer" will wait for any remaining tasks.
  }
  if (!error.empty())
    ALIGNKIT_ERR << "Error aligning corpus: " << error;
  if (clean_metadata != NULL && clean_metadata->fail())
    ALIGNKIT_ERR << "Error writing cleaned metadata";
}


void TrimStats::Add(TrimStatus status) {
  num_records++;
  switch (status) {
    case kTrimmed: num_trimmed++; break;
    case kTrimSkippedUnaligned: num_unaligned++; break;
    case kTrimSkippedEmpty: num_empty++; break;
    case kTrimSkippedTooShort: num_too_short++; break;
    default: ALIGNKIT_ERR << "Invalid trim status " << status;
  }
}

void TrimStats::Print() const {
  ALIGNKIT_LOG << "Trimmed " << num_trimmed << " of " << num_records
               << " utterances; skipped " << num_unaligned
               << " with no alignment, " << num_too_short
               << " too short and " << num_empty << " empty after trimming.";
  if (num_without_record > 0)
    ALIGNKIT_WARN << num_without_record << " utterances in the metadata "
                  << "have no alignment record.";
}

// Trims one utterance.  The audio is read in the constructor, which runs in
// the main thread, so that read errors stop the stage at once.  Cutting and
// writing happen in operator (), and the metadata line is written in the
// destructor, in alignment-file order.
class TrimUtteranceTask {
 public:
  TrimUtteranceTask(const AlignmentRecord &record,
                    const MetadataEntry &entry,
                    const std::string &audio_path,
                    const std::string &output_dir,
                    const SilenceTrimmerOptions &opts,
                    std::ostream *metadata_out,
                    TrimStats *stats,
                    std::string *error):
      record_(record), entry_(entry), opts_(opts),
      metadata_out_(metadata_out), stats_(stats), error_out_(error),
      status_(kTrimSkippedUnaligned) {
    if (record_.IsAligned()) {
      ReadWaveFile(audio_path, &wave_);
      output_path_ = JoinPath(output_dir, record_.utt_id + ".wav");
    }
  }

  void operator () () {
    if (!record_.IsAligned()) return;
    try {
      WaveData trimmed;
      status_ = TrimSilence(record_, wave_, opts_, &trimmed);
      wave_.Clear();
      if (status_ == kTrimmed)
        WriteWaveFile(output_path_, trimmed);
    } catch (const AlignkitFatalError &e) {
      error_ = e.AlignkitMessage();
    }
  }

  ~TrimUtteranceTask() {
    if (!error_.empty()) {
      if (error_out_->empty())
        *error_out_ = error_;
      return;
    }
    stats_->Add(status_);
    if (status_ == kTrimmed) {
      WriteMetadataLine(entry_, *metadata_out_);
    } else if (status_ != kTrimSkippedUnaligned) {
      ALIGNKIT_VLOG(1) << "Skipping utterance " << record_.utt_id
                       << (status_ == kTrimSkippedTooShort ? " (too short)" :
                           " (empty after trimming)");
    }
  }

 private:
  AlignmentRecord record_;
  MetadataEntry entry_;
  SilenceTrimmerOptions opts_;
  std::ostream *metadata_out_;
  TrimStats *stats_;
  std::string *error_out_;
  WaveData wave_;
  std::string output_path_;
  TrimStatus status_;
  std::string error_;
};

void TrimCorpus(const std::string &alignments_rxfilename,
                const UtteranceMetadata &metadata,
                const AudioFileIndex &audio_files,
                const SilenceTrimmerOptions &opts,
                const TaskSequencerConfig &config,
                const std::string &output_dir,
                TrimStats *stats) {
  opts.Check();
  MakeDirectory(output_dir);
  std::string metadata_filename = JoinPath(output_dir, "metadata.csv");
  Output metadata_out(metadata_filename, false);

  std::string error;
  int32 num_seen = 0;
  {
    TaskSequencer<TrimUtteranceTask> sequencer(config);
    for (SequentialAlignmentReader reader(alignments_rxfilename);
         !reader.Done(); reader.Next()) {
      const AlignmentRecord &record = reader.Value();
      const MetadataEntry *entry = metadata.Find(record.utt_id);
      if (entry == NULL)
        ALIGNKIT_ERR << "Utterance " << record.utt_id << " on line "
                     << reader.LineNumber() << " of "
                     << PrintableRxfilename(alignments_rxfilename)
                     << " is not in the metadata";
      num_seen++;
      std::string audio_path;
      if (record.IsAligned() && !audio_files.Find(record.utt_id, &audio_path))
        ALIGNKIT_ERR << "No audio file for utterance " << record.utt_id;
      sequencer.Run(new TrimUtteranceTask(record, *entry, audio_path,
                                          output_dir, opts,
                                          &metadata_out.Stream(), stats,
                                          &error));
    }
  }
  if (!error.empty())
    ALIGNKIT_ERR << "Error trimming audio: " << error;
  stats->num_without_record = metadata.NumUtterances() - num_seen;
  if (!metadata_out.Close())
    ALIGNKIT_ERR << "Error writing " << metadata_filename;
}


void EncodeStats::Print() const {
  ALIGNKIT_LOG << "Encoded " << num_encoded << " of " << num_records
               << " utterances; skipped " << num_unaligned
               << " with no alignment.";
  if (num_unknown_words > 0)
    ALIGNKIT_WARN << num_unknown_words << " words could not be phonemized "
                  << "and were left out.";
}

// Phonemizes one record in operator () and assigns ids and writes the row in
// the destructor, so ids are assigned in file order.  Phonemes are checked
// in operator (), so that the destructor does not throw.
class EncodeUtteranceTask {
 public:
  EncodeUtteranceTask(const PhonemeEncoder &encoder,
                      const AlignmentRecord &record,
                      PhonemeTable *table,
                      std::ostream *os,
                      EncodeStats *stats,
                      std::string *error):
      encoder_(encoder), record_(record), table_(table), os_(os),
      stats_(stats), error_out_(error), num_unknown_(0) { }

  void operator () () {
    try {
      num_unknown_ = encoder_.ExpandPhonemes(record_, &phonemes_);
    } catch (const AlignkitFatalError &e) {
      error_ = e.AlignkitMessage();
    }
  }

  ~EncodeUtteranceTask() {
    if (!error_.empty()) {
      if (error_out_->empty())
        *error_out_ = error_;
      return;
    }
    stats_->num_records++;
    if (!record_.IsAligned()) {
      stats_->num_unaligned++;
      return;
    }
    stats_->num_unknown_words += num_unknown_;
    if (phonemes_.empty())
      ALIGNKIT_WARN << "No phonemes for utterance " << record_.utt_id;
    std::vector<int32> ids;
    encoder_.Encode(phonemes_, table_, &ids);
    *os_ << encoder_.FormatRow(record_, ids) << '\n';
    stats_->num_encoded++;
  }

 private:
  const PhonemeEncoder &encoder_;
  AlignmentRecord record_;
  PhonemeTable *table_;
  std::ostream *os_;
  EncodeStats *stats_;
  std::string *error_out_;
  std::vector<std::string> phonemes_;
  int32 num_unknown_;
  std::string error_;
};

void EncodeCorpus(const std::string &alignments_rxfilename,
                  const PhonemeEncoder &encoder,
                  const TaskSequencerConfig &config,
                  PhonemeTable *table,
                  std::ostream &os,
                  EncodeStats *stats) {
  std::string error;
  {
    TaskSequencer<EncodeUtteranceTask> sequencer(config);
    for (SequentialAlignmentReader reader(alignments_rxfilename);
         !reader.Done(); reader.Next()) {
      const AlignmentRecord &record = reader.Value();
      if (encoder.Options().output_speaker && !record.has_speaker)
        ALIGNKIT_ERR << "Speaker output requested but utterance "
                     << record.utt_id << " on line " << reader.LineNumber()
                     << " has no speaker";
      sequencer.Run(new EncodeUtteranceTask(encoder, record, table, &os,
                                            stats, &error));
    }
  }
  if (!error.empty())
    ALIGNKIT_ERR << "Error encoding "
                 << PrintableRxfilename(alignments_rxfilename) << ": "
                 << error;
  os.flush();
  if (os.fail())
    ALIGNKIT_ERR << "Error writing encoded phonemes";
}

}  // namespace alignkit
