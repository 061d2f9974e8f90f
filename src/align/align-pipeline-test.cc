// align/align-pipeline-test.cc

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

#include <unistd.h>
#include <map>

#include "align/align-pipeline.h"
#include "align/lexicon-phonemizer.h"
#include "feat/wave-reader.h"
#include "util/alignkit-io.h"

namespace alignkit {

// Returns fixed timings for the utterances it knows and fails on the rest.
class CannedAlignmentEngine : public AlignmentEngine {
 public:
  void Add(const std::string &utt_id, const std::vector<WordTiming> &t) {
    timings_[utt_id] = t;
  }
  virtual bool Align(const AlignmentRequest &request,
                     std::vector<WordTiming> *timings) {
    ALIGNKIT_ASSERT(request.wave != NULL && request.wave->NumSamples() > 0);
    std::map<std::string, std::vector<WordTiming> >::const_iterator iter =
        timings_.find(request.utt_id);
    if (iter == timings_.end()) return false;
    *timings = iter->second;
    return true;
  }
 private:
  std::map<std::string, std::vector<WordTiming> > timings_;
};

static std::string ReadTextFile(const std::string &filename) {
  Input ki(filename);
  std::ostringstream os;
  os << ki.Stream().rdbuf();
  return os.str();
}

static void WriteTone(const std::string &filename, double seconds) {
  std::vector<std::vector<BaseFloat> > data(1);
  int64 num_samples = RoundToInt64(seconds * 16000);
  for (int64 i = 0; i < num_samples; i++)
    data[0].push_back(1000.0 * ((i % 40) < 20 ? 1 : -1));
  WriteWaveFile(filename, WaveData(16000, data));
}

static void AddEntry(const std::string &utt_id, const std::string &text,
                     UtteranceMetadata *metadata) {
  MetadataEntry entry;
  entry.utt_id = utt_id;
  entry.text = text;
  metadata->Add(entry);
}

static void SetUpLexicon(LexiconPhonemizer *phonemizer) {
  std::vector<std::string> hello, world;
  hello.push_back("h");
  hello.push_back("\xc9\x99");
  hello.push_back("l");
  hello.push_back("\xcb\x88o\xca\x8a");
  world.push_back("w");
  world.push_back("\xcb\x88\xc9\x9c\xcb\x90");
  world.push_back("l");
  world.push_back("d");
  phonemizer->AddPronunciation("hello", hello);
  phonemizer->AddPronunciation("world", world);
}

void UnitTestPipeline() {
  std::string wav_dir = "tmp.align-pipeline-test.wavs",
      out_dir = "tmp.align-pipeline-test.trimmed",
      alignments = "tmp.align-pipeline-test.jsonl";
  if (!DirectoryExists(wav_dir))
    MakeDirectory(wav_dir);
  WriteTone(JoinPath(wav_dir, "u1.wav"), 1.0);
  WriteTone(JoinPath(wav_dir, "u2.wav"), 0.5);
  WriteTone(JoinPath(wav_dir, "u3.wav"), 0.5);

  UtteranceMetadata metadata;
  AddEntry("u1", "Hello, world.", &metadata);
  AddEntry("u2", "...", &metadata);
  AddEntry("u3", "Some words!", &metadata);
  AudioFileIndex audio_files;
  audio_files.SetFallbackDir(wav_dir);

  LexiconPhonemizer phonemizer;
  SetUpLexicon(&phonemizer);
  CannedAlignmentEngine engine;
  std::vector<WordTiming> timings;
  timings.push_back(WordTiming(0.0, 0.4));
  timings.push_back(WordTiming(0.5, 0.9));
  engine.Add("u1", timings);

  // Alignment gives the same file whatever the number of threads.
  std::string first_output;
  for (int32 num_threads = 0; num_threads <= 4; num_threads += 2) {
    TaskSequencerConfig config;
    config.num_threads = num_threads;
    AlignmentWriter writer(alignments);
    std::ostringstream clean;
    AlignmentStats stats;
    AlignCorpus(metadata, audio_files, phonemizer, &engine, config, &writer,
                &clean, &stats);
    ALIGNKIT_ASSERT(writer.Close());
    ALIGNKIT_ASSERT(stats.NumTotal() == 3 && stats.NumAligned() == 1);
    ALIGNKIT_ASSERT(stats.Count(kNoWords) == 1 &&
                    stats.Count(kEngineFailed) == 1);
    ALIGNKIT_ASSERT(clean.str() == "u1|hello world\nu2|\nu3|some words\n");
    std::string output = ReadTextFile(alignments);
    if (num_threads == 0) first_output = output;
    ALIGNKIT_ASSERT(output == first_output);
  }

  std::vector<AlignmentRecord> records;
  for (SequentialAlignmentReader reader(alignments); !reader.Done();
       reader.Next())
    records.push_back(reader.Value());
  ALIGNKIT_ASSERT(records.size() == 3);
  ALIGNKIT_ASSERT(records[0].utt_id == "u1" && records[0].words.size() == 2);
  ALIGNKIT_ASSERT(records[0].words[0] == WordSpan("hello", 0.0, 0.4));
  ALIGNKIT_ASSERT(records[0].words[1] == WordSpan("world", 0.5, 0.9));
  ALIGNKIT_ASSERT(records[1].utt_id == "u2" && !records[1].IsAligned());
  ALIGNKIT_ASSERT(records[2].utt_id == "u3" && !records[2].IsAligned());

  {
    PhonemeEncoderOptions opts;
    PhonemeEncoder encoder(opts, &phonemizer);
    TaskSequencerConfig config;
    config.num_threads = 2;
    PhonemeTable table;
    std::ostringstream rows;
    EncodeStats stats;
    EncodeCorpus(alignments, encoder, config, &table, rows, &stats);
    ALIGNKIT_ASSERT(rows.str() == "u1|0 1 2 3 4 5 3 6 2 7\n");
    ALIGNKIT_ASSERT(stats.num_records == 3 && stats.num_encoded == 1 &&
                    stats.num_unaligned == 2);
    ALIGNKIT_ASSERT(table.NumPhonemes() == 8);
  }

  {
    SilenceTrimmerOptions opts;
    opts.padding = 0.0;
    TaskSequencerConfig config;
    config.num_threads = 2;
    TrimStats stats;
    TrimCorpus(alignments, metadata, audio_files, opts, config, out_dir,
               &stats);
    ALIGNKIT_ASSERT(stats.num_records == 3 && stats.num_trimmed == 1 &&
                    stats.num_unaligned == 2 && stats.num_without_record == 0);
    ALIGNKIT_ASSERT(ReadTextFile(JoinPath(out_dir, "metadata.csv")) ==
                    "u1|Hello, world.\n");
    WaveData trimmed;
    ReadWaveFile(JoinPath(out_dir, "u1.wav"), &trimmed);
    ALIGNKIT_ASSERT(trimmed.NumSamples() == 14400);
    ALIGNKIT_ASSERT(!FileExists(JoinPath(out_dir, "u2.wav")));
    unlink(JoinPath(out_dir, "u1.wav").c_str());
    unlink(JoinPath(out_dir, "metadata.csv").c_str());
    rmdir(out_dir.c_str());
  }

  // An utterance with no audio stops alignment.
  AddEntry("u9", "hello", &metadata);
  {
    AlignmentWriter writer(alignments);
    AlignmentStats stats;
    bool threw = false;
    try {
      AlignCorpus(metadata, audio_files, phonemizer, &engine,
                  TaskSequencerConfig(), &writer, NULL, &stats);
    } catch (const AlignkitFatalError &e) {
      threw = true;
      ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("u9") !=
                      std::string::npos);
    }
    ALIGNKIT_ASSERT(threw);
  }

  unlink(alignments.c_str());
  unlink(JoinPath(wav_dir, "u1.wav").c_str());
  unlink(JoinPath(wav_dir, "u2.wav").c_str());
  unlink(JoinPath(wav_dir, "u3.wav").c_str());
  rmdir(wav_dir.c_str());
}

static bool AlignCorpusFails(const UtteranceMetadata &metadata,
                             const AudioFileIndex &audio_files,
                             AlignmentEngine *engine, int32 num_threads,
                             AlignmentWriter *writer,
                             const std::string &expected) {
  LexiconPhonemizer cleaner;
  TaskSequencerConfig config;
  config.num_threads = num_threads;
  AlignmentStats stats;
  try {
    AlignCorpus(metadata, audio_files, cleaner, engine, config, writer, NULL,
                &stats);
  } catch (const AlignkitFatalError &e) {
    return std::string(e.AlignkitMessage()).find(expected) !=
        std::string::npos;
  }
  return false;
}

// Errors while writing a record, such as text that is not UTF-8 or a
// failed write, stop the stage with an error rather than killing the
// process from a worker.
void UnitTestAlignWriteErrors() {
  std::string wav_dir = "tmp.align-pipeline-test.errors",
      alignments = "tmp.align-pipeline-test.errors.jsonl";
  if (!DirectoryExists(wav_dir))
    MakeDirectory(wav_dir);
  WriteTone(JoinPath(wav_dir, "u1.wav"), 0.5);
  WriteTone(JoinPath(wav_dir, "u2.wav"), 0.5);
  AudioFileIndex audio_files;
  audio_files.SetFallbackDir(wav_dir);

  UtteranceMetadata metadata;
  AddEntry("u1", "hello", &metadata);
  AddEntry("u2", "h\xe9llo", &metadata);  // Latin-1.
  CannedAlignmentEngine engine;
  std::vector<WordTiming> timings(1, WordTiming(0.0, 0.4));
  engine.Add("u1", timings);
  engine.Add("u2", timings);

  for (int32 num_threads = 0; num_threads <= 2; num_threads += 2) {
    AlignmentWriter writer(alignments);
    ALIGNKIT_ASSERT(AlignCorpusFails(metadata, audio_files, &engine,
                                     num_threads, &writer, "u2"));
  }

  UtteranceMetadata good;
  AddEntry("u1", "hello", &good);
  AlignmentWriter closed;  // never opened, so every write fails.
  ALIGNKIT_ASSERT(AlignCorpusFails(good, audio_files, &engine, 2, &closed,
                                   "Error writing alignment of u1"));

  // A phoneme with whitespace from the phonemizer stops encoding.
  {
    AlignmentWriter writer(alignments);
    AlignmentStats stats;
    LexiconPhonemizer cleaner;
    AlignCorpus(good, audio_files, cleaner, &engine, TaskSequencerConfig(),
                &writer, NULL, &stats);
    ALIGNKIT_ASSERT(stats.NumAligned() == 1);
  }
  LexiconPhonemizer phonemizer;
  phonemizer.AddPronunciation("hello", std::vector<std::string>(1, "h e"));
  PhonemeEncoder encoder(PhonemeEncoderOptions(), &phonemizer);
  TaskSequencerConfig config;
  config.num_threads = 2;
  PhonemeTable table;
  std::ostringstream rows;
  EncodeStats stats;
  bool threw = false;
  try {
    EncodeCorpus(alignments, encoder, config, &table, rows, &stats);
  } catch (const AlignkitFatalError &e) {
    threw = true;
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("u1") !=
                    std::string::npos);
  }
  ALIGNKIT_ASSERT(threw && table.NumPhonemes() == 0 && rows.str().empty());

  unlink(alignments.c_str());
  unlink(JoinPath(wav_dir, "u1.wav").c_str());
  unlink(JoinPath(wav_dir, "u2.wav").c_str());
  rmdir(wav_dir.c_str());
}

void UnitTestTrimNeedsMetadata() {
  std::string alignments = "tmp.align-pipeline-test.orphan.jsonl",
      out_dir = "tmp.align-pipeline-test.orphan";
  {
    AlignmentWriter writer(alignments);
    AlignmentRecord record;
    record.utt_id = "orphan";
    writer.Write(record);
  }
  UtteranceMetadata metadata;
  AudioFileIndex audio_files;
  TrimStats stats;
  bool threw = false;
  try {
    TrimCorpus(alignments, metadata, audio_files, SilenceTrimmerOptions(),
               TaskSequencerConfig(), out_dir, &stats);
  } catch (const AlignkitFatalError &e) {
    threw = true;
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("orphan") !=
                    std::string::npos);
  }
  ALIGNKIT_ASSERT(threw);
  unlink(alignments.c_str());
  unlink(JoinPath(out_dir, "metadata.csv").c_str());
  rmdir(out_dir.c_str());
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestPipeline();
  UnitTestAlignWriteErrors();
  UnitTestTrimNeedsMetadata();
  std::cout << "Test OK.\n";
  return 0;
}
