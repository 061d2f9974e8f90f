// alignbin/align-utterances.cc

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

#include "base/alignkit-common.h"
#include "util/common-utils.h"
#include "align/align-pipeline.h"
#include "align/command-alignment-engine.h"
#include "align/lexicon-phonemizer.h"

int main(int argc, char *argv[]) {
  using namespace alignkit;
  typedef alignkit::int32 int32;
  try {
    const char *usage =
        "Force-align the transcript of each utterance to its audio with an\n"
        "external aligner, and write one JSON alignment record per utterance\n"
        "(in metadata order).  Utterances the aligner fails on get a record\n"
        "with no words.\n"
        "Usage:  align-utterances [options] <metadata> <audio-list> "
        "<alignments-out>\n"
        "e.g.: \n"
        " align-utterances --command=run-aligner.sh --num-threads=4 \\\n"
        "   metadata.csv wavs.list alignments.jsonl\n"
        "See also: prons-to-alignments, trim-silence, "
        "alignments-to-phoneme-ids\n";
    ParseOptions po(usage);
    MetadataOptions metadata_opts;
    CommandAlignmentEngineOptions engine_opts;
    TaskSequencerConfig sequencer_config;
    std::string clean_metadata_wxfilename, audio_dir;
    metadata_opts.Register(&po);
    engine_opts.Register(&po);
    sequencer_config.Register(&po);
    po.Register("clean-metadata", &clean_metadata_wxfilename, "If set, write "
                "the metadata with cleaned text to this file");
    po.Register("audio-dir", &audio_dir, "Directory searched for "
                "<utt-id>.wav when the audio list has no entry for an "
                "utterance");

    po.Read(argc, argv);

    if (po.NumArgs() != 3) {
      po.PrintUsage();
      exit(1);
    }

    std::string metadata_rxfilename = po.GetArg(1),
        audio_list_rxfilename = po.GetArg(2),
        alignments_wxfilename = po.GetArg(3);

    Timer timer;
    UtteranceMetadata metadata;
    metadata.Read(metadata_rxfilename, metadata_opts.has_speaker);
    AudioFileIndex audio_files;
    audio_files.Read(audio_list_rxfilename);
    audio_files.SetFallbackDir(audio_dir);
    ALIGNKIT_LOG << "Aligning " << metadata.NumUtterances()
                 << " utterances with " << audio_files.NumFiles()
                 << " listed audio files.";

    LexiconPhonemizer cleaner;  // only its text cleaning is used.
    CommandAlignmentEngine engine(engine_opts);
    AlignmentWriter writer(alignments_wxfilename);
    Output clean_output;
    if (!clean_metadata_wxfilename.empty() &&
        !clean_output.Open(clean_metadata_wxfilename, false))
      ALIGNKIT_ERR << "Failed to open "
                   << PrintableWxfilename(clean_metadata_wxfilename);

    AlignmentStats stats;
    AlignCorpus(metadata, audio_files, cleaner, &engine, sequencer_config,
                &writer, (clean_output.IsOpen() ? &clean_output.Stream() : NULL),
                &stats);
    if (!writer.Close())
      ALIGNKIT_ERR << "Error closing "
                   << PrintableWxfilename(alignments_wxfilename);
    if (clean_output.IsOpen() && !clean_output.Close())
      ALIGNKIT_ERR << "Error closing "
                   << PrintableWxfilename(clean_metadata_wxfilename);

    stats.Print();
    ALIGNKIT_LOG << "Time taken " << timer.Elapsed() << "s, "
                 << NumWarningsLogged() << " warnings.";
    return (stats.NumAligned() != 0 || stats.NumTotal() == 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
