// alignbin/trim-silence.cc

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

int main(int argc, char *argv[]) {
  using namespace alignkit;
  typedef alignkit::int32 int32;
  try {
    const char *usage =
        "Cut each aligned utterance's audio to the span of its words, plus\n"
        "padding, and write <output-dir>/<utt-id>.wav and\n"
        "<output-dir>/metadata.csv for the utterances that were kept.\n"
        "Utterances with no alignment, or too short after trimming, are\n"
        "skipped.\n"
        "Usage:  trim-silence [options] <metadata> <audio-list> <alignments> "
        "<output-dir>\n"
        "e.g.: \n"
        " trim-silence --padding=0.1 --num-threads=8 metadata.csv wavs.list \\\n"
        "   alignments.jsonl trimmed\n"
        "See also: align-utterances\n";
    ParseOptions po(usage);
    SilenceTrimmerOptions trim_opts;
    MetadataOptions metadata_opts;
    TaskSequencerConfig sequencer_config;
    std::string audio_dir;
    trim_opts.Register(&po);
    metadata_opts.Register(&po);
    sequencer_config.Register(&po);
    po.Register("audio-dir", &audio_dir, "Directory searched for "
                "<utt-id>.wav when the audio list has no entry for an "
                "utterance");

    po.Read(argc, argv);

    if (po.NumArgs() != 4) {
      po.PrintUsage();
      exit(1);
    }

    std::string metadata_rxfilename = po.GetArg(1),
        audio_list_rxfilename = po.GetArg(2),
        alignments_rxfilename = po.GetArg(3),
        output_dir = po.GetArg(4);

    Timer timer;
    UtteranceMetadata metadata;
    metadata.Read(metadata_rxfilename, metadata_opts.has_speaker);
    AudioFileIndex audio_files;
    audio_files.Read(audio_list_rxfilename);
    audio_files.SetFallbackDir(audio_dir);

    TrimStats stats;
    TrimCorpus(alignments_rxfilename, metadata, audio_files, trim_opts,
               sequencer_config, output_dir, &stats);
    stats.Print();
    ALIGNKIT_LOG << "Time taken " << timer.Elapsed() << "s, "
                 << NumWarningsLogged() << " warnings.";
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
