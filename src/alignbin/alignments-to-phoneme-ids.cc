// alignbin/alignments-to-phoneme-ids.cc

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
#include "align/lexicon-phonemizer.h"

int main(int argc, char *argv[]) {
  using namespace alignkit;
  typedef alignkit::int32 int32;
  try {
    const char *usage =
        "Phonemize the words of each aligned utterance and write its phoneme\n"
        "ids as <utt-id>|<id1> <id2> ... (or <utt-id>|<speaker>|<ids> with\n"
        "--output-speaker).  Ids come from the phoneme table; phonemes not\n"
        "in the table are added in order of first appearance.\n"
        "Usage:  alignments-to-phoneme-ids [options] <alignments> <lexicon> "
        "[<csv-out>]\n"
        "   or:  alignments-to-phoneme-ids --use-aligned-phones=true [options] "
        "<alignments> [<csv-out>]\n"
        "(the aligned phones replace the lexicon, so none is given)\n"
        "e.g.: \n"
        " alignments-to-phoneme-ids --phoneme-table-out=phonemes.txt \\\n"
        "   alignments.jsonl lexicon.txt phonemes.csv\n"
        "See also: align-utterances\n";
    ParseOptions po(usage);
    PhonemeEncoderOptions encoder_opts;
    TaskSequencerConfig sequencer_config;
    std::string table_in_rxfilename, table_out_wxfilename;
    encoder_opts.Register(&po);
    sequencer_config.Register(&po);
    po.Register("phoneme-table-in", &table_in_rxfilename, "If set, start "
                "from the phoneme table in this file");
    po.Register("phoneme-table-out", &table_out_wxfilename, "If set, write "
                "the final phoneme table to this file");

    po.Read(argc, argv);

    int32 num_lexicon_args = (encoder_opts.use_aligned_phones ? 0 : 1);
    if (po.NumArgs() < 1 + num_lexicon_args ||
        po.NumArgs() > 2 + num_lexicon_args) {
      po.PrintUsage();
      exit(1);
    }

    std::string alignments_rxfilename = po.GetArg(1),
        lexicon_rxfilename = (num_lexicon_args == 1 ? po.GetArg(2) : ""),
        csv_wxfilename = po.GetOptArg(2 + num_lexicon_args);

    Timer timer;
    LexiconPhonemizer phonemizer;
    if (!encoder_opts.use_aligned_phones)
      phonemizer.Read(lexicon_rxfilename);
    PhonemeEncoder encoder(encoder_opts, &phonemizer);

    PhonemeTable table;
    if (!table_in_rxfilename.empty()) {
      table.Read(table_in_rxfilename);
      ALIGNKIT_LOG << "Read " << table.NumPhonemes() << " phonemes from "
                   << PrintableRxfilename(table_in_rxfilename);
    }

    Output csv_output(csv_wxfilename, false);
    EncodeStats stats;
    EncodeCorpus(alignments_rxfilename, encoder, sequencer_config, &table,
                 csv_output.Stream(), &stats);
    if (!csv_output.Close())
      ALIGNKIT_ERR << "Error closing " << PrintableWxfilename(csv_wxfilename);

    if (!table_out_wxfilename.empty())
      table.Write(table_out_wxfilename);

    stats.Print();
    ALIGNKIT_LOG << "Phoneme table has " << table.NumPhonemes()
                 << " entries.  Time taken " << timer.Elapsed() << "s, "
                 << NumWarningsLogged() << " warnings.";
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
