// alignbin/prons-to-alignments.cc

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
#include "align/alignment-store.h"
#include "align/prons-to-alignment.h"

int main(int argc, char *argv[]) {
  using namespace alignkit;
  typedef alignkit::int32 int32;
  try {
    const char *usage =
        "Convert a Kaldi phones.prons file (as written by\n"
        "steps/get_prons.sh) into JSON alignment records with word and\n"
        "phone spans.  <utt-map> has lines <kaldi-utt-id> <utt-id>.\n"
        "Usage:  prons-to-alignments [options] <utt-map> <phones-prons> "
        "<alignments-out>\n"
        "e.g.: \n"
        " prons-to-alignments --metadata=metadata.csv utt_map.txt \\\n"
        "   exp/tri4_ali/phones.prons alignments.jsonl\n"
        "See also: align-utterances\n";
    ParseOptions po(usage);
    PronsConversionOptions prons_opts;
    MetadataOptions metadata_opts;
    std::string metadata_rxfilename;
    prons_opts.Register(&po);
    metadata_opts.Register(&po);
    po.Register("metadata", &metadata_rxfilename, "If set, output records in "
                "the order of this metadata file, with its speakers, and "
                "output empty records for utterances that have no prons");

    po.Read(argc, argv);

    if (po.NumArgs() != 3) {
      po.PrintUsage();
      exit(1);
    }

    std::string utt_map_rxfilename = po.GetArg(1),
        prons_rxfilename = po.GetArg(2),
        alignments_wxfilename = po.GetArg(3);

    PronsToAlignmentConverter converter(prons_opts);
    converter.ReadUttMap(utt_map_rxfilename);
    converter.ReadProns(prons_rxfilename);

    UtteranceMetadata metadata;
    if (!metadata_rxfilename.empty())
      metadata.Read(metadata_rxfilename, metadata_opts.has_speaker);

    std::vector<AlignmentRecord> records;
    converter.GetRecords(metadata_rxfilename.empty() ? NULL : &metadata,
                         &records);

    AlignmentWriter writer(alignments_wxfilename);
    int32 num_aligned = 0;
    for (size_t i = 0; i < records.size(); i++) {
      writer.Write(records[i]);
      if (records[i].IsAligned()) num_aligned++;
    }
    if (!writer.Close())
      ALIGNKIT_ERR << "Error closing "
                   << PrintableWxfilename(alignments_wxfilename);
    ALIGNKIT_LOG << "Wrote " << records.size() << " records, of which "
                 << num_aligned << " aligned.";
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
