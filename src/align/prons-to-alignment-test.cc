// align/prons-to-alignment-test.cc

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

#include "align/prons-to-alignment.h"
#include "util/alignkit-io.h"

namespace alignkit {

static void WriteTextFile(const std::string &filename,
                          const std::string &contents) {
  Output ko(filename, false);
  ko.Stream() << contents;
}

void UnitTestParsePronsLine() {
  PronEntry entry;
  ALIGNKIT_ASSERT(ParsePronsLine("7 10 5,5,10 hello HH_B AH0_I L_E", &entry));
  ALIGNKIT_ASSERT(entry.utt == "7" && entry.start_frame == 10);
  ALIGNKIT_ASSERT(entry.durations.size() == 3 && entry.durations[2] == 10);
  ALIGNKIT_ASSERT(entry.word == "hello" && entry.phones.size() == 3);

  ALIGNKIT_ASSERT(!ParsePronsLine("7 10 5", &entry));
  ALIGNKIT_ASSERT(!ParsePronsLine("7 10 5,5 hi HH_B", &entry));
  ALIGNKIT_ASSERT(!ParsePronsLine("7 10 5,0 hi HH_B AY1_E", &entry));
  ALIGNKIT_ASSERT(!ParsePronsLine("7 -1 5 a AH0_S", &entry));
  ALIGNKIT_ASSERT(!ParsePronsLine("7 x 5 a AH0_S", &entry));
  ALIGNKIT_ASSERT(!ParsePronsLine("7 0 5;5 a AH0_B AH0_E", &entry));
}

void UnitTestStripSuffix() {
  ALIGNKIT_ASSERT(StripWordPositionSuffix("AH0_B") == "AH0");
  ALIGNKIT_ASSERT(StripWordPositionSuffix("L_I") == "L");
  ALIGNKIT_ASSERT(StripWordPositionSuffix("D_E") == "D");
  ALIGNKIT_ASSERT(StripWordPositionSuffix("AY1_S") == "AY1");
  ALIGNKIT_ASSERT(StripWordPositionSuffix("SIL") == "SIL");
  ALIGNKIT_ASSERT(StripWordPositionSuffix("X_Q") == "X_Q");
  ALIGNKIT_ASSERT(StripWordPositionSuffix("_B") == "_B");
}

void UnitTestConvert() {
  std::string map_file = "tmp.prons-to-alignment-test.map",
      prons_file = "tmp.prons-to-alignment-test.prons";
  WriteTextFile(map_file, "1 u1\n2 u2\n3 u3\n");
  WriteTextFile(prons_file,
                "1 0 10 <eps> SIL\n"
                "1 10 5,5,10 hello HH_B AH0_I L_E\n"
                "1 30 20 a AH0_S\n"
                "\n"
                "2 0 10 <eps> SIL\n"
                "3 50 10 x X_S\n"
                "3 40 20 y Y_S\n");
  PronsConversionOptions opts;
  PronsToAlignmentConverter converter(opts);
  converter.ReadUttMap(map_file);
  converter.ReadProns(prons_file);

  // Without metadata: order of appearance.
  std::vector<AlignmentRecord> records;
  converter.GetRecords(NULL, &records);
  ALIGNKIT_ASSERT(records.size() == 3);
  const AlignmentRecord &u1 = records[0];
  ALIGNKIT_ASSERT(u1.utt_id == "u1" && !u1.has_speaker);
  ALIGNKIT_ASSERT(u1.words.size() == 2);
  ALIGNKIT_ASSERT(u1.words[0].text == "hello");
  AssertEqual(u1.words[0].start, 0.1);
  AssertEqual(u1.words[0].end, 0.3);
  ALIGNKIT_ASSERT(u1.words[0].phones.size() == 3);
  ALIGNKIT_ASSERT(u1.words[0].phones[1].phone == "AH0");
  AssertEqual(u1.words[0].phones[1].start, 0.15);
  AssertEqual(u1.words[0].phones[1].end, 0.2);
  ALIGNKIT_ASSERT(u1.words[1].text == "a");
  AssertEqual(u1.words[1].end, 0.5);
  ALIGNKIT_ASSERT(CheckWordSpans(u1.words, NULL));
  // Only silence.
  ALIGNKIT_ASSERT(records[1].utt_id == "u2" && !records[1].IsAligned());
  // Overlapping words are output unaligned.
  ALIGNKIT_ASSERT(records[2].utt_id == "u3" && !records[2].IsAligned());

  // With metadata: metadata order, speakers, and missing utterances.
  UtteranceMetadata metadata;
  const char *ids[] = { "u4", "u3", "u2", "u1" };
  for (int32 i = 0; i < 4; i++) {
    MetadataEntry entry;
    entry.utt_id = ids[i];
    entry.has_speaker = true;
    entry.speaker = std::string("spk_") + ids[i];
    entry.text = "text";
    metadata.Add(entry);
  }
  converter.GetRecords(&metadata, &records);
  ALIGNKIT_ASSERT(records.size() == 4);
  ALIGNKIT_ASSERT(records[0].utt_id == "u4" && !records[0].IsAligned());
  ALIGNKIT_ASSERT(records[0].has_speaker && records[0].speaker == "spk_u4");
  ALIGNKIT_ASSERT(records[3].utt_id == "u1" && records[3].IsAligned());
  ALIGNKIT_ASSERT(records[3].speaker == "spk_u1");

  // Prons for an utterance missing from the metadata.
  UtteranceMetadata partial;
  MetadataEntry only;
  only.utt_id = "u1";
  partial.Add(only);
  bool threw = false;
  try {
    converter.GetRecords(&partial, &records);
  } catch (const AlignkitFatalError &e) {
    threw = true;
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("u2") !=
                    std::string::npos);
  }
  ALIGNKIT_ASSERT(threw);

  // An utterance that is not in the map.
  WriteTextFile(prons_file, "1 0 10 a AH0_S\n9 0 10 b B_S\n");
  PronsToAlignmentConverter converter2(opts);
  converter2.ReadUttMap(map_file);
  threw = false;
  try {
    converter2.ReadProns(prons_file);
  } catch (const AlignkitFatalError &e) {
    threw = true;
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()).find("line 2") !=
                    std::string::npos);
  }
  ALIGNKIT_ASSERT(threw);
  unlink(map_file.c_str());
  unlink(prons_file.c_str());
}

void UnitTestFrameRate() {
  PronsConversionOptions opts;
  opts.frames_per_second = 50.0;
  PronsToAlignmentConverter converter(opts);
  PronEntry entry;
  ALIGNKIT_ASSERT(ParsePronsLine("x 25 25 b B_S", &entry));
  converter.AddPron("b1", entry);
  std::vector<AlignmentRecord> records;
  converter.GetRecords(NULL, &records);
  ALIGNKIT_ASSERT(records.size() == 1 && records[0].words.size() == 1);
  AssertEqual(records[0].words[0].start, 0.5);
  AssertEqual(records[0].words[0].end, 1.0);

  opts.frames_per_second = 0.0;
  bool threw = false;
  try {
    PronsToAlignmentConverter bad(opts);
  } catch (const AlignkitFatalError &e) {
    threw = true;
  }
  ALIGNKIT_ASSERT(threw);
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestParsePronsLine();
  UnitTestStripSuffix();
  UnitTestConvert();
  UnitTestFrameRate();
  std::cout << "Test OK.\n";
  return 0;
}
