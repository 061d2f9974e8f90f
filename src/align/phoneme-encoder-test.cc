// align/phoneme-encoder-test.cc

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

#include "align/lexicon-phonemizer.h"
#include "align/phoneme-encoder.h"

namespace alignkit {

// "hello" -> h ə l ˈoʊ, "world" -> w ˈɜː l d.
static void AddWords(LexiconPhonemizer *phonemizer) {
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

static AlignmentRecord HelloWorld() {
  AlignmentRecord record;
  record.utt_id = "u1";
  record.words.push_back(WordSpan("hello", 0.0, 0.4));
  record.words.push_back(WordSpan("world", 0.5, 0.9));
  return record;
}

void UnitTestSplitStress() {
  std::vector<std::string> out;
  SplitStress("\xcb\x88o\xca\x8a", &out);
  ALIGNKIT_ASSERT(out.size() == 2 && out[0] == "\xcb\x88" &&
                  out[1] == "o\xca\x8a");
  out.clear();
  SplitStress("\xcb\x8c\xcb\x88" "a", &out);
  ALIGNKIT_ASSERT(out.size() == 3 && out[2] == "a");
  out.clear();
  SplitStress("l", &out);
  ALIGNKIT_ASSERT(out.size() == 1 && out[0] == "l");
  out.clear();
  SplitStress("\xcb\x88", &out);
  ALIGNKIT_ASSERT(out.size() == 1 && out[0] == "\xcb\x88");
}

void UnitTestEncodeRecord() {
  LexiconPhonemizer phonemizer;
  AddWords(&phonemizer);
  PhonemeEncoderOptions opts;
  PhonemeEncoder encoder(opts, &phonemizer);

  std::vector<std::string> phonemes;
  ALIGNKIT_ASSERT(encoder.ExpandPhonemes(HelloWorld(), &phonemes) == 0);
  // h ə l ˈ oʊ w ˈ ɜː l d
  ALIGNKIT_ASSERT(phonemes.size() == 10);
  ALIGNKIT_ASSERT(phonemes[3] == "\xcb\x88" && phonemes[6] == "\xcb\x88");

  PhonemeTable table;
  std::string row;
  ALIGNKIT_ASSERT(encoder.EncodeRecord(HelloWorld(), &table, &row));
  ALIGNKIT_ASSERT(row == "u1|0 1 2 3 4 5 3 6 2 7");
  ALIGNKIT_ASSERT(table.NumPhonemes() == 8);

  // Same record, same table: same row and no new entries.
  std::string row2;
  ALIGNKIT_ASSERT(encoder.EncodeRecord(HelloWorld(), &table, &row2));
  ALIGNKIT_ASSERT(row2 == row && table.NumPhonemes() == 8);

  // A table read back from disk gives the same row.
  std::string filename = "tmp.phoneme-encoder-test.table";
  table.Write(filename);
  PhonemeTable table2;
  table2.Read(filename);
  ALIGNKIT_ASSERT(encoder.EncodeRecord(HelloWorld(), &table2, &row2));
  ALIGNKIT_ASSERT(row2 == row && table2.NumPhonemes() == 8);
  unlink(filename.c_str());

  AlignmentRecord unaligned;
  unaligned.utt_id = "u2";
  ALIGNKIT_ASSERT(!encoder.EncodeRecord(unaligned, &table, &row2));
  ALIGNKIT_ASSERT(table.NumPhonemes() == 8);
}

void UnitTestOptions() {
  LexiconPhonemizer phonemizer;
  AddWords(&phonemizer);
  PhonemeEncoderOptions opts;
  opts.split_stress = false;
  opts.skip_phones = "l, d";
  PhonemeEncoder encoder(opts, &phonemizer);
  std::vector<std::string> phonemes;
  AlignmentRecord record = HelloWorld();
  record.words.push_back(WordSpan("unknown", 1.0, 1.2));
  ALIGNKIT_ASSERT(encoder.ExpandPhonemes(record, &phonemes) == 1);
  // h ə ˈoʊ w ˈɜː
  ALIGNKIT_ASSERT(phonemes.size() == 5);
  ALIGNKIT_ASSERT(phonemes[2] == "\xcb\x88o\xca\x8a");

  opts.output_speaker = true;
  PhonemeEncoder speaker_encoder(opts, &phonemizer);
  std::vector<int32> ids;
  ids.push_back(3);
  ids.push_back(1);
  record.SetSpeaker("spk7");
  ALIGNKIT_ASSERT(speaker_encoder.FormatRow(record, ids) == "u1|spk7|3 1");
  record.has_speaker = false;
  bool threw = false;
  try {
    speaker_encoder.FormatRow(record, ids);
  } catch (const AlignkitFatalError &e) {
    threw = true;
  }
  ALIGNKIT_ASSERT(threw);
}

void UnitTestAlignedPhones() {
  PhonemeEncoderOptions opts;
  opts.use_aligned_phones = true;
  PhonemeEncoder encoder(opts, NULL);
  AlignmentRecord record;
  record.utt_id = "u3";
  WordSpan word("hi", 0.1, 0.5);
  word.phones.push_back(PhoneSpan("SIL", 0.1, 0.2));
  word.phones.push_back(PhoneSpan("HH", 0.2, 0.3));
  word.phones.push_back(PhoneSpan("AY1", 0.3, 0.5));
  record.words.push_back(word);
  std::vector<std::string> phonemes;
  ALIGNKIT_ASSERT(encoder.ExpandPhonemes(record, &phonemes) == 0);
  ALIGNKIT_ASSERT(phonemes.size() == 2 && phonemes[0] == "HH" &&
                  phonemes[1] == "AY1");

  // Without aligned phones a phonemizer is required.
  opts.use_aligned_phones = false;
  bool threw = false;
  try {
    PhonemeEncoder bad(opts, NULL);
  } catch (const AlignkitFatalError &e) {
    threw = true;
  }
  ALIGNKIT_ASSERT(threw);
}

static bool ExpandThrows(const PhonemeEncoder &encoder,
                         const AlignmentRecord &record) {
  std::vector<std::string> phonemes;
  try {
    encoder.ExpandPhonemes(record, &phonemes);
  } catch (const AlignkitFatalError &e) {
    return std::string(e.AlignkitMessage()).find(record.utt_id) !=
        std::string::npos;
  }
  return false;
}

// A phoneme with whitespace in it would corrupt the phoneme table file.
void UnitTestWhitespacePhoneme() {
  PhonemeEncoderOptions opts;
  opts.use_aligned_phones = true;
  PhonemeEncoder aligned_encoder(opts, NULL);
  AlignmentRecord record;
  record.utt_id = "u5";
  WordSpan word("hi", 0.1, 0.5);
  word.phones.push_back(PhoneSpan("HH", 0.1, 0.3));
  word.phones.push_back(PhoneSpan("A Y", 0.3, 0.5));
  record.words.push_back(word);
  ALIGNKIT_ASSERT(ExpandThrows(aligned_encoder, record));

  LexiconPhonemizer phonemizer;
  std::vector<std::string> hi;
  hi.push_back("h");
  hi.push_back("a\tj");
  phonemizer.AddPronunciation("hi", hi);
  opts.use_aligned_phones = false;
  PhonemeEncoder lexicon_encoder(opts, &phonemizer);
  ALIGNKIT_ASSERT(ExpandThrows(lexicon_encoder, record));
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestSplitStress();
  UnitTestEncodeRecord();
  UnitTestOptions();
  UnitTestAlignedPhones();
  UnitTestWhitespacePhoneme();
  std::cout << "Test OK.\n";
  return 0;
}
