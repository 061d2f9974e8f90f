// align/alignment-record-test.cc

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

#include "align/alignment-record.h"

namespace alignkit {

// Generates random spans that satisfy the invariants, sometimes with
// phones and sometimes with gaps between words.
void GenerateValidSpans(std::vector<WordSpan> *words) {
  words->clear();
  int32 num_words = RandInt(0, 10);
  double t = RandUniform() * 2.0;
  for (int32 i = 0; i < num_words; i++) {
    WordSpan word;
    word.text = "w" + std::to_string(i);
    word.start = t;
    int32 num_phones = RandInt(0, 4);
    double pt = t;
    for (int32 j = 0; j < num_phones; j++) {
      double len = 0.01 + RandUniform() * 0.2;
      word.phones.push_back(PhoneSpan("p" + std::to_string(j), pt, pt + len));
      pt += len;
    }
    word.end = (num_phones > 0 ? pt : t + 0.01 + RandUniform());
    t = word.end + (WithProb(0.5) ? 0.0 : RandUniform() * 0.5);
    words->push_back(word);
  }
}

void UnitTestRandomValidSpans() {
  for (int32 n = 0; n < 100; n++) {
    std::vector<WordSpan> words;
    GenerateValidSpans(&words);
    std::string why;
    ALIGNKIT_ASSERT(CheckWordSpans(words, &why));
    for (size_t i = 1; i < words.size(); i++) {
      ALIGNKIT_ASSERT(words[i].start >= words[i - 1].start);
      ALIGNKIT_ASSERT(words[i].start >= words[i - 1].end);
    }
    if (words.size() >= 2) {
      // Swapping two words breaks the ordering.
      size_t i = RandInt(1, words.size() - 1);
      std::swap(words[i], words[i - 1]);
      ALIGNKIT_ASSERT(!CheckWordSpans(words, &why));
      ALIGNKIT_ASSERT(!why.empty());
    }
  }
}

void UnitTestInvalidSpans() {
  std::vector<WordSpan> words;
  words.push_back(WordSpan("a", 0.0, 0.5));
  words.push_back(WordSpan("b", 0.5, 1.0));
  ALIGNKIT_ASSERT(CheckWordSpans(words, NULL));

  std::vector<WordSpan> overlap(words);
  overlap[1].start = 0.4;
  ALIGNKIT_ASSERT(!CheckWordSpans(overlap, NULL));

  std::vector<WordSpan> inverted(words);
  inverted[0].end = 0.0;
  ALIGNKIT_ASSERT(!CheckWordSpans(inverted, NULL));

  std::vector<WordSpan> negative(words);
  negative[0].start = -0.1;
  ALIGNKIT_ASSERT(!CheckWordSpans(negative, NULL));

  std::vector<WordSpan> nan(words);
  nan[1].end = std::numeric_limits<double>::quiet_NaN();
  ALIGNKIT_ASSERT(!CheckWordSpans(nan, NULL));

  std::vector<WordSpan> bad_phone(words);
  bad_phone[0].phones.push_back(PhoneSpan("x", 0.0, 0.6));  // past the word.
  std::string why;
  ALIGNKIT_ASSERT(!CheckWordSpans(bad_phone, &why));
  ALIGNKIT_ASSERT(why.find("phone 0") != std::string::npos);

  std::vector<WordSpan> empty;
  ALIGNKIT_ASSERT(CheckWordSpans(empty, NULL));
}

void UnitTestRecord() {
  AlignmentRecord record;
  record.utt_id = "u1";
  ALIGNKIT_ASSERT(!record.IsAligned());
  record.words.push_back(WordSpan("hello", 0.1, 0.4));
  record.words.push_back(WordSpan("world", 0.5, 0.9));
  ALIGNKIT_ASSERT(record.IsAligned());
  ALIGNKIT_ASSERT(record.Start() == 0.1 && record.End() == 0.9);

  AlignmentRecord other(record);
  ALIGNKIT_ASSERT(other == record);
  other.SetSpeaker("spk");
  ALIGNKIT_ASSERT(!(other == record));
  other.has_speaker = false;
  ALIGNKIT_ASSERT(other == record);  // speaker text ignored without speaker.
  other.ClearWords();
  ALIGNKIT_ASSERT(!other.IsAligned() && !(other == record));
}

void UnitTestUtteranceId() {
  ALIGNKIT_ASSERT(IsValidUtteranceId("utt_0001"));
  ALIGNKIT_ASSERT(IsValidUtteranceId("LJ001-0001"));
  ALIGNKIT_ASSERT(!IsValidUtteranceId(""));
  ALIGNKIT_ASSERT(!IsValidUtteranceId("a b"));
  ALIGNKIT_ASSERT(!IsValidUtteranceId("a|b"));
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestRandomValidSpans();
  UnitTestInvalidSpans();
  UnitTestRecord();
  UnitTestUtteranceId();
  std::cout << "Test OK.\n";
  return 0;
}
