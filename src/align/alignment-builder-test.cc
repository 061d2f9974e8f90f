// align/alignment-builder-test.cc

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

#include "align/alignment-builder.h"

namespace alignkit {

static std::vector<std::string> Words(const char *a, const char *b,
                                      const char *c = NULL) {
  std::vector<std::string> words;
  words.push_back(a);
  words.push_back(b);
  if (c != NULL) words.push_back(c);
  return words;
}

void UnitTestBuildAligned() {
  std::vector<std::string> words = Words("hello", "world");
  std::vector<WordTiming> timings;
  timings.push_back(WordTiming(0.0, 0.4));
  timings.push_back(WordTiming(0.5, 0.9));
  AlignmentRecord record;
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u1", true, "spk1", words, &timings,
                                       &record) == kAligned);
  ALIGNKIT_ASSERT(record.utt_id == "u1");
  ALIGNKIT_ASSERT(record.has_speaker && record.speaker == "spk1");
  ALIGNKIT_ASSERT(record.words.size() == 2);
  ALIGNKIT_ASSERT(record.words[0] == WordSpan("hello", 0.0, 0.4));
  ALIGNKIT_ASSERT(record.words[1] == WordSpan("world", 0.5, 0.9));

  // Touching spans are allowed.
  timings[1].start = 0.4;
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u1", false, "", words, &timings,
                                       &record) == kAligned);
  ALIGNKIT_ASSERT(!record.has_speaker);
}

void UnitTestBuildCountMismatch() {
  std::vector<std::string> words = Words("a", "b", "c");
  std::vector<WordTiming> timings;
  timings.push_back(WordTiming(0.0, 0.1));
  timings.push_back(WordTiming(0.2, 0.3));
  AlignmentRecord record;
  record.words.push_back(WordSpan("stale", 0.0, 1.0));
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u2", false, "", words, &timings,
                                       &record) == kWordCountMismatch);
  ALIGNKIT_ASSERT(record.utt_id == "u2" && !record.IsAligned());
}

void UnitTestBuildFailures() {
  std::vector<std::string> words = Words("a", "b");
  AlignmentRecord record;
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u3", false, "", words, NULL,
                                       &record) == kEngineFailed);
  ALIGNKIT_ASSERT(!record.IsAligned());

  std::vector<WordTiming> overlapping;
  overlapping.push_back(WordTiming(0.0, 0.5));
  overlapping.push_back(WordTiming(0.3, 0.8));
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u3", false, "", words, &overlapping,
                                       &record) == kMalformedTimings);
  ALIGNKIT_ASSERT(!record.IsAligned());

  std::vector<WordTiming> misordered;
  misordered.push_back(WordTiming(1.0, 1.5));
  misordered.push_back(WordTiming(0.0, 0.5));
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u3", false, "", words, &misordered,
                                       &record) == kMalformedTimings);

  std::vector<WordTiming> inverted;
  inverted.push_back(WordTiming(0.0, 0.5));
  inverted.push_back(WordTiming(0.9, 0.6));
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u3", false, "", words, &inverted,
                                       &record) == kMalformedTimings);

  std::vector<WordTiming> negative;
  negative.push_back(WordTiming(-0.1, 0.5));
  negative.push_back(WordTiming(0.6, 0.7));
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u3", false, "", words, &negative,
                                       &record) == kMalformedTimings);

  std::vector<std::string> no_words;
  std::vector<WordTiming> no_timings;
  ALIGNKIT_ASSERT(BuildAlignmentRecord("u4", false, "", no_words, &no_timings,
                                       &record) == kNoWords);
  ALIGNKIT_ASSERT(!record.IsAligned());
}

void UnitTestStats() {
  AlignmentStats stats;
  stats.Add(kAligned);
  stats.Add(kAligned);
  stats.Add(kEngineFailed);
  stats.Add(kWordCountMismatch);
  ALIGNKIT_ASSERT(stats.NumTotal() == 4);
  ALIGNKIT_ASSERT(stats.NumAligned() == 2);
  ALIGNKIT_ASSERT(stats.NumFailed() == 2);
  ALIGNKIT_ASSERT(stats.Count(kEngineFailed) == 1);
  ALIGNKIT_ASSERT(stats.Count(kMalformedTimings) == 0);
  stats.Print();
  stats.Reset();
  ALIGNKIT_ASSERT(stats.NumTotal() == 0);
  ALIGNKIT_ASSERT(std::string(AlignmentStatusToString(kNoWords)) ==
                  "no-words");
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestBuildAligned();
  UnitTestBuildCountMismatch();
  UnitTestBuildFailures();
  UnitTestStats();
  std::cout << "Test OK.\n";
  return 0;
}
