// align/lexicon-phonemizer-test.cc

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
#include "util/alignkit-io.h"

namespace alignkit {

void UnitTestCleanText() {
  LexiconPhonemizer phonemizer;
  std::vector<std::string> words;
  phonemizer.CleanText("  Hello, World!  \"It's\" -- fine. ", &words);
  ALIGNKIT_ASSERT(words.size() == 4);
  ALIGNKIT_ASSERT(words[0] == "hello" && words[1] == "world");
  ALIGNKIT_ASSERT(words[2] == "it's" && words[3] == "fine");

  phonemizer.CleanText("...", &words);
  ALIGNKIT_ASSERT(words.empty());
  phonemizer.CleanText("", &words);
  ALIGNKIT_ASSERT(words.empty());

  // Non-ASCII bytes are left as they are.
  phonemizer.CleanText("Caf\xc3\xa9!", &words);
  ALIGNKIT_ASSERT(words.size() == 1 && words[0] == "caf\xc3\xa9");
}

void UnitTestLexicon() {
  std::string filename = "tmp.lexicon-phonemizer-test.txt";
  {
    Output ko(filename, false);
    ko.Stream() << "hello h \xc9\x99 l \xcb\x88o\xca\x8a\n"
                << "\n"
                << "world w \xcb\x88\xc9\x9c\xcb\x90 l d\n"
                << "hello h \xc9\x9b l o\xca\x8a\n"
                << "uh\n";
  }
  LexiconPhonemizer phonemizer;
  phonemizer.Read(filename);
  ALIGNKIT_ASSERT(phonemizer.NumWords() == 3);

  std::vector<std::string> phones;
  ALIGNKIT_ASSERT(phonemizer.Phonemize("hello", "en-us", &phones));
  // The first pronunciation wins.
  ALIGNKIT_ASSERT(phones.size() == 4 && phones[1] == "\xc9\x99");
  ALIGNKIT_ASSERT(phonemizer.Phonemize("uh", "en-us", &phones));
  ALIGNKIT_ASSERT(phones.empty());
  ALIGNKIT_ASSERT(!phonemizer.Phonemize("unknown", "en-us", &phones));
  ALIGNKIT_ASSERT(!phonemizer.Phonemize("Hello", "en-us", &phones));
  unlink(filename.c_str());
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestCleanText();
  UnitTestLexicon();
  std::cout << "Test OK.\n";
  return 0;
}
