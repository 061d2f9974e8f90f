// align/phoneme-table-test.cc

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

#include "align/phoneme-table.h"
#include "util/alignkit-io.h"

namespace alignkit {

void UnitTestGetOrAddId() {
  PhonemeTable table;
  ALIGNKIT_ASSERT(table.NumPhonemes() == 0);
  ALIGNKIT_ASSERT(table.GetOrAddId("h") == 0);
  ALIGNKIT_ASSERT(table.GetOrAddId("\xc9\x99") == 1);  // schwa.
  ALIGNKIT_ASSERT(table.GetOrAddId("h") == 0);
  ALIGNKIT_ASSERT(table.GetOrAddId("l") == 2);
  ALIGNKIT_ASSERT(table.NumPhonemes() == 3);
  ALIGNKIT_ASSERT(table.Find("l") == 2 && table.Find("x") == -1);
  ALIGNKIT_ASSERT(table.Symbol(1) == "\xc9\x99");
  // Find() does not add.
  ALIGNKIT_ASSERT(table.NumPhonemes() == 3);

  // The table file is whitespace-separated, so such symbols are refused.
  const char *bad_symbols[] = { "a b", "", "x\t" };
  for (int32 i = 0; i < 3; i++) {
    bool threw = false;
    try {
      table.GetOrAddId(bad_symbols[i]);
    } catch (const AlignkitFatalError &e) {
      threw = true;
    }
    ALIGNKIT_ASSERT(threw);
  }
  ALIGNKIT_ASSERT(table.NumPhonemes() == 3);
}

void UnitTestWriteRead() {
  PhonemeTable table;
  const char *phonemes[] = { "h", "\xcb\x88", "\xc9\x99", "l", "o\xca\x8a" };
  for (size_t i = 0; i < 5; i++)
    table.GetOrAddId(phonemes[i]);
  std::string filename = "tmp.phoneme-table-test.txt";
  table.Write(filename);

  PhonemeTable table2;
  table2.GetOrAddId("stale");
  table2.Read(filename);
  ALIGNKIT_ASSERT(table2.NumPhonemes() == 5);
  for (int32 i = 0; i < 5; i++) {
    ALIGNKIT_ASSERT(table2.Symbol(i) == phonemes[i]);
    ALIGNKIT_ASSERT(table2.Find(phonemes[i]) == i);
  }
  ALIGNKIT_ASSERT(table2.Find("stale") == -1);
  // New symbols continue after the persisted ones.
  ALIGNKIT_ASSERT(table2.GetOrAddId("k") == 5);

  std::ostringstream os1, os2;
  table.Write(os1);
  PhonemeTable table3;
  table3.Read(filename);
  table3.Write(os2);
  ALIGNKIT_ASSERT(os1.str() == os2.str());
  unlink(filename.c_str());
}

void UnitTestStrictRead() {
  const char *bad_tables[] = {
    "a 0\nb 2\n",       // gap.
    "a 1\n",            // does not start at 0.
    "a 0\na 1\n",       // repeated symbol.
    "a 0\nb\n",         // missing id.
    "a 0\nb 1 x\n",     // extra field.
    "a 0\nb one\n",     // non-numeric id.
  };
  for (size_t i = 0; i < sizeof(bad_tables) / sizeof(bad_tables[0]); i++) {
    std::istringstream is(bad_tables[i]);
    PhonemeTable table;
    try {
      table.Read(is, "test-table");
      ALIGNKIT_ERR << "Expected failure reading table " << i;
    } catch (const AlignkitFatalError &e) {
      std::string msg = e.AlignkitMessage();
      ALIGNKIT_ASSERT(msg.find("test-table") != std::string::npos);
      ALIGNKIT_ASSERT(msg.find("line") != std::string::npos);
    }
  }
  // Tabs, spaces and blank lines are all fine.
  std::istringstream is("a\t0\n\nb   1\r\n");
  PhonemeTable table;
  table.Read(is, "test-table");
  ALIGNKIT_ASSERT(table.NumPhonemes() == 2 && table.Find("b") == 1);
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestGetOrAddId();
  UnitTestWriteRead();
  UnitTestStrictRead();
  std::cout << "Test OK.\n";
  return 0;
}
