// align/phoneme-table.cc

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

#include "align/phoneme-table.h"
#include "util/alignkit-io.h"
#include "util/text-utils.h"

namespace alignkit {

int32 PhonemeTable::GetOrAddId(const std::string &phoneme) {
  if (!IsToken(phoneme))
    ALIGNKIT_ERR << "Invalid phoneme symbol \"" << phoneme
                 << "\": it is empty or contains whitespace";
  int64 id = symbols_.Find(phoneme);
  if (id == fst::kNoSymbol)
    id = symbols_.AddSymbol(phoneme, symbols_.NumSymbols());
  return static_cast<int32>(id);
}

int32 PhonemeTable::Find(const std::string &phoneme) const {
  int64 id = symbols_.Find(phoneme);
  return (id == fst::kNoSymbol ? -1 : static_cast<int32>(id));
}

std::string PhonemeTable::Symbol(int32 id) const {
  ALIGNKIT_ASSERT(id >= 0 && id < NumPhonemes());
  return symbols_.Find(static_cast<int64>(id));
}

void PhonemeTable::Read(std::istream &is, const std::string &name) {
  fst::SymbolTable symbols("phonemes");
  std::string line;
  int32 line_number = 0;
  while (std::getline(is, line)) {
    line_number++;
    std::vector<std::string> fields;
    SplitStringToVector(line, " \t\r", true, &fields);
    if (fields.empty()) continue;
    int32 id;
    if (fields.size() != 2 || !ConvertStringToInteger(fields[1], &id))
      ALIGNKIT_ERR << "Bad line " << line_number << " in phoneme table "
                   << name << " (expected <symbol> <id>): " << line;
    if (id != symbols.NumSymbols())
      ALIGNKIT_ERR << "Phoneme table " << name << ", line " << line_number
                   << ": expected id " << symbols.NumSymbols()
                   << ", got " << id;
    if (symbols.Find(fields[0]) != fst::kNoSymbol)
      ALIGNKIT_ERR << "Phoneme table " << name << ", line " << line_number
                   << ": symbol " << fields[0] << " appears twice";
    symbols.AddSymbol(fields[0], id);
  }
  if (is.bad())
    ALIGNKIT_ERR << "Error reading phoneme table " << name;
  symbols_ = symbols;
}

void PhonemeTable::Write(std::ostream &os) const {
  if (!symbols_.WriteText(os))
    ALIGNKIT_ERR << "Error writing phoneme table";
}

void PhonemeTable::Read(const std::string &rxfilename) {
  Input ki(rxfilename);
  Read(ki.Stream(), PrintableRxfilename(rxfilename));
}

void PhonemeTable::Write(const std::string &wxfilename) const {
  Output ko(wxfilename, false);
  Write(ko.Stream());
  if (!ko.Close())
    ALIGNKIT_ERR << "Error writing phoneme table to "
                 << PrintableWxfilename(wxfilename);
}

}  // namespace alignkit
