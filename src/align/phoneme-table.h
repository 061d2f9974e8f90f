// align/phoneme-table.h

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

#ifndef ALIGNKIT_ALIGN_PHONEME_TABLE_H_
#define ALIGNKIT_ALIGN_PHONEME_TABLE_H_

#include <string>

#include <fst/symbol-table.h>

#include "base/alignkit-common.h"

namespace alignkit {

/// \addtogroup align_group
/// @{

/// The phoneme <-> integer id map used for encoding.  Ids are dense from
/// zero in first-seen order and are never changed once assigned; to get the
/// same ids as an earlier run, Read() the table that run wrote before
/// encoding anything.  The symbols are kept in an OpenFst SymbolTable, and
/// the file format is the usual symbol table text format, one
/// "symbol<tab>id" line per phoneme in id order.
class PhonemeTable {
 public:
  PhonemeTable(): symbols_("phonemes") { }

  int32 NumPhonemes() const { return symbols_.NumSymbols(); }

  /// Returns the id of "phoneme", appending it with id NumPhonemes() if it
  /// is not in the table yet.  Dies if "phoneme" is not a token, since the
  /// table file is whitespace-separated.
  int32 GetOrAddId(const std::string &phoneme);

  /// Returns the id of "phoneme", or -1 if it is not in the table.
  int32 Find(const std::string &phoneme) const;

  /// Returns the phoneme with this id; requires 0 <= id < NumPhonemes().
  std::string Symbol(int32 id) const;

  /// Replaces the contents with the table in the file.  The file must have
  /// ids 0, 1, 2, ... in line order and no repeated symbols; anything else
  /// is fatal, with the file and line named.  Any whitespace may separate
  /// symbol and id.
  void Read(const std::string &rxfilename);

  /// Writes the table; dies on error.
  void Write(const std::string &wxfilename) const;

  void Read(std::istream &is, const std::string &name);
  void Write(std::ostream &os) const;

 private:
  fst::SymbolTable symbols_;
};

/// @} end "addtogroup align_group"

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_PHONEME_TABLE_H_
