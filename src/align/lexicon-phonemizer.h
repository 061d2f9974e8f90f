// align/lexicon-phonemizer.h

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

#ifndef ALIGNKIT_ALIGN_LEXICON_PHONEMIZER_H_
#define ALIGNKIT_ALIGN_LEXICON_PHONEMIZER_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "base/alignkit-common.h"
#include "itf/phonemizer-itf.h"

namespace alignkit {

/// A Phonemizer backed by a pronunciation lexicon in the lexicon.txt
/// format, "word p1 p2 ..." per line.  If a word has several
/// pronunciations the first one is used.  The lexicon is for one language;
/// the language argument of Phonemize() is not consulted.
///
/// CleanText() splits on whitespace, strips ASCII punctuation from both
/// ends of each token, lower-cases ASCII letters and drops tokens that end
/// up empty.  Non-ASCII characters are kept as they are.
class LexiconPhonemizer : public Phonemizer {
 public:
  LexiconPhonemizer() { }

  /// Reads the lexicon; a line without a word is fatal.
  void Read(const std::string &rxfilename);

  /// Adds a pronunciation; ignored if the word already has one.
  void AddPronunciation(const std::string &word,
                        const std::vector<std::string> &phones);

  int32 NumWords() const { return lexicon_.size(); }

  virtual void CleanText(const std::string &raw_text,
                         std::vector<std::string> *words) const;

  virtual bool Phonemize(const std::string &word,
                         const std::string &language,
                         std::vector<std::string> *phones) const;

 private:
  std::unordered_map<std::string, std::vector<std::string> > lexicon_;
};

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_LEXICON_PHONEMIZER_H_
