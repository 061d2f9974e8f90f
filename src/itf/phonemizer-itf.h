// itf/phonemizer-itf.h

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

#ifndef ALIGNKIT_ITF_PHONEMIZER_ITF_H_
#define ALIGNKIT_ITF_PHONEMIZER_ITF_H_ 1

#include <string>
#include <vector>

#include "base/alignkit-common.h"

namespace alignkit {

/// Phonemizer is the interface to the text-normalization and phonemization
/// service.  Both methods are const and may be called from several threads.
class Phonemizer {
 public:
  /// Turns raw transcript text into the ordered list of cleaned words that
  /// the aligner and Phonemize() work with.
  virtual void CleanText(const std::string &raw_text,
                         std::vector<std::string> *words) const = 0;

  /// Outputs the phoneme symbols of one cleaned word in the given language.
  /// Returns false if the word is unknown, in which case "phones" is
  /// cleared.
  virtual bool Phonemize(const std::string &word,
                         const std::string &language,
                         std::vector<std::string> *phones) const = 0;

  virtual ~Phonemizer() { }
};

}  // namespace alignkit

#endif  // ALIGNKIT_ITF_PHONEMIZER_ITF_H_
