// align/lexicon-phonemizer.cc

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

#include <cctype>

#include "align/lexicon-phonemizer.h"
#include "util/alignkit-io.h"
#include "util/text-utils.h"

namespace alignkit {

void LexiconPhonemizer::Read(const std::string &rxfilename) {
  Input ki(rxfilename);
  std::istream &is = ki.Stream();
  std::string line;
  int32 line_number = 0, num_prons = 0;
  while (std::getline(is, line)) {
    line_number++;
    std::vector<std::string> fields;
    SplitStringToVector(line, " \t\r", true, &fields);
    if (fields.empty()) continue;
    std::vector<std::string> phones(fields.begin() + 1, fields.end());
    AddPronunciation(fields[0], phones);
    num_prons++;
  }
  if (is.bad())
    ALIGNKIT_ERR << "Error reading lexicon " << PrintableRxfilename(rxfilename);
  if (lexicon_.empty())
    ALIGNKIT_WARN << "Lexicon " << PrintableRxfilename(rxfilename)
                  << " is empty";
  ALIGNKIT_VLOG(1) << "Read " << num_prons << " pronunciations of "
                   << lexicon_.size() << " words from "
                   << PrintableRxfilename(rxfilename);
}

void LexiconPhonemizer::AddPronunciation(
    const std::string &word, const std::vector<std::string> &phones) {
  lexicon_.insert(std::make_pair(word, phones));
}

void LexiconPhonemizer::CleanText(const std::string &raw_text,
                                  std::vector<std::string> *words) const {
  std::vector<std::string> tokens;
  SplitStringToVector(raw_text, " \t\r\n", true, &tokens);
  words->clear();
  for (size_t i = 0; i < tokens.size(); i++) {
    const std::string &token = tokens[i];
    size_t begin = 0, end = token.size();
    while (begin < end && isascii(token[begin]) && ispunct(token[begin]))
      begin++;
    while (end > begin && isascii(token[end - 1]) && ispunct(token[end - 1]))
      end--;
    if (begin == end) continue;
    std::string word = token.substr(begin, end - begin);
    for (size_t j = 0; j < word.size(); j++)
      if (isascii(word[j]))
        word[j] = tolower(word[j]);
    words->push_back(word);
  }
}

bool LexiconPhonemizer::Phonemize(const std::string &word,
                                  const std::string &language,
                                  std::vector<std::string> *phones) const {
  std::unordered_map<std::string, std::vector<std::string> >::const_iterator
      iter = lexicon_.find(word);
  if (iter == lexicon_.end()) {
    phones->clear();
    return false;
  }
  *phones = iter->second;
  return true;
}

}  // namespace alignkit
