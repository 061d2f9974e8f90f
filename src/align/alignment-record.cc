// align/alignment-record.cc

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
#include "util/text-utils.h"

namespace alignkit {

namespace {

// Checks one span against the previous span end; "what" names it in
// messages.
bool CheckSpan(double start, double end, double prev_end,
               const std::string &what, std::string *why) {
  std::ostringstream msg;
  if (!ALIGNKIT_ISFINITE(start) || !ALIGNKIT_ISFINITE(end)) {
    msg << what << " has non-finite time (" << start << ", " << end << ")";
  } else if (start < 0.0) {
    msg << what << " starts before zero (" << start << ")";
  } else if (end <= start) {
    msg << what << " does not end after it starts (" << start
        << ", " << end << ")";
  } else if (start < prev_end) {
    msg << what << " starts at " << start
        << ", before the previous one ends at " << prev_end;
  } else {
    return true;
  }
  if (why != NULL) *why = msg.str();
  return false;
}

}  // namespace

bool CheckWordSpans(const std::vector<WordSpan> &words, std::string *why) {
  double prev_end = 0.0;
  for (size_t i = 0; i < words.size(); i++) {
    const WordSpan &word = words[i];
    std::ostringstream what;
    what << "word " << i << " (" << word.text << ")";
    if (!CheckSpan(word.start, word.end, prev_end, what.str(), why))
      return false;
    double prev_phone_end = word.start;
    for (size_t j = 0; j < word.phones.size(); j++) {
      const PhoneSpan &phone = word.phones[j];
      std::ostringstream phone_what;
      phone_what << "phone " << j << " (" << phone.phone << ") of "
                 << what.str();
      if (!CheckSpan(phone.start, phone.end, prev_phone_end,
                     phone_what.str(), why))
        return false;
      if (phone.end > word.end) {
        if (why != NULL) {
          std::ostringstream msg;
          msg << phone_what.str() << " ends at " << phone.end
              << ", after the word ends at " << word.end;
          *why = msg.str();
        }
        return false;
      }
      prev_phone_end = phone.end;
    }
    prev_end = word.end;
  }
  return true;
}

bool IsValidUtteranceId(const std::string &utt_id) {
  return IsToken(utt_id) && utt_id.find('|') == std::string::npos;
}

}  // namespace alignkit
