// util/text-utils-test.cc

// Copyright 2009-2011     Microsoft Corporation
//                2017     Johns Hopkins University (author: Daniel Povey)
//                2026     Alignkit Authors

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

#include "base/alignkit-common.h"
#include "util/text-utils.h"

namespace alignkit {

char GetRandChar() {
  return static_cast<char>(32 + Rand() % 95);  // between ' ' and '~'
}

const char *ws_delim = " \t\n\r";
char GetRandDelim() {
  if (Rand() % 2 == 0)
    return static_cast<char>(33 + Rand() % 94);  // between '!' and '~';
  else
    return ws_delim[Rand() % 4];
}


void TestSplitStringToVector() {
  // srand((unsigned int)time(NULL));
  // didn't compile on cygwin.

  {
    std::vector<std::string> str_vec;
    SplitStringToVector("", " ", false, &str_vec);
    ALIGNKIT_ASSERT(str_vec.size() == 1);  // If this fails it may just mean
    // that someone changed the
    // semantics of SplitStringToVector in a reasonable way.
    SplitStringToVector("", " ", true, &str_vec);
    ALIGNKIT_ASSERT(str_vec.empty());
  }
  for (int j = 0; j < 100; j++) {
    std::vector<std::string> str_vec;
    int sz = Rand() % 73;
    std::string full;
    for (int i = 0; i < sz-1; i++) {
      full.push_back((Rand() % 7 == 0)? GetRandDelim() : GetRandChar());
    }
    std::string delim;
    delim.push_back(GetRandDelim());
    bool omit_empty_strings = (Rand() %2 == 0)? true : false;
    SplitStringToVector(full, delim.c_str(), omit_empty_strings, &str_vec);
    std::string new_full;
    for (size_t i = 0; i < str_vec.size(); i++) {
      if (omit_empty_strings) ALIGNKIT_ASSERT(str_vec[i] != "");
      new_full.append(str_vec[i]);
      if (i < str_vec.size() -1) new_full.append(delim);
    }
    std::string new_full2;
    JoinVectorToString(str_vec, delim.c_str(), omit_empty_strings, &new_full2);
    if (omit_empty_strings) {  // sequences of delimiters cannot be matched
      size_t start = full.find_first_not_of(delim),
          end = full.find_last_not_of(delim);
      if (start == std::string::npos) {  // only delimiters
        ALIGNKIT_ASSERT(end == std::string::npos);
      } else {
        std::string full_test;
        char last = '\0';
        for (size_t i = start; i <= end; i++) {
          if (full[i] != last || last != *delim.c_str())
            full_test.push_back(full[i]);
          last = full[i];
        }
        if (!full.empty()) {
          ALIGNKIT_ASSERT(new_full.compare(full_test) == 0);
          ALIGNKIT_ASSERT(new_full2.compare(full_test) == 0);
        }
      }
    } else if (!full.empty()) {
      ALIGNKIT_ASSERT(new_full.compare(full) == 0);
      ALIGNKIT_ASSERT(new_full2.compare(full) == 0);
    }
  }
}

void TestSplitStringToIntegers() {
  {
    std::vector<int32> v;
    ALIGNKIT_ASSERT(SplitStringToIntegers("-1:2:4", ":", false, &v) == true
                    && v.size() == 3 && v[0] == -1 && v[1] == 2 && v[2] == 4);
    ALIGNKIT_ASSERT(SplitStringToIntegers("-1:2:4:", ":", false, &v) == false);
    ALIGNKIT_ASSERT(SplitStringToIntegers(":-1::2:4:", ":", true, &v) == true
                    && v.size() == 3 && v[0] == -1 && v[1] == 2 && v[2] == 4);
    ALIGNKIT_ASSERT(SplitStringToIntegers("-1\n2\t4", " \n\t\r", false, &v) == true
                    && v.size() == 3 && v[0] == -1 && v[1] == 2 && v[2] == 4);
    ALIGNKIT_ASSERT(SplitStringToIntegers(" ", " \n\t\r", true, &v) == true
                    && v.size() == 0);
    ALIGNKIT_ASSERT(SplitStringToIntegers("", " \n\t\r", false, &v) == true
                    && v.size() == 0);
  }

  {
    std::vector<uint32> v;
    ALIGNKIT_ASSERT(SplitStringToIntegers("-1:2:4", ":", false, &v) == false);
    // cannot put negative number in uint32.
  }
}

void TestConvertStringToInteger() {
  int32 i;
  ALIGNKIT_ASSERT(ConvertStringToInteger("12345", &i) && i == 12345);
  ALIGNKIT_ASSERT(ConvertStringToInteger("-12345", &i) && i == -12345);
  char j;
  ALIGNKIT_ASSERT(!ConvertStringToInteger("-12345", &j));  // too big for char.

  ALIGNKIT_ASSERT(ConvertStringToInteger(" -12345 ", &i));  // whitespace accepted

  ALIGNKIT_ASSERT(!ConvertStringToInteger("a ", &i));  // non-integers rejected.

  ALIGNKIT_ASSERT(!ConvertStringToInteger("0 1", &i));  // junk after integer.

  uint32 u;
  ALIGNKIT_ASSERT(!ConvertStringToInteger("-1", &u));  // no negatives in uint.
  ALIGNKIT_ASSERT(!ConvertStringToInteger("", &i));
}

template<class Real>
void TestConvertStringToReal() {
  Real d;
  ALIGNKIT_ASSERT(ConvertStringToReal("1", &d) && d == 1.0);
  ALIGNKIT_ASSERT(ConvertStringToReal("-1", &d) && d == -1.0);
  ALIGNKIT_ASSERT(ConvertStringToReal("-1", &d) && d == -1.0);
  ALIGNKIT_ASSERT(ConvertStringToReal(" -1 ", &d) && d == -1.0);
  ALIGNKIT_ASSERT(!ConvertStringToReal("-1 x", &d));
  ALIGNKIT_ASSERT(!ConvertStringToReal("-1f", &d));
  ALIGNKIT_ASSERT(ConvertStringToReal("12.25", &d) && d == 12.25);
  ALIGNKIT_ASSERT(ConvertStringToReal("1e-2", &d) &&
                  ApproxEqual(d, 0.01, 1.0e-05));
  ALIGNKIT_ASSERT(!ConvertStringToReal("", &d));
}


void TestTrim() {
  std::string s("  a b \t\n");
  Trim(&s);
  ALIGNKIT_ASSERT(s == "a b");
  s = " \t ";
  Trim(&s);
  ALIGNKIT_ASSERT(s == "");
  s = "abc";
  Trim(&s);
  ALIGNKIT_ASSERT(s == "abc");
}

void TestSplitStringOnFirstSpace() {
  std::string a, b;
  SplitStringOnFirstSpace("a b", &a, &b);
  ALIGNKIT_ASSERT(a == "a" && b == "b");
  SplitStringOnFirstSpace("aa bb", &a, &b);
  ALIGNKIT_ASSERT(a == "aa" && b == "bb");
  SplitStringOnFirstSpace("aa", &a, &b);
  ALIGNKIT_ASSERT(a == "aa" && b == "");
  SplitStringOnFirstSpace(" aa \n\t ", &a, &b);
  ALIGNKIT_ASSERT(a == "aa" && b == "");
  SplitStringOnFirstSpace("  \n\t ", &a, &b);
  ALIGNKIT_ASSERT(a == "" && b == "");
  SplitStringOnFirstSpace(" aa   bb \n\t ", &a, &b);
  ALIGNKIT_ASSERT(a == "aa" && b == "bb");
  SplitStringOnFirstSpace(" aa   bb cc ", &a, &b);
  ALIGNKIT_ASSERT(a == "aa" && b == "bb cc");
  SplitStringOnFirstSpace(" aa\tbb cc ", &a, &b);
  ALIGNKIT_ASSERT(a == "aa" && b == "bb cc");
}

void TestIsToken() {
  ALIGNKIT_ASSERT(IsToken("a"));
  ALIGNKIT_ASSERT(IsToken("utt_0001"));
  ALIGNKIT_ASSERT(!IsToken(""));
  ALIGNKIT_ASSERT(!IsToken("a b"));
  ALIGNKIT_ASSERT(!IsToken("a\tb"));
  ALIGNKIT_ASSERT(IsToken("\xc3\xa9t\xc3\xa9"));  // UTF-8 is allowed.
}

void TestIsLine() {
  ALIGNKIT_ASSERT(IsLine("a"));
  ALIGNKIT_ASSERT(IsLine("a b"));
  ALIGNKIT_ASSERT(!IsLine("a\nb"));
  ALIGNKIT_ASSERT(!IsLine("a b "));
  ALIGNKIT_ASSERT(!IsLine(" a b"));
}

void TestIsValidUtf8() {
  ALIGNKIT_ASSERT(IsValidUtf8(""));
  ALIGNKIT_ASSERT(IsValidUtf8("hello world"));
  ALIGNKIT_ASSERT(IsValidUtf8("h\xc3\xa9llo"));          // é
  ALIGNKIT_ASSERT(IsValidUtf8("\xc9\x99\xcb\x88"));     // IPA
  ALIGNKIT_ASSERT(IsValidUtf8("\xe2\x82\xac"));         // euro sign
  ALIGNKIT_ASSERT(IsValidUtf8("\xf0\x9f\x98\x80"));     // U+1F600
  ALIGNKIT_ASSERT(!IsValidUtf8("h\xe9llo"));              // Latin-1 é
  ALIGNKIT_ASSERT(!IsValidUtf8("\xe9"));
  ALIGNKIT_ASSERT(!IsValidUtf8("\x80"));                  // continuation
  ALIGNKIT_ASSERT(!IsValidUtf8("\xc0\xaf"));             // overlong '/'
  ALIGNKIT_ASSERT(!IsValidUtf8("\xe2\x82"));             // truncated
  ALIGNKIT_ASSERT(!IsValidUtf8("\xed\xa0\x80"));         // surrogate
  ALIGNKIT_ASSERT(!IsValidUtf8("\xf4\x90\x80\x80"));     // > U+10FFFF
  ALIGNKIT_ASSERT(!IsValidUtf8("\xff"));
}

}  // end namespace alignkit

int main() {
  using namespace alignkit;
  TestSplitStringToVector();
  TestSplitStringToIntegers();
  TestConvertStringToInteger();
  TestConvertStringToReal<float>();
  TestConvertStringToReal<double>();
  TestTrim();
  TestSplitStringOnFirstSpace();
  TestIsToken();
  TestIsLine();
  TestIsValidUtf8();
  std::cout << "Test OK\n";
}
