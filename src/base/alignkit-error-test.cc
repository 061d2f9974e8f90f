// base/alignkit-error-test.cc

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

#include "base/alignkit-common.h"

namespace alignkit {

void MyFunction2() { ALIGNKIT_ERR << "Ignore this error"; }

void MyFunction1() { MyFunction2(); }

// With --verbose, errors come with a stack trace.
void UnitTestError() {
  SetVerboseLevel(1);
  std::cerr << "Ignore next error:\n";
  MyFunction1();
}

void VerifySymbolRange(const std::string &trace, const bool want_found,
                       const std::string &want_symbol) {
  size_t begin, end;
  const bool found = internal::LocateSymbolRange(trace, &begin, &end);
  if (found != want_found) {
    ALIGNKIT_ERR << "Found mismatch, got " << found << " want " << want_found;
  }
  if (!found) {
    return;
  }
  const std::string symbol = trace.substr(begin, end - begin);
  if (symbol != want_symbol) {
    ALIGNKIT_ERR << "Symbol mismatch, got " << symbol << " want "
                 << want_symbol;
  }
}

void TestLocateSymbolRange() {
  VerifySymbolRange("", false, "");
  VerifySymbolRange(
      R"TRACE(./alignkit-error-test(_ZN8alignkit13UnitTestErrorEv+0xb) [0x804965d])TRACE",
      true, "_ZN8alignkit13UnitTestErrorEv");
  // It is ok thread_start is not found because it is a C symbol.
  VerifySymbolRange(
      R"TRACE(31  libsystem_pthread.dylib             0x00007fff6fe4e40d thread_start + 13)TRACE",
      false, "");
  VerifySymbolRange(
      R"TRACE(0 server 0x000000010f67614d _ZNK8alignkit13MessageLogger10LogMessageEv + 813)TRACE",
      true, "_ZNK8alignkit13MessageLogger10LogMessageEv");
}

static int32 num_handled = 0;
static std::string last_message, last_file;
static int last_severity = 0;

static void RecordingHandler(const LogMessageEnvelope &envelope,
                             const char *message) {
  num_handled++;
  last_message = message;
  last_file = envelope.file;
  last_severity = envelope.severity;
}

void TestLogHandler() {
  LogHandler old_handler = SetLogHandler(RecordingHandler);
  int32 num_warnings = NumWarningsLogged();
  ALIGNKIT_WARN << "warning number " << 1;
  ALIGNKIT_ASSERT(last_severity == LogMessageEnvelope::kWarning);
  ALIGNKIT_ASSERT(last_message == "warning number 1");
  // At most one directory is kept.
  ALIGNKIT_ASSERT(last_file == "base/alignkit-error-test.cc" ||
                  last_file == "alignkit-error-test.cc");
  ALIGNKIT_LOG << "log message";
  ALIGNKIT_ASSERT(num_handled == 2 && last_message == "log message");
  ALIGNKIT_ASSERT(NumWarningsLogged() == num_warnings + 1);

  SetVerboseLevel(0);
  ALIGNKIT_VLOG(2) << "not printed";
  ALIGNKIT_ASSERT(num_handled == 2);
  SetVerboseLevel(2);
  ALIGNKIT_VLOG(2) << "printed at level 2";
  ALIGNKIT_ASSERT(num_handled == 3 && last_severity == 2);
  SetVerboseLevel(0);

  bool threw = false;
  try {
    ALIGNKIT_ERR << "failure on line " << 3;
  } catch (const AlignkitFatalError &e) {
    threw = true;
    ALIGNKIT_ASSERT(std::string(e.AlignkitMessage()) == "failure on line 3");
    ALIGNKIT_ASSERT(std::string(e.what()) == "alignkit::AlignkitFatalError");
  }
  ALIGNKIT_ASSERT(threw && num_handled == 4);
  ALIGNKIT_ASSERT(last_severity == LogMessageEnvelope::kError);
  ALIGNKIT_ASSERT(SetLogHandler(old_handler) == RecordingHandler);
}

} // namespace alignkit

int main() {
  alignkit::TestLocateSymbolRange();
  alignkit::TestLogHandler();

  alignkit::SetProgramName("/foo/bar/alignkit-error-test");
  try {
    alignkit::UnitTestError();
    ALIGNKIT_ASSERT(0); // should not happen.
    exit(1);
  } catch (alignkit::AlignkitFatalError &e) {
    std::cout << "The error we generated was: '" << e.AlignkitMessage()
              << "'\n";
  }
}
