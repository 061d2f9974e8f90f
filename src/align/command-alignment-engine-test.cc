// align/command-alignment-engine-test.cc

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

#include "align/command-alignment-engine.h"
#include "feat/wave-reader.h"
#include "util/alignkit-io.h"

namespace alignkit {

void UnitTestParseWordTimings() {
  std::vector<WordTiming> timings;
  std::istringstream good("0.0 0.4\n\n0.5\t0.9\r\n");
  ALIGNKIT_ASSERT(ParseWordTimings(good, &timings));
  ALIGNKIT_ASSERT(timings.size() == 2);
  ALIGNKIT_ASSERT(timings[1].start == 0.5 && timings[1].end == 0.9);

  std::istringstream empty("");
  ALIGNKIT_ASSERT(ParseWordTimings(empty, &timings) && timings.empty());

  std::istringstream bad1("0.0 0.4 x\n");
  ALIGNKIT_ASSERT(!ParseWordTimings(bad1, &timings));
  std::istringstream bad2("zero 0.4\n");
  ALIGNKIT_ASSERT(!ParseWordTimings(bad2, &timings));
}

void UnitTestCommandLine() {
  CommandAlignmentEngineOptions opts;
  opts.command = "my-aligner --model m";
  CommandAlignmentEngine engine(opts);
  ALIGNKIT_ASSERT(engine.CommandLine("/tmp/a.wav", "/tmp/a.txt") ==
                  "timeout 60 my-aligner --model m /tmp/a.wav /tmp/a.txt");
  opts.timeout = 0.0;
  CommandAlignmentEngine no_timeout(opts);
  ALIGNKIT_ASSERT(no_timeout.CommandLine("a b.wav", "c.txt") ==
                  "my-aligner --model m 'a b.wav' c.txt");

  opts.command = "";
  bool threw = false;
  try {
    CommandAlignmentEngine bad(opts);
  } catch (const AlignkitFatalError &e) {
    threw = true;
  }
  ALIGNKIT_ASSERT(threw);
}

void UnitTestAlign() {
  // A fake aligner that gives word n the span [n, n + 0.5).
  std::string script = "tmp.command-alignment-engine-test.sh";
  {
    Output ko(script, false);
    ko.Stream() << "#!/bin/sh\n"
                << "test -s \"$1\" || exit 1\n"
                << "awk '{ printf \"%d.0 %d.5\\n\", NR - 1, NR - 1 }' "
                << "\"$2\"\n";
  }
  std::vector<std::vector<BaseFloat> > data(1);
  data[0].resize(1600, 100.0);
  WaveData wave(16000, data);
  AlignmentRequest request;
  request.utt_id = "u1";
  request.wave = &wave;
  request.words.push_back("hello");
  request.words.push_back("there");
  request.words.push_back("world");

  CommandAlignmentEngineOptions opts;
  opts.temp_dir = ".";
  opts.command = "sh " + script;
  CommandAlignmentEngine engine(opts);
  std::vector<WordTiming> timings;
  ALIGNKIT_ASSERT(engine.Align(request, &timings));
  ALIGNKIT_ASSERT(timings.size() == 3);
  ALIGNKIT_ASSERT(timings[2].start == 2.0 && timings[2].end == 2.5);

  // Non-zero exit status.
  opts.command = "false";
  CommandAlignmentEngine failing(opts);
  ALIGNKIT_ASSERT(!failing.Align(request, &timings));

  // Output that is not timings.
  opts.command = "echo";
  CommandAlignmentEngine garbage(opts);
  ALIGNKIT_ASSERT(!garbage.Align(request, &timings));

  // Timeout.
  opts.command = "sleep 10";
  opts.timeout = 0.2;
  CommandAlignmentEngine slow(opts);
  Timer timer;
  ALIGNKIT_ASSERT(!slow.Align(request, &timings));
  ALIGNKIT_ASSERT(timer.Elapsed() < 5.0);
  unlink(script.c_str());
}

}  // namespace alignkit

int main() {
  using namespace alignkit;
  UnitTestParseWordTimings();
  UnitTestCommandLine();
  UnitTestAlign();
  std::cout << "Test OK.\n";
  return 0;
}
