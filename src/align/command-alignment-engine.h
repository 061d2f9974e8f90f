// align/command-alignment-engine.h

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

#ifndef ALIGNKIT_ALIGN_COMMAND_ALIGNMENT_ENGINE_H_
#define ALIGNKIT_ALIGN_COMMAND_ALIGNMENT_ENGINE_H_

#include <string>
#include <vector>

#include "base/alignkit-common.h"
#include "itf/options-itf.h"
#include "itf/alignment-engine-itf.h"

namespace alignkit {

struct CommandAlignmentEngineOptions {
  std::string command;
  double timeout;
  std::string temp_dir;

  CommandAlignmentEngineOptions(): timeout(60.0), temp_dir("/tmp") { }

  void Register(OptionsItf *opts) {
    opts->Register("command", &command, "Aligner command; it is run as "
                   "<command> <wav-file> <words-file> and must print one "
                   "\"start end\" line (seconds) per word");
    opts->Register("timeout", &timeout, "Seconds after which the aligner is "
                   "killed and the utterance counted as failed (<= 0 means "
                   "no limit)");
    opts->Register("temp-dir", &temp_dir, "Directory for the temporary audio "
                   "and word files given to the aligner");
  }
};

/// An AlignmentEngine that runs an external aligner program for each
/// utterance, through the shell and under timeout(1).  The audio is written
/// to a temporary wave file and the words to a temporary text file, one per
/// line.  A non-zero exit status, a timeout or output that does not parse
/// is an alignment failure.
class CommandAlignmentEngine : public AlignmentEngine {
 public:
  explicit CommandAlignmentEngine(const CommandAlignmentEngineOptions &opts);

  virtual bool Align(const AlignmentRequest &request,
                     std::vector<WordTiming> *timings);

  /// Returns the shell command run for the given files.
  std::string CommandLine(const std::string &wav_filename,
                          const std::string &words_filename) const;

 private:
  CommandAlignmentEngineOptions opts_;
};

/// Parses aligner output, one "start end" pair per non-blank line.  Returns
/// false if any line is not exactly two numbers.
bool ParseWordTimings(std::istream &is, std::vector<WordTiming> *timings);

}  // namespace alignkit

#endif  // ALIGNKIT_ALIGN_COMMAND_ALIGNMENT_ENGINE_H_
