// align/command-alignment-engine.cc

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

#include <stdio.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

#include "align/command-alignment-engine.h"
#include "util/alignkit-io.h"
#include "util/parse-options.h"
#include "util/text-utils.h"

namespace alignkit {

namespace {

// A file created with mkstemps() and deleted when this goes out of scope.
class TempFile {
 public:
  TempFile(const std::string &dir, const std::string &suffix) {
    std::string pattern = JoinPath(dir, "alignkit-XXXXXX") + suffix;
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = mkstemps(&buf[0], suffix.size());
    if (fd < 0) {
      ALIGNKIT_WARN << "Could not create temporary file " << pattern;
    } else {
      close(fd);
      filename_ = &buf[0];
    }
  }
  ~TempFile() {
    if (!filename_.empty())
      unlink(filename_.c_str());
  }
  bool Ok() const { return !filename_.empty(); }
  const std::string &Filename() const { return filename_; }
 private:
  std::string filename_;
  ALIGNKIT_DISALLOW_COPY_AND_ASSIGN(TempFile);
};

}  // namespace


bool ParseWordTimings(std::istream &is, std::vector<WordTiming> *timings) {
  timings->clear();
  std::string line;
  while (std::getline(is, line)) {
    std::vector<std::string> fields;
    SplitStringToVector(line, " \t\r", true, &fields);
    if (fields.empty()) continue;
    WordTiming timing;
    if (fields.size() != 2 ||
        !ConvertStringToReal(fields[0], &timing.start) ||
        !ConvertStringToReal(fields[1], &timing.end)) {
      ALIGNKIT_WARN << "Bad line in aligner output: " << line;
      return false;
    }
    timings->push_back(timing);
  }
  return true;
}


CommandAlignmentEngine::CommandAlignmentEngine(
    const CommandAlignmentEngineOptions &opts): opts_(opts) {
  if (opts_.command.empty())
    ALIGNKIT_ERR << "No aligner command given (use --command)";
}

std::string CommandAlignmentEngine::CommandLine(
    const std::string &wav_filename,
    const std::string &words_filename) const {
  std::ostringstream cmd;
  if (opts_.timeout > 0)
    cmd << "timeout " << opts_.timeout << " ";
  cmd << opts_.command << " " << ParseOptions::Escape(wav_filename) << " "
      << ParseOptions::Escape(words_filename);
  return cmd.str();
}

bool CommandAlignmentEngine::Align(const AlignmentRequest &request,
                                   std::vector<WordTiming> *timings) {
  ALIGNKIT_ASSERT(request.wave != NULL);
  TempFile wav_file(opts_.temp_dir, ".wav"), words_file(opts_.temp_dir, ".txt");
  if (!wav_file.Ok() || !words_file.Ok())
    return false;

  {
    std::ofstream os(wav_file.Filename().c_str(),
                     std::ios_base::out | std::ios_base::binary);
    try {
      request.wave->Write(os);
    } catch (const AlignkitFatalError &e) {
      ALIGNKIT_WARN << "Could not write audio of " << request.utt_id
                    << " for the aligner: " << e.AlignkitMessage();
      return false;
    }
    os.close();
    if (os.fail()) {
      ALIGNKIT_WARN << "Error writing " << wav_file.Filename();
      return false;
    }
  }
  {
    std::ofstream os(words_file.Filename().c_str());
    for (size_t i = 0; i < request.words.size(); i++)
      os << request.words[i] << '\n';
    os.close();
    if (os.fail()) {
      ALIGNKIT_WARN << "Error writing " << words_file.Filename();
      return false;
    }
  }

  std::string cmd = CommandLine(wav_file.Filename(), words_file.Filename());
  ALIGNKIT_VLOG(2) << "Running " << cmd;
  FILE *pipe = popen(cmd.c_str(), "r");
  if (pipe == NULL) {
    ALIGNKIT_WARN << "Failed to run aligner command: " << cmd;
    return false;
  }
  std::string output;
  char buffer[4096];
  while (fgets(buffer, sizeof(buffer), pipe) != NULL)
    output += buffer;
  int status = pclose(pipe);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    // timeout(1) exits with 124 when the time limit is hit.
    if (status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 124)
      ALIGNKIT_WARN << "Aligner timed out after " << opts_.timeout
                    << " seconds on utterance " << request.utt_id;
    else
      ALIGNKIT_WARN << "Aligner failed on utterance " << request.utt_id
                    << " (status " << status << "), command was: " << cmd;
    return false;
  }
  std::istringstream is(output);
  return ParseWordTimings(is, timings);
}

}  // namespace alignkit
