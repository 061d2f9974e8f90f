// util/alignkit-io.cc

// Copyright 2009-2011  Microsoft Corporation;  Jan Silovsky
//           2026       Alignkit Authors

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

#include "util/alignkit-io.h"

#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace alignkit {

std::string PrintableRxfilename(const std::string &rxfilename) {
  if (rxfilename == "" || rxfilename == "-") {
    return "standard input";
  } else {
    return rxfilename;
  }
}

std::string PrintableWxfilename(const std::string &wxfilename) {
  if (wxfilename == "" || wxfilename == "-") {
    return "standard output";
  } else {
    return wxfilename;
  }
}


Output::Output(const std::string &wxfilename, bool binary):
    is_open_(false), is_stdout_(false) {
  if (!Open(wxfilename, binary)) {
    ALIGNKIT_ERR << "Error opening output stream "
                 << PrintableWxfilename(wxfilename);
  }
}

bool Output::Open(const std::string &wxfilename, bool binary) {
  if (is_open_) Close();
  filename_ = wxfilename;
  if (wxfilename == "" || wxfilename == "-") {
    is_stdout_ = true;
    is_open_ = true;
    return true;
  }
  is_stdout_ = false;
  ofs_.open(wxfilename.c_str(), binary ? std::ios_base::out | std::ios_base::binary
            : std::ios_base::out);
  if (!ofs_.is_open()) {
    ALIGNKIT_WARN << "Failed to open file " << wxfilename << " for writing";
    return false;
  }
  is_open_ = true;
  return true;
}

std::ostream &Output::Stream() {
  if (!is_open_)
    ALIGNKIT_ERR << "Output::Stream() called on closed stream.";
  if (is_stdout_) return std::cout;
  return ofs_;
}

bool Output::Close() {
  if (!is_open_) return true;
  bool ans = true;
  if (is_stdout_) {
    std::cout.flush();
    ans = !std::cout.fail();
  } else {
    ofs_.close();
    ans = !ofs_.fail();
    ofs_.clear();
  }
  is_open_ = false;
  return ans;
}

Output::~Output() {
  if (is_open_) {
    if (!Close())
      ALIGNKIT_ERR << "Error closing output file "
                   << PrintableWxfilename(filename_);
  }
}


Input::Input(const std::string &rxfilename, bool binary):
    is_open_(false), is_stdin_(false) {
  if (!Open(rxfilename, binary)) {
    ALIGNKIT_ERR << "Error opening input stream "
                 << PrintableRxfilename(rxfilename);
  }
}

bool Input::Open(const std::string &rxfilename, bool binary) {
  if (is_open_) Close();
  filename_ = rxfilename;
  if (rxfilename == "" || rxfilename == "-") {
    is_stdin_ = true;
    is_open_ = true;
    return true;
  }
  is_stdin_ = false;
  ifs_.open(rxfilename.c_str(), binary ? std::ios_base::in | std::ios_base::binary
            : std::ios_base::in);
  if (!ifs_.is_open()) {
    ALIGNKIT_WARN << "Failed to open file " << rxfilename << " for reading";
    return false;
  }
  is_open_ = true;
  return true;
}

std::istream &Input::Stream() {
  if (!is_open_)
    ALIGNKIT_ERR << "Input::Stream(), not open.";
  if (is_stdin_) return std::cin;
  return ifs_;
}

void Input::Close() {
  if (is_open_ && !is_stdin_) {
    ifs_.close();
    ifs_.clear();
  }
  is_open_ = false;
}

Input::~Input() { Close(); }


bool FileExists(const std::string &filename) {
  struct stat st;
  if (stat(filename.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode);
}

bool DirectoryExists(const std::string &dirname) {
  struct stat st;
  if (stat(dirname.c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

void MakeDirectory(const std::string &dirname) {
  if (DirectoryExists(dirname)) return;
  if (mkdir(dirname.c_str(), 0777) != 0 && !DirectoryExists(dirname))
    ALIGNKIT_ERR << "Could not create directory " << dirname << ": "
                 << strerror(errno);
}

std::string FileStem(const std::string &path) {
  std::string::size_type slash = path.find_last_of('/');
  std::string base = (slash == std::string::npos ? path :
                      path.substr(slash + 1));
  std::string::size_type dot = base.find_last_of('.');
  if (dot == std::string::npos || dot == 0) return base;
  return base.substr(0, dot);
}

std::string JoinPath(const std::string &dir, const std::string &name) {
  if (dir.empty()) return name;
  if (dir[dir.size() - 1] == '/') return dir + name;
  return dir + "/" + name;
}

}  // end namespace alignkit
