// util/alignkit-io.h

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

#ifndef ALIGNKIT_UTIL_ALIGNKIT_IO_H_
#define ALIGNKIT_UTIL_ALIGNKIT_IO_H_

#include <fstream>
#include <iostream>
#include <string>

#include "base/alignkit-common.h"

namespace alignkit {

/// \addtogroup io_group
/// @{

/// PrintableRxfilename turns the filename into a more printable form
/// (for error messages): it converts "-" into "standard input".
std::string PrintableRxfilename(const std::string &rxfilename);

/// PrintableWxfilename turns the filename into a more printable form
/// (for error messages): it converts "-" into "standard output".
std::string PrintableWxfilename(const std::string &wxfilename);

/// Output is a wrapper for writing text or binary files.  The filename "-"
/// (or the empty string) means the standard output.  Errors opening or closing
/// the file are fatal and name the file.
class Output {
 public:
  // The normal constructor, provided for convenience.
  // Equivalent to calling with default constructor then Open()
  // with these arguments.
  Output(const std::string &filename, bool binary);

  Output(): is_open_(false), is_stdout_(false) {}

  /// This opens the stream.  Returns true on success; on failure it
  /// prints a warning and returns false.
  bool Open(const std::string &wxfilename, bool binary);

  inline bool IsOpen() const { return is_open_; }

  /// Returns the stream.  It is an error to call this if the stream is not
  /// open.
  std::ostream &Stream();

  /// Closes the stream (flushing it first).  Returns true on success.
  bool Close();

  /// Calls Close() and dies with ALIGNKIT_ERR if that fails.
  ~Output();

 private:
  bool is_open_;
  bool is_stdout_;
  std::string filename_;
  std::ofstream ofs_;
  ALIGNKIT_DISALLOW_COPY_AND_ASSIGN(Output);
};


/// Input is the reading counterpart of Output: "-" or the empty string means
/// the standard input.
class Input {
 public:
  /// The normal constructor.  Dies if the file could not be opened.
  explicit Input(const std::string &rxfilename, bool binary = false);

  Input(): is_open_(false), is_stdin_(false) {}

  /// Returns true on success, prints a warning and returns false on failure.
  bool Open(const std::string &rxfilename, bool binary = false);

  // Returns true if currently open.
  inline bool IsOpen() const { return is_open_; }

  // It is never an error to call Close if you know the stream is open.
  void Close();

  // Returns the underlying stream. Dies if the stream is not open.
  std::istream &Stream();

  ~Input();

 private:
  bool is_open_;
  bool is_stdin_;
  std::string filename_;
  std::ifstream ifs_;
  ALIGNKIT_DISALLOW_COPY_AND_ASSIGN(Input);
};

/// Returns true if the file exists and can be opened for reading.
bool FileExists(const std::string &filename);

/// Returns true if the path names an existing directory.
bool DirectoryExists(const std::string &dirname);

/// Creates the directory if it does not exist yet (its parent must exist).
/// Dies on failure.
void MakeDirectory(const std::string &dirname);

/// Returns the last path component with its final extension removed,
/// e.g. "/data/wav/utt_01.wav" -> "utt_01".
std::string FileStem(const std::string &path);

/// Joins a directory and a file name with a single '/'.
std::string JoinPath(const std::string &dir, const std::string &name);

/// @} end "addtogroup io_group"

}  // end namespace alignkit.

#endif  // ALIGNKIT_UTIL_ALIGNKIT_IO_H_
