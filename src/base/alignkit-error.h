// base/alignkit-error.h

// Copyright 2019 LAIX (Yi Sun)
// Copyright 2019 SmartAction LLC (kkm)
// Copyright 2016 Brno University of Technology (author: Karel Vesely)
// Copyright 2009-2011  Microsoft Corporation;  Ondrej Glembek;  Lukas Burget;
//                      Saarland University
// Copyright 2026 Alignkit Authors

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

#ifndef ALIGNKIT_BASE_ALIGNKIT_ERROR_H_
#define ALIGNKIT_BASE_ALIGNKIT_ERROR_H_ 1

#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>

#include "base/alignkit-types.h"
#include "base/alignkit-utils.h"
/* This file must not depend on any other alignkit headers. */

namespace alignkit {

/// \addtogroup error_group
/// @{

/***** PROGRAM NAME AND VERBOSITY LEVEL *****/

/// Called by ParseOptions with argv[0]; any leading directory is removed.
/// The name prefixes every message, since the stages of a corpus run are
/// often piped together with their stderr mixed.  Not thread safe.
void SetProgramName(const char *name);

/// Set by ParseOptions from --verbose.  Use {Get,Set}VerboseLevel().
extern int32 g_alignkit_verbose_level;

inline int32 GetVerboseLevel() { return g_alignkit_verbose_level; }

inline void SetVerboseLevel(int32 i) { g_alignkit_verbose_level = i; }

/// Number of warnings logged so far by this process.  The programs report it
/// in their final summary, because per-utterance warnings scroll past
/// quickly on a large corpus.
int32 NumWarningsLogged();

/***** LOGGING *****/

/// Severity and source location of a message.
struct LogMessageEnvelope {
  /// Positive values are verbose levels; ALIGNKIT_VLOG(n) messages are
  /// produced only if GetVerboseLevel() >= n.
  enum Severity {
    kAssertFailed = -3,  //!< Assertion failure; abort() follows.
    kError = -2,         //!< AlignkitFatalError is thrown after logging.
    kWarning = -1,       //!< Something is wrong but processing goes on.
    kInfo = 0,
  };
  int severity;      //!< A Severity value, or a positive verbose level.
  const char *func;  //!< Function that logged the message.
  const char *file;  //!< Source file, with at most one directory.
  int32 line;
};

/// The one exception type.  ALIGNKIT_ERR throws it after the message has
/// been logged; main() of every program catches it.
class AlignkitFatalError : public std::runtime_error {
 public:
  explicit AlignkitFatalError(const std::string &message)
      : std::runtime_error(message) {}
  explicit AlignkitFatalError(const char *message)
      : std::runtime_error(message) {}

  /// Returns "alignkit::AlignkitFatalError".
  virtual const char *what() const noexcept override {
    return "alignkit::AlignkitFatalError";
  }

  /// Returns the text given to ALIGNKIT_ERR.
  const char *AlignkitMessage() const { return std::runtime_error::what(); }
};

// A MessageLogger is created by each logging macro and collects the text
// streamed into it.  The macro then assigns it to an Emit or EmitFatal
// object, which is what writes the message; the assignment has lower
// precedence than <<, so the whole message is collected first.  Messages
// from different threads never interleave.
class MessageLogger {
 public:
  /// "func" and "file" are not copied and must outlive this object.
  MessageLogger(LogMessageEnvelope::Severity severity, const char *func,
                const char *file, int32 line);

  template <typename T> MessageLogger &operator<<(const T &val) {
    text_ << val;
    return *this;
  }

  const LogMessageEnvelope &Envelope() const { return envelope_; }
  std::string Text() const { return text_.str(); }

  /// Sends the message to the log handler, or to stderr.
  void Send() const;

  struct Emit final {
    void operator=(const MessageLogger &logger) { logger.Send(); }
  };
  struct EmitFatal final {
    [[noreturn]] void operator=(const MessageLogger &logger) {
      logger.Send();
      throw AlignkitFatalError(logger.Text());
    }
  };

 private:
  LogMessageEnvelope envelope_;
  std::ostringstream text_;
};

#define ALIGNKIT_MESSAGE_(severity)                                     \
  ::alignkit::MessageLogger(severity, __func__, __FILE__, __LINE__)

#define ALIGNKIT_ERR                                                    \
  ::alignkit::MessageLogger::EmitFatal() =                              \
      ALIGNKIT_MESSAGE_(::alignkit::LogMessageEnvelope::kError)
#define ALIGNKIT_WARN                                                   \
  ::alignkit::MessageLogger::Emit() =                                   \
      ALIGNKIT_MESSAGE_(::alignkit::LogMessageEnvelope::kWarning)
#define ALIGNKIT_LOG                                                    \
  ::alignkit::MessageLogger::Emit() =                                   \
      ALIGNKIT_MESSAGE_(::alignkit::LogMessageEnvelope::kInfo)
#define ALIGNKIT_VLOG(v)                                                \
  if ((v) <= ::alignkit::GetVerboseLevel())                             \
    ::alignkit::MessageLogger::Emit() = ALIGNKIT_MESSAGE_(              \
        static_cast< ::alignkit::LogMessageEnvelope::Severity>(v))

/***** ASSERTS *****/

[[noreturn]] void AlignkitAssertFailure_(const char *func, const char *file,
                                         int32 line, const char *cond_str);

// ALIGNKIT_ASSERT checks internal invariants only; bad input is reported
// with ALIGNKIT_ERR.  Compiled out with NDEBUG.
#ifdef NDEBUG
#define ALIGNKIT_ASSERT(cond) (void)0
#else
#define ALIGNKIT_ASSERT(cond)                                           \
  ((cond) ? (void)0 :                                                   \
   ::alignkit::AlignkitAssertFailure_(__func__, __FILE__, __LINE__, #cond))
#endif

/***** CUSTOM LOG HANDLER *****/

typedef void (*LogHandler)(const LogMessageEnvelope &envelope,
                           const char *message);

/// Sends all messages to "handler" instead of stderr; NULL restores stderr.
/// Calls to the handler are serialized.  Returns the previous handler.
LogHandler SetLogHandler(LogHandler handler);

/// @} end "addtogroup error_group"

namespace internal {
/// Finds the mangled name in one line of backtrace_symbols() output.
/// Exposed for the tests.
bool LocateSymbolRange(const std::string &frame, size_t *begin,
                       size_t *end);
}  // namespace internal
}  // namespace alignkit

#endif  // ALIGNKIT_BASE_ALIGNKIT_ERROR_H_
