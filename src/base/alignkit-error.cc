// base/alignkit-error.cc

// Copyright 2019 LAIX (Yi Sun)
// Copyright 2019 SmartAction LLC (kkm)
// Copyright 2016 Brno University of Technology (author: Karel Vesely)
// Copyright 2009-2011  Microsoft Corporation;  Lukas Burget;  Ondrej Glembek
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

#ifdef HAVE_EXECINFO_H
#include <execinfo.h>  // backtrace().
#ifdef HAVE_CXXABI_H
#include <cxxabi.h>  // __cxa_demangle().
#endif
#endif

#include <cstdlib>
#include <mutex>

#include "base/alignkit-common.h"
#include "base/alignkit-error.h"

// Set by the build system.
#if !defined(ALIGNKIT_VERSION)
#define ALIGNKIT_VERSION "unknown"
#endif

namespace alignkit {

int32 g_alignkit_verbose_level = 0;
static std::string program_name;
static LogHandler log_handler = NULL;
static int32 num_warnings = 0;
// Guards log_handler, num_warnings and the write to stderr.
static std::mutex log_mutex;

void SetProgramName(const char *name) {
  const char *slash = std::strrchr(name, '/');
  program_name = (slash == NULL ? name : slash + 1);
}

int32 NumWarningsLogged() {
  std::lock_guard<std::mutex> lock(log_mutex);
  return num_warnings;
}

// "/a/b/c/align/alignment-store.cc" -> "align/alignment-store.cc".
static const char *GetShortFileName(const char *path) {
  if (path == NULL)
    return "";
  const char *prev = path, *last = path;
  while ((path = std::strchr(path, '/')) != NULL) {
    ++path;
    prev = last;
    last = path;
  }
  return prev;
}

namespace internal {
// Finds the mangled symbol in one line of backtrace_symbols() output: it
// starts at the first '_' preceded by ' ' or '(', and ends before the next
// ' ' or '+'.
bool LocateSymbolRange(const std::string &frame, size_t *begin,
                       size_t *end) {
  size_t pos = 0;
  while ((pos = frame.find('_', pos + 1)) != std::string::npos) {
    if (frame[pos - 1] == ' ' || frame[pos - 1] == '(')
      break;
  }
  if (pos == std::string::npos)
    return false;
  *begin = pos;
  *end = frame.find_first_of(" +", pos);
  return *end != std::string::npos;
}
}  // namespace internal

#ifdef HAVE_EXECINFO_H
static std::string Demangle(const std::string &trace_name) {
#ifdef HAVE_CXXABI_H
  size_t begin, end;
  if (!internal::LocateSymbolRange(trace_name, &begin, &end))
    return trace_name;
  std::string symbol = trace_name.substr(begin, end - begin);
  int status;
  char *demangled = abi::__cxa_demangle(symbol.c_str(), NULL, NULL, &status);
  if (status == 0 && demangled != NULL) {
    symbol = demangled;
    free(demangled);
  }
  return trace_name.substr(0, begin) + symbol + trace_name.substr(end);
#else
  return trace_name;
#endif
}
#endif

static std::string GetStackTrace() {
  std::string ans;
#ifdef HAVE_EXECINFO_H
  const int max_frames = 32;
  void *frames[max_frames];
  int size = backtrace(frames, max_frames);
  char **symbols = backtrace_symbols(frames, size);
  if (symbols == NULL)
    return ans;
  ans = "[ Stack-Trace: ]\n";
  for (int i = 0; i < size; i++)
    ans += Demangle(symbols[i]) + "\n";
  if (size == max_frames)
    ans += "...\n";
  free(symbols);  // the strings are in the same allocation.
#endif
  return ans;
}

MessageLogger::MessageLogger(LogMessageEnvelope::Severity severity,
                             const char *func, const char *file, int32 line) {
  envelope_.severity = severity;
  envelope_.func = func;
  envelope_.file = GetShortFileName(file);
  envelope_.line = line;
}

void MessageLogger::Send() const {
  std::string message = Text();
  // Stack trace always for assertion failures, for errors only with
  // --verbose.
  bool want_trace =
      envelope_.severity == LogMessageEnvelope::kAssertFailed ||
      (envelope_.severity == LogMessageEnvelope::kError &&
       GetVerboseLevel() > 0);

  std::lock_guard<std::mutex> lock(log_mutex);
  if (envelope_.severity == LogMessageEnvelope::kWarning)
    num_warnings++;
  if (log_handler != NULL) {
    log_handler(envelope_, message.c_str());
    return;
  }

  std::ostringstream full_message;
  switch (envelope_.severity) {
    case LogMessageEnvelope::kInfo:
      full_message << "LOG (";
      break;
    case LogMessageEnvelope::kWarning:
      full_message << "WARNING (";
      break;
    case LogMessageEnvelope::kError:
      full_message << "ERROR (";
      break;
    case LogMessageEnvelope::kAssertFailed:
      full_message << "ASSERTION_FAILED (";
      break;
    default:
      full_message << "VLOG[" << envelope_.severity << "] (";
  }
  full_message << program_name << "[" ALIGNKIT_VERSION "]:" << envelope_.func
               << "():" << envelope_.file << ':' << envelope_.line << ") "
               << message << '\n';
  if (want_trace) {
    std::string trace = GetStackTrace();
    if (!trace.empty())
      full_message << '\n' << trace;
  }
  std::cerr << full_message.str();
}

void AlignkitAssertFailure_(const char *func, const char *file, int32 line,
                            const char *cond_str) {
  MessageLogger::Emit() =
      MessageLogger(LogMessageEnvelope::kAssertFailed, func, file, line)
      << "Assertion failed: (" << cond_str << ")";
  fflush(NULL);  // abort() does not flush.
  std::abort();
}

LogHandler SetLogHandler(LogHandler handler) {
  std::lock_guard<std::mutex> lock(log_mutex);
  LogHandler old_handler = log_handler;
  log_handler = handler;
  return old_handler;
}

}  // namespace alignkit
