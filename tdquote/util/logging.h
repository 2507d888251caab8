/*
 *
 * Copyright 2026 tdquote authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef TDQUOTE_UTIL_LOGGING_H_
#define TDQUOTE_UTIL_LOGGING_H_

#include <memory>
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

#define COMPACT_TDQUOTE_LOG_INFO ::tdquote::LogMessage(__FILE__, __LINE__)
#define COMPACT_TDQUOTE_LOG_WARNING \
  ::tdquote::LogMessage(__FILE__, __LINE__, WARNING)
#define COMPACT_TDQUOTE_LOG_ERROR \
  ::tdquote::LogMessage(__FILE__, __LINE__, ERROR)
#define COMPACT_TDQUOTE_LOG_FATAL \
  ::tdquote::LogMessageFatal(__FILE__, __LINE__, FATAL)

// Returns a stream for a log message of the given severity (INFO, WARNING,
// ERROR or FATAL). The message is emitted, with a terminating newline, when
// the statement ends. A FATAL message ends the program.
//
//   LOG(WARNING) << "Read " << num_bytes << " bytes";
#define LOG(severity) COMPACT_TDQUOTE_LOG_##severity.stream()

// LOGs only if |condition| holds.
#define LOG_IF(severity, condition) \
  !(condition) ? (void)0 : ::tdquote::LogMessageVoidify() & LOG(severity)

// An INFO message logged only when |level| is at most the verbosity set by
// InitLogging.
#define VLOG(level) LOG_IF(INFO, (level) <= ::tdquote::get_vlog_level())

enum LogSeverity { INFO, WARNING, ERROR, FATAL };

namespace tdquote {

// Returns null if |v1| == |v2|. Otherwise returns a new "expr (v1 vs. v2)"
// string describing the failure.
template <typename T1, typename T2>
std::string *Check_EQImpl(const T1 &v1, const T2 &v2, const char *exprtext) {
  if (ABSL_PREDICT_TRUE(v1 == v2)) return nullptr;
  std::ostringstream stream;
  stream << exprtext << " (" << v1 << " vs. " << v2 << ")";
  return new std::string(stream.str());
}

// Ends the program with a FATAL message unless |val1| == |val2|. Both values
// must be printable to an ostream.
#define CHECK_EQ(val1, val2)                                                  \
  while (std::unique_ptr<std::string> _result = std::unique_ptr<std::string>( \
             ::tdquote::Check_EQImpl((val1), (val2), #val1 " == " #val2)))    \
  ::tdquote::LogMessageFatal(__FILE__, __LINE__, *_result).stream()

// Gets the verbosity threshold for VLOG.
int get_vlog_level();

// Initializes logging. Should be called in main().
//
// Log lines always go to stderr. If |directory| is neither null nor empty they
// are also appended to a file in it named after the basename of
// |program_name|; the directory is created if missing. VLOG statements with a
// level above |level| are dropped. Returns false if the log file cannot be
// written.
bool InitLogging(const char *directory, const char *program_name, int level);

// A log message created by a log macro. The destructor emits it.
class LogMessage {
 public:
  // Constructs a message with INFO severity.
  LogMessage(const char *file, int line);

  LogMessage(const char *file, int line, LogSeverity severity);

  // Constructs a FATAL message for a failed CHECK_EQ.
  LogMessage(const char *file, int line, const std::string &result);

  ~LogMessage();

  std::ostringstream &stream() { return stream_; }

 protected:
  void SendToLog(const std::string &message_text);

  LogSeverity severity_;
  std::ostringstream stream_;

 private:
  void Init(const char *file, int line, LogSeverity severity);

  LogMessage(const LogMessage &) = delete;
  void operator=(const LogMessage &) = delete;
};

// Turns an ostream expression into void for the ternary in LOG_IF.
class LogMessageVoidify {
 public:
  void operator&(const std::ostream &) {}
};

// A FATAL LogMessage whose destructor does not return.
class LogMessageFatal : public LogMessage {
 public:
  ABSL_ATTRIBUTE_NORETURN ~LogMessageFatal();

  LogMessageFatal(const char *file, int line, LogSeverity severity)
      : LogMessage(file, line, severity) {}

  LogMessageFatal(const char *file, int line, const std::string &result)
      : LogMessage(file, line, result) {}
};

}  // namespace tdquote

#endif  // TDQUOTE_UTIL_LOGGING_H_
