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

#include "tdquote/util/logging.h"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <utility>

namespace tdquote {
namespace {

constexpr const char *kLogSeverityNames[] = {"INFO", "WARNING", "ERROR",
                                             "FATAL"};

// Path of the log file. Null when only stderr is used.
std::string *log_file_path = nullptr;

// Only VLOG with level equal to or below this level is logged.
int vlog_level = 0;

// Set by the first FATAL message so a failure while logging it cannot recurse.
thread_local bool log_panic = false;

const char *GetBasename(const char *file_path) {
  const char *slash = strrchr(file_path, '/');
  return slash ? slash + 1 : file_path;
}

// Creates |path| if it does not exist. Returns false if it cannot be created
// or is not a directory.
bool EnsureDirectory(const std::string &path) {
  struct stat dir_stat;
  if (stat(path.c_str(), &dir_stat) != 0) {
    return errno == ENOENT && mkdir(path.c_str(), 0766) == 0;
  }
  return S_ISDIR(dir_stat.st_mode);
}

}  // namespace

int get_vlog_level() { return vlog_level; }

bool InitLogging(const char *directory, const char *program_name, int level) {
  vlog_level = level;
  if (!directory || directory[0] == '\0') {
    return true;
  }
  if (log_file_path) {
    return false;
  }

  std::string log_directory(directory);
  if (!EnsureDirectory(log_directory)) {
    return false;
  }
  if (log_directory.back() != '/') {
    log_directory.push_back('/');
  }
  std::string basename = program_name ? GetBasename(program_name) : "";
  if (basename.empty()) {
    basename = "tdquote_log";
  }

  std::string path = log_directory + basename;
  if (access(path.c_str(), F_OK) == 0 && access(path.c_str(), W_OK) != 0) {
    return false;
  }
  log_file_path = new std::string(std::move(path));
  return true;
}

LogMessage::LogMessage(const char *file, int line) { Init(file, line, INFO); }

LogMessage::LogMessage(const char *file, int line, LogSeverity severity) {
  Init(file, line, severity);
}

LogMessage::LogMessage(const char *file, int line, const std::string &result) {
  Init(file, line, FATAL);
  stream() << "Check failed: " << result << " ";
}

void LogMessage::Init(const char *file, int line, LogSeverity severity) {
  if (log_panic) {
    abort();
  }
  severity_ = severity;
  if (severity_ == FATAL) {
    log_panic = true;
  }

  // Prefix: local date/time, severity level, filename and line number.
  struct timespec time_stamp;
  clock_gettime(CLOCK_REALTIME, &time_stamp);

  constexpr int kTimeMessageSize = 22;
  struct tm datetime;
  memset(&datetime, 0, sizeof(datetime));
  if (localtime_r(&time_stamp.tv_sec, &datetime)) {
    char buffer[kTimeMessageSize];
    strftime(buffer, kTimeMessageSize, "%Y-%m-%d %H:%M:%S  ", &datetime);
    stream() << buffer;
  } else {
    stream() << "Failed to get time:" << strerror(errno) << "  ";
  }
  stream() << kLogSeverityNames[severity_] << "  " << GetBasename(file)
           << " : " << line << " : ";
}

LogMessage::~LogMessage() { SendToLog(stream_.str()); }

LogMessageFatal::~LogMessageFatal() {
  SendToLog(stream_.str());
  abort();
}

void LogMessage::SendToLog(const std::string &message_text) {
  if (log_file_path) {
    FILE *file = fopen(log_file_path->c_str(), "ab");
    if (file) {
      if (fprintf(file, "%s\n", message_text.c_str()) < 0) {
        fprintf(stderr, "Failed to write to log file : %s!\n",
                log_file_path->c_str());
      }
      fclose(file);
    } else {
      fprintf(stderr, "Failed to open log file : %s!\n",
              log_file_path->c_str());
    }
  }

  // Quote renderings own stdout, so every log line goes to stderr.
  fprintf(stderr, "%s\n", message_text.c_str());
  fflush(stderr);
}

}  // namespace tdquote
