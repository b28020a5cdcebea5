// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// cinit raw logging. Forked from Abseil's version.
//
// The init process and the runner's post-fork child cannot rely on a logging
// library that allocates or takes locks, so every log line in this project
// goes through these macros.

#ifndef CINIT_UTIL_RAW_LOGGING_H_
#define CINIT_UTIL_RAW_LOGGING_H_

#include <cerrno>
#include <cstddef>

#include "absl/base/attributes.h"
#include "absl/base/config.h"
#include "absl/base/log_severity.h"
#include "absl/base/optimization.h"
#include "absl/strings/str_format.h"
#include "cinit/util/strerror.h"

// This is similar to LOG(severity) << format..., but
// * it logs straight and ONLY to STDERR w/o buffering
// * it uses an explicit printf-format and arguments list
// * it will silently chop off really long message strings
// Usage example:
//   CINIT_RAW_LOG(ERROR, "Failed foo with %i: %s", status, error);
// This will print a log line like this to stderr only:
//   [file.cc : 123] RAW: Failed foo with 22: bad_file
#define CINIT_RAW_LOG(severity, ...)                                    \
  do {                                                                  \
    constexpr const char* cinit_raw_logging_internal_basename =         \
        ::cinit::raw_logging_internal::Basename(__FILE__,               \
                                                sizeof(__FILE__) - 1);  \
    ::cinit::raw_logging_internal::RawLog(                              \
        CINIT_RAW_LOGGING_INTERNAL_##severity,                          \
        cinit_raw_logging_internal_basename, __LINE__, __VA_ARGS__);    \
  } while (0)

// Similar to CHECK(condition) << message, but for low-level modules:
// we use only CINIT_RAW_LOG that does not allocate memory.
#define CINIT_RAW_CHECK(condition, message)                             \
  do {                                                                  \
    if (ABSL_PREDICT_FALSE(!(condition))) {                             \
      CINIT_RAW_LOG(FATAL, "Check %s failed: %s", #condition, message); \
    }                                                                   \
  } while (0)

#define CINIT_RAW_LOGGING_INTERNAL_INFO ::absl::LogSeverity::kInfo
#define CINIT_RAW_LOGGING_INTERNAL_WARNING ::absl::LogSeverity::kWarning
#define CINIT_RAW_LOGGING_INTERNAL_ERROR ::absl::LogSeverity::kError
#define CINIT_RAW_LOGGING_INTERNAL_FATAL ::absl::LogSeverity::kFatal

// Returns whether verbose logging is enabled, as determined by the
// CINIT_VLOG_LEVEL environment variable.
#define CINIT_VLOG_IS_ON(verbose_level) \
  ::cinit::raw_logging_internal::VLogIsOn(verbose_level)

// Like CINIT_RAW_LOG(), but also logs the current value of errno and its
// corresponding error message.
#define CINIT_RAW_PLOG(severity, format, ...)                              \
  do {                                                                     \
    char cinit_raw_plog_errno_buffer[100];                                 \
    const char* cinit_raw_plog_errno_str =                                 \
        ::cinit::RawStrError(errno, cinit_raw_plog_errno_buffer,           \
                             sizeof(cinit_raw_plog_errno_buffer));         \
    char cinit_raw_plog_buffer[::cinit::raw_logging_internal::kLogBufSize]; \
    absl::SNPrintF(cinit_raw_plog_buffer, sizeof(cinit_raw_plog_buffer),   \
                   (format), ##__VA_ARGS__);                               \
    CINIT_RAW_LOG(severity, "%s: %s [%d]", cinit_raw_plog_buffer,          \
                  cinit_raw_plog_errno_str, errno);                        \
  } while (0)

// If verbose logging is enabled, uses CINIT_RAW_LOG() to log.
#define CINIT_RAW_VLOG(verbose_level, format, ...)            \
  if (::cinit::raw_logging_internal::VLogIsOn(verbose_level)) { \
    CINIT_RAW_LOG(INFO, (format), ##__VA_ARGS__);             \
  }

// Like CINIT_RAW_CHECK(), but also logs errno and a message (similar to
// CINIT_RAW_PLOG()).
#define CINIT_RAW_PCHECK(condition, format, ...)                             \
  do {                                                                       \
    if (ABSL_PREDICT_FALSE(!(condition))) {                                  \
      char cinit_raw_plog_errno_buffer[100];                                 \
      const char* cinit_raw_plog_errno_str =                                 \
          ::cinit::RawStrError(errno, cinit_raw_plog_errno_buffer,           \
                               sizeof(cinit_raw_plog_errno_buffer));         \
      char                                                                   \
          cinit_raw_plog_buffer[::cinit::raw_logging_internal::kLogBufSize]; \
      absl::SNPrintF(cinit_raw_plog_buffer, sizeof(cinit_raw_plog_buffer),   \
                     (format), ##__VA_ARGS__);                               \
      CINIT_RAW_LOG(FATAL, "Check %s failed: %s: %s [%d]", #condition,       \
                    cinit_raw_plog_buffer, cinit_raw_plog_errno_str, errno); \
    }                                                                        \
  } while (0)

namespace cinit::raw_logging_internal {

constexpr int kLogBufSize = 3000;

// Helper function to implement CINIT_RAW_LOG.
// Logs format... at "severity" level, reporting it as called from file:line.
// This does not allocate memory or acquire locks.
void RawLog(absl::LogSeverity severity, const char* file, int line,
            const char* format, ...) ABSL_PRINTF_ATTRIBUTE(4, 5);

// Writes the provided buffer directly to stderr, in a safe, low-level manner.
void SafeWriteToStderr(const char* s, size_t len);

// compile-time function to get the "base" filename, that is, the part of
// a filename after the last "/" path separator.  The search starts at
// the end of the string; the second parameter is the length of the string.
constexpr const char* Basename(const char* fname, int offset) {
  return offset == 0 || fname[offset - 1] == '/' || fname[offset - 1] == '\\'
             ? fname + offset
             : Basename(fname, offset - 1);
}

bool VLogIsOn(int verbose_level);

}  // namespace cinit::raw_logging_internal

#endif  // CINIT_UTIL_RAW_LOGGING_H_
