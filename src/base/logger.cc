/*
 * base/logger.cc
 * -------------------------------------------------------------------------
 * Definitions for dxfer::base::Logger static members and Init() method.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "base/logger.h"

#include <time.h>

#include <limits>
#include <mutex>

namespace dxfer {
namespace base {

namespace {
// log all messages unless instructed otherwise
int s_max_level = std::numeric_limits<int>::max();
Logger::Mode s_mode = Logger::Mode::STDERR;

// workers and the coordinator log from many pool threads at once; keep lines
// whole on stderr
std::mutex s_stderr_mutex;

void WriteTimestamp() {
  time_t now = time(nullptr);
  tm local;
  localtime_r(&now, &local);

  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S ", &local);
  fputs(buf, stderr);
}
}  // namespace

void Logger::Init(Mode mode, int max_level) {
  s_max_level = max_level;
  s_mode = mode;
  if (s_mode == Mode::SYSLOG) openlog(PACKAGE_NAME, LOG_PID, LOG_USER);
}

void Logger::Log(int level, const char *message, ...) {
  va_list args;

  if (level <= s_max_level) {
    // can't reuse va_list
    if (s_mode == Mode::SYSLOG) {
      va_start(args, message);
      vsyslog(level, message, args);
      va_end(args);
    } else if (s_mode == Mode::STDERR) {
      std::lock_guard<std::mutex> lock(s_stderr_mutex);
      WriteTimestamp();
      va_start(args, message);
      vfprintf(stderr, message, args);
      va_end(args);
    }
  }
}

}  // namespace base
}  // namespace dxfer
