/*
 * base/statistics.cc
 * -------------------------------------------------------------------------
 * Definitions for statistics-collection methods.
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

#include "base/statistics.h"

#include <stdio.h>

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "base/paths.h"
#include "base/timer.h"

namespace dxfer {
namespace base {

namespace {
std::mutex s_mutex;
std::unique_ptr<std::ostream> s_stream;
bool s_collected = false;

std::string Format(const char *format, va_list args) {
  va_list measure;

  va_copy(measure, args);
  int len = vsnprintf(nullptr, 0, format, measure);
  va_end(measure);

  if (len <= 0) return "";

  std::vector<char> buf(static_cast<size_t>(len) + 1);
  vsnprintf(&buf[0], buf.size(), format, args);
  return std::string(&buf[0], static_cast<size_t>(len));
}

// s_mutex must be held
void Attach(std::unique_ptr<std::ostream> output) {
  if (s_stream)
    throw std::runtime_error("can't call statistics::init() more than once!");

  s_stream = std::move(output);
  s_collected = false;

  *s_stream << "# " << PACKAGE_NAME << " statistics, started "
            << Timer::GetHttpTime() << "\n";
}
}  // namespace

void Statistics::Init(std::unique_ptr<std::ostream> output) {
  std::lock_guard<std::mutex> lock(s_mutex);
  Attach(std::move(output));
}

void Statistics::Init(const std::string &file) {
  std::unique_ptr<std::ofstream> f(
      new std::ofstream(Paths::Transform(file).c_str(), std::ofstream::trunc));

  if (!f->good())
    throw std::runtime_error("cannot open statistics file [" + file +
                             "] for write");

  std::lock_guard<std::mutex> lock(s_mutex);
  Attach(std::move(f));
}

void Statistics::Collect() {
  std::lock_guard<std::mutex> lock(s_mutex);

  if (!s_stream || s_collected) return;
  s_collected = true;

  *s_stream << "# collected " << Timer::GetHttpTime() << "\n";

  for (auto iter = Writers::begin(); iter != Writers::end(); ++iter)
    iter->second(s_stream.get());
}

void Statistics::Flush() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (s_stream) s_stream->flush();
}

void Statistics::Write(const std::string &section, const std::string &key,
                       const char *format, ...) {
  va_list args;

  va_start(args, format);
  const std::string value = Format(format, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_stream) return;

  *s_stream << section << "." << key << ": " << value << "\n";
}

}  // namespace base
}  // namespace dxfer
