/*
 * base/url.cc
 * -------------------------------------------------------------------------
 * URL-related functions.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2019, Tarick Bedeir.
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

#include "base/url.h"

#include <ctype.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dxfer {
namespace base {

namespace {
constexpr char HEX[] = "0123456789ABCDEF";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  throw std::runtime_error("invalid hex digit in url.");
}

void AppendEscaped(char c, std::string *out) {
  *out += '%';
  *out += HEX[static_cast<uint8_t>(c) / 16];
  *out += HEX[static_cast<uint8_t>(c) % 16];
}
}  // namespace

std::string Url::Encode(const std::string &url) {
  std::string ret;
  ret.reserve(url.length());

  for (size_t i = 0; i < url.length(); i++) {
    if (url[i] == '/' || url[i] == '.' || url[i] == '-' || url[i] == '*' ||
        url[i] == '_' || isalnum(static_cast<unsigned char>(url[i])))
      ret += url[i];
    else
      AppendEscaped(url[i], &ret);
  }

  return ret;
}

std::string Url::EncodeQueryValue(const std::string &value) {
  std::string ret;
  ret.reserve(value.length());

  for (char c : value) {
    if (c == '.' || c == '-' || c == '_' || c == '~' ||
        isalnum(static_cast<unsigned char>(c)))
      ret += c;
    else
      AppendEscaped(c, &ret);
  }

  return ret;
}

std::string Url::Decode(const std::string &url) {
  std::string ret;
  ret.reserve(url.length());

  for (size_t i = 0; i < url.length(); i++) {
    if (url[i] == '%') {
      if (i + 2 >= url.length())
        throw std::runtime_error("truncated escape sequence in url.");
      ret += static_cast<char>(HexValue(url[i + 1]) * 16 + HexValue(url[i + 2]));
      i += 2;
    } else if (url[i] == '+') {
      ret += ' ';
    } else {
      ret += url[i];
    }
  }

  return ret;
}

void Url::Split(const std::string &url, std::string *host,
                std::string *path) {
  size_t start = url.find("://");
  start = (start == std::string::npos) ? 0 : start + 3;

  size_t slash = url.find('/', start);
  if (slash == std::string::npos) {
    *host = url;
    *path = "/";
  } else {
    *host = url.substr(0, slash);
    *path = url.substr(slash);
  }
}

Url::QueryMap Url::ParseQueryString(const std::string &query) {
  QueryMap params;
  size_t pos = 0;

  while (pos < query.size()) {
    size_t end = query.find('&', pos);
    if (end == std::string::npos) end = query.size();

    const std::string pair = query.substr(pos, end - pos);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      if (eq == std::string::npos)
        params[Decode(pair)] = "";
      else
        params[Decode(pair.substr(0, eq))] = Decode(pair.substr(eq + 1));
    }

    pos = end + 1;
  }

  return params;
}

}  // namespace base
}  // namespace dxfer
