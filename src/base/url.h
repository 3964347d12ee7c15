/*
 * base/url.h
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

#ifndef DXFER_BASE_URL_H
#define DXFER_BASE_URL_H

#include <map>
#include <string>

namespace dxfer {
namespace base {

class Url {
 public:
  using QueryMap = std::map<std::string, std::string>;

  // Leaves '/' alone, so suitable for object paths.
  static std::string Encode(const std::string &url);

  // Encodes everything but unreserved characters.
  static std::string EncodeQueryValue(const std::string &value);

  static std::string Decode(const std::string &url);

  // Splits "scheme://host[:port]/path" into host part and path; the path
  // keeps its leading '/'.
  static void Split(const std::string &url, std::string *host,
                    std::string *path);

  // Parses "a=b&c=d" into decoded key/value pairs.
  static QueryMap ParseQueryString(const std::string &query);
};
}  // namespace base
}  // namespace dxfer

#endif
