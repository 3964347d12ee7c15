/*
 * services/azure/connection_string.h
 * -------------------------------------------------------------------------
 * Storage account connection string.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2014, Tarick Bedeir.
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

#ifndef DXFER_SERVICES_AZURE_CONNECTION_STRING_H
#define DXFER_SERVICES_AZURE_CONNECTION_STRING_H

#include <string>

namespace dxfer {
namespace services {
namespace azure {
struct ConnectionString {
  // Parses "Key=Value;Key=Value" as issued by the storage portal. Throws
  // std::runtime_error if AccountName or AccountKey is missing and no explicit
  // development-storage setting is present.
  static ConnectionString Parse(const std::string &str);

  // Reads the connection string from |azure_connection_string_file|, or from
  // the storageconnectionstring environment variable if that key is empty.
  static ConnectionString Load();

  std::string account_name;
  std::string account_key;  // base64, as given
  std::string blob_endpoint;
  std::string queue_endpoint;
};
}  // namespace azure
}  // namespace services
}  // namespace dxfer

#endif
