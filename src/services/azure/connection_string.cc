/*
 * services/azure/connection_string.cc
 * -------------------------------------------------------------------------
 * Storage account connection string (implementation).
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

#include "services/azure/connection_string.h"

#include <stdlib.h>

#include <boost/algorithm/string.hpp>
#include <map>
#include <stdexcept>
#include <vector>

#include "base/config.h"
#include "base/logger.h"
#include "base/paths.h"
#include "crypto/private_file.h"

namespace dxfer {
namespace services {
namespace azure {

namespace {
constexpr char ENV_VAR[] = "storageconnectionstring";

constexpr char DEFAULT_PROTOCOL[] = "https";
constexpr char DEFAULT_ENDPOINT_SUFFIX[] = "core.windows.net";

// well-known credentials of the local storage emulator
constexpr char DEV_ACCOUNT_NAME[] = "devstoreaccount1";
constexpr char DEV_ACCOUNT_KEY[] =
    "Eby8vdM02xNOcqFlqUwJPLlmEtlCDXJ1OUzFT50uSRZ6IFsuFq2UVErCz4I6tq/"
    "K1SZFPTOtr/KBHBeksoGMGw==";
constexpr char DEV_BLOB_ENDPOINT[] = "http://127.0.0.1:10000/devstoreaccount1";
constexpr char DEV_QUEUE_ENDPOINT[] = "http://127.0.0.1:10001/devstoreaccount1";

std::string StripTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}
}  // namespace

ConnectionString ConnectionString::Parse(const std::string &str) {
  std::vector<std::string> fields;
  std::map<std::string, std::string> values;
  ConnectionString cs;

  boost::algorithm::split(fields, str, boost::algorithm::is_any_of(";"));

  for (auto &field : fields) {
    boost::algorithm::trim(field);
    if (field.empty()) continue;

    // account keys end in '=' padding, so split on the first one only
    size_t eq = field.find('=');
    if (eq == std::string::npos || eq == 0)
      throw std::runtime_error("malformed connection string field.");

    std::string key = field.substr(0, eq);
    boost::algorithm::trim(key);
    values[key] = boost::algorithm::trim_copy(field.substr(eq + 1));
  }

  if (boost::algorithm::iequals(values["UseDevelopmentStorage"], "true")) {
    cs.account_name = DEV_ACCOUNT_NAME;
    cs.account_key = DEV_ACCOUNT_KEY;
    cs.blob_endpoint = DEV_BLOB_ENDPOINT;
    cs.queue_endpoint = DEV_QUEUE_ENDPOINT;
    return cs;
  }

  cs.account_name = values["AccountName"];
  cs.account_key = values["AccountKey"];

  if (cs.account_name.empty())
    throw std::runtime_error("connection string has no AccountName.");
  if (cs.account_key.empty())
    throw std::runtime_error("connection string has no AccountKey.");

  std::string protocol = values["DefaultEndpointsProtocol"];
  std::string suffix = values["EndpointSuffix"];

  if (protocol.empty()) protocol = DEFAULT_PROTOCOL;
  if (suffix.empty()) suffix = DEFAULT_ENDPOINT_SUFFIX;

  cs.blob_endpoint = values["BlobEndpoint"].empty()
                         ? protocol + "://" + cs.account_name + ".blob." + suffix
                         : StripTrailingSlash(values["BlobEndpoint"]);
  cs.queue_endpoint =
      values["QueueEndpoint"].empty()
          ? protocol + "://" + cs.account_name + ".queue." + suffix
          : StripTrailingSlash(values["QueueEndpoint"]);

  return cs;
}

ConnectionString ConnectionString::Load() {
  const std::string &file = base::Config::azure_connection_string_file();
  std::string line;

  if (!file.empty()) {
    line = crypto::PrivateFile::ReadLine(base::Paths::Transform(file));
  } else {
    const char *env = getenv(ENV_VAR);

    if (!env) {
      DXFER_LOG(LOG_ERR, "ConnectionString::Load",
                "set azure_connection_string_file or the %s environment "
                "variable.\n",
                ENV_VAR);
      throw std::runtime_error("no storage connection string available.");
    }

    line = env;
  }

  return Parse(line);
}

}  // namespace azure
}  // namespace services
}  // namespace dxfer
