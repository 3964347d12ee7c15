/*
 * services/utils.cc
 * -------------------------------------------------------------------------
 * Helpers shared by service implementations (implementation).
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

#include "services/utils.h"

#include <atomic>
#include <stdexcept>

#include "base/logger.h"
#include "base/request.h"
#include "base/statistics.h"
#include "base/xml.h"

namespace dxfer {
namespace services {

namespace {
constexpr char ERROR_CODE_XPATH[] = "/Error/Code";

std::atomic_int s_internal_server_error(0), s_service_unavailable(0);
std::atomic_int s_op_timeout(0), s_server_busy(0);

void StatsWriter(std::ostream *o) {
  *o << "common service base:\n"
        "  \"internal server error\": "
     << s_internal_server_error
     << "\n"
        "  \"service unavailable\": "
     << s_service_unavailable
     << "\n"
        "  \"OperationTimedOut\": "
     << s_op_timeout
     << "\n"
        "  \"ServerBusy\": "
     << s_server_busy << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

std::string GetErrorCode(base::Request *r) {
  std::string code;

  if (r->output_buffer().empty()) return code;

  try {
    auto xml = base::XmlDocument::Parse(r->GetOutputAsString());
    if (xml && xml->Find(ERROR_CODE_XPATH, &code)) code.clear();
  } catch (const std::exception &e) {
    DXFER_LOG(LOG_DEBUG, "GetErrorCode", "unparseable error body: %s\n",
              e.what());
    code.clear();
  }

  return code;
}

bool GenericShouldRetry(base::Request *r, int iter) {
  int rc = r->response_code();

  if (rc == base::HTTP_SC_INTERNAL_SERVER_ERROR ||
      rc == base::HTTP_SC_SERVICE_UNAVAILABLE) {
    const std::string code = GetErrorCode(r);

    if (code == "OperationTimedOut")
      ++s_op_timeout;
    else if (code == "ServerBusy")
      ++s_server_busy;
    else if (rc == base::HTTP_SC_INTERNAL_SERVER_ERROR)
      ++s_internal_server_error;
    else
      ++s_service_unavailable;

    DXFER_LOG(LOG_DEBUG, "GenericShouldRetry",
              "retrying [%s] after %i (%s), attempt %i.\n", r->url().c_str(),
              rc, code.c_str(), iter + 1);
    return true;
  }

  return false;
}

}  // namespace services
}  // namespace dxfer
