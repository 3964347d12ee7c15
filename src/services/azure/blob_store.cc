/*
 * services/azure/blob_store.cc
 * -------------------------------------------------------------------------
 * Block blob operations against the Blob service (implementation).
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

#include "services/azure/blob_store.h"

#include <errno.h>

#include <boost/lexical_cast.hpp>
#include <list>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/request.h"
#include "base/url.h"
#include "base/xml.h"
#include "services/utils.h"

namespace dxfer {
namespace services {
namespace azure {

namespace {
constexpr char UNCOMMITTED_BLOCK_XPATH[] =
    "/BlockList/UncommittedBlocks/Block/Name";

int LogFailure(base::Request *req, const std::string &what) {
  DXFER_LOG(LOG_WARNING, "BlobStore",
            "%s failed for [%s] with status %i (%s).\n", what.c_str(),
            req->url().c_str(), req->response_code(),
            GetErrorCode(req).c_str());
  return -EIO;
}
}  // namespace

std::string BlobStore::BuildBlockListXml(const std::vector<std::string> &ids) {
  std::string xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";

  // base64 ids need no escaping
  for (const auto &id : ids) xml += "<Latest>" + id + "</Latest>";

  xml += "</BlockList>";
  return xml;
}

BlobStore::BlobStore(const std::string &endpoint) : endpoint_(endpoint) {}

std::string BlobStore::GetContainerUrl(const std::string &container) const {
  return endpoint_ + "/" + base::Url::Encode(container);
}

std::string BlobStore::GetBlobUrl(const std::string &container,
                                  const std::string &blob) const {
  return GetContainerUrl(container) + "/" + base::Url::Encode(blob);
}

int BlobStore::CreateContainerIfMissing(base::Request *req,
                                        const std::string &container) {
  req->Init(base::HttpMethod::PUT);
  req->SetUrl(GetContainerUrl(container), "restype=container");

  req->Run();

  if (req->response_code() == base::HTTP_SC_CREATED) {
    DXFER_LOG(LOG_INFO, "BlobStore::CreateContainerIfMissing",
              "created container [%s].\n", container.c_str());
    return 0;
  }

  if (req->response_code() == base::HTTP_SC_CONFLICT) {
    const std::string code = GetErrorCode(req);

    if (code == "ContainerAlreadyExists") return 0;

    DXFER_LOG(LOG_WARNING, "BlobStore::CreateContainerIfMissing",
              "container [%s] unavailable: %s\n", container.c_str(),
              code.c_str());
    return -EBUSY;
  }

  return LogFailure(req, "create container");
}

int BlobStore::WriteUnit(base::Request *req, const std::string &container,
                         const std::string &blob, const std::string &unit_id,
                         const uint8_t *data, size_t size,
                         int server_timeout_in_s) {
  req->Init(base::HttpMethod::PUT);
  req->SetUrl(GetBlobUrl(container, blob),
              "comp=block&blockid=" + base::Url::EncodeQueryValue(unit_id) +
                  "&timeout=" + std::to_string(server_timeout_in_s));
  req->SetInputBuffer(reinterpret_cast<const char *>(data), size);

  req->Run(base::Config::transfer_timeout_in_s());

  if (req->response_code() != base::HTTP_SC_CREATED)
    return LogFailure(req, "put block " + unit_id);

  return 0;
}

int BlobStore::ReadRange(base::Request *req, const std::string &container,
                         const std::string &blob, uint64_t offset,
                         size_t length, size_t *bytes_read) {
  if (length == 0) {
    *bytes_read = 0;
    return 0;
  }

  req->Init(base::HttpMethod::GET);
  req->SetUrl(GetBlobUrl(container, blob));
  req->SetHeader("x-ms-range", "bytes=" + std::to_string(offset) + "-" +
                                   std::to_string(offset + length - 1));

  req->Run(base::Config::transfer_timeout_in_s());

  if (req->response_code() == base::HTTP_SC_NOT_FOUND) return -ENOENT;

  if (req->response_code() != base::HTTP_SC_PARTIAL_CONTENT &&
      req->response_code() != base::HTTP_SC_OK)
    return LogFailure(req, "ranged get");

  *bytes_read = req->output_buffer().size();

  if (*bytes_read != length) {
    DXFER_LOG(LOG_WARNING, "BlobStore::ReadRange",
              "short read at offset %llu of [%s]: wanted %zu, got %zu.\n",
              static_cast<unsigned long long>(offset), blob.c_str(), length,
              *bytes_read);
    return -EIO;
  }

  return 0;
}

int BlobStore::ListPendingUnits(base::Request *req,
                                const std::string &container,
                                const std::string &blob,
                                std::set<std::string> *units) {
  std::list<std::string> names;

  req->Init(base::HttpMethod::GET);
  req->SetUrl(GetBlobUrl(container, blob),
              "comp=blocklist&blocklisttype=uncommitted");

  req->Run();

  units->clear();

  // no blocks staged yet
  if (req->response_code() == base::HTTP_SC_NOT_FOUND) return 0;

  if (req->response_code() != base::HTTP_SC_OK)
    return LogFailure(req, "get block list");

  auto doc = base::XmlDocument::Parse(req->GetOutputAsString());
  if (!doc) {
    DXFER_LOG(LOG_WARNING, "BlobStore::ListPendingUnits",
              "failed to parse response.\n");
    return -EIO;
  }

  int r = doc->Find(UNCOMMITTED_BLOCK_XPATH, &names);
  if (r) return r;

  units->insert(names.begin(), names.end());
  return 0;
}

int BlobStore::Commit(base::Request *req, const std::string &container,
                      const std::string &blob,
                      const std::vector<std::string> &ordered_unit_ids) {
  req->Init(base::HttpMethod::PUT);
  req->SetUrl(GetBlobUrl(container, blob), "comp=blocklist");
  req->SetHeader("content-type", "application/xml");
  req->SetInputBuffer(BuildBlockListXml(ordered_unit_ids));

  // committing a large block list can take a while
  req->Run(base::Config::transfer_timeout_in_s());

  if (req->response_code() != base::HTTP_SC_CREATED)
    return LogFailure(req, "put block list");

  return 0;
}

int BlobStore::Stat(base::Request *req, const std::string &container,
                    const std::string &blob, uint64_t *size) {
  req->Init(base::HttpMethod::HEAD);
  req->SetUrl(GetBlobUrl(container, blob));

  req->Run();

  if (req->response_code() == base::HTTP_SC_NOT_FOUND) return -ENOENT;

  if (req->response_code() != base::HTTP_SC_OK)
    return LogFailure(req, "get blob properties");

  try {
    *size = boost::lexical_cast<uint64_t>(req->response_header("content-length"));
  } catch (const boost::bad_lexical_cast &) {
    DXFER_LOG(LOG_WARNING, "BlobStore::Stat",
              "invalid content-length [%s] for [%s].\n",
              req->response_header("content-length").c_str(), blob.c_str());
    return -EIO;
  }

  return 0;
}

int BlobStore::Delete(base::Request *req, const std::string &container,
                      const std::string &blob) {
  req->Init(base::HttpMethod::DELETE);
  req->SetUrl(GetBlobUrl(container, blob));

  req->Run();

  if (req->response_code() == base::HTTP_SC_NOT_FOUND) return -ENOENT;

  if (req->response_code() != base::HTTP_SC_ACCEPTED)
    return LogFailure(req, "delete blob");

  return 0;
}

int BlobStore::DeleteContainer(base::Request *req,
                               const std::string &container) {
  req->Init(base::HttpMethod::DELETE);
  req->SetUrl(GetContainerUrl(container), "restype=container");

  req->Run();

  if (req->response_code() == base::HTTP_SC_NOT_FOUND) return -ENOENT;

  if (req->response_code() != base::HTTP_SC_ACCEPTED)
    return LogFailure(req, "delete container");

  return 0;
}

}  // namespace azure
}  // namespace services
}  // namespace dxfer
