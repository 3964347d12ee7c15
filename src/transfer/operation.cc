/*
 * transfer/operation.cc
 * -------------------------------------------------------------------------
 * Transfer operations and the job message that carries them
 * (implementation).
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

#include "transfer/operation.h"

#include <json/json.h>

#include <sstream>
#include <stdexcept>

#include "base/logger.h"

namespace dxfer {
namespace transfer {

namespace {
constexpr char KIND_PUT_RANGE[] = "put_range";
constexpr char KIND_GET_RANGE[] = "get_range";

class IdVisitor : public boost::static_visitor<const std::string &> {
 public:
  const std::string &operator()(const PutRange &op) const { return op.id; }
  const std::string &operator()(const GetRange &op) const { return op.id; }
};

class KindVisitor : public boost::static_visitor<const char *> {
 public:
  const char *operator()(const PutRange &) const { return KIND_PUT_RANGE; }
  const char *operator()(const GetRange &) const { return KIND_GET_RANGE; }
};

class BytesVisitor : public boost::static_visitor<uint64_t> {
 public:
  uint64_t operator()(const PutRange &op) const {
    return op.unit_size_bytes * op.unit_count;
  }
  uint64_t operator()(const GetRange &op) const { return op.total_bytes; }
};

class JsonVisitor : public boost::static_visitor<Json::Value> {
 public:
  Json::Value operator()(const PutRange &op) const {
    Json::Value v = Common(KIND_PUT_RANGE, op.id, op.blob_name,
                           op.container_name);
    v["starting_unit_index"] = Json::UInt(op.starting_unit_index);
    v["unit_size_bytes"] = Json::UInt64(op.unit_size_bytes);
    v["unit_count"] = Json::UInt(op.unit_count);
    return v;
  }

  Json::Value operator()(const GetRange &op) const {
    Json::Value v = Common(KIND_GET_RANGE, op.id, op.blob_name,
                           op.container_name);
    v["start_byte_offset"] = Json::UInt64(op.start_byte_offset);
    v["total_bytes"] = Json::UInt64(op.total_bytes);
    v["chunk_size_bytes"] = Json::UInt64(op.chunk_size_bytes);
    return v;
  }

 private:
  static Json::Value Common(const char *kind, const std::string &id,
                            const std::string &blob,
                            const std::string &container) {
    Json::Value v(Json::objectValue);
    v["kind"] = kind;
    v["id"] = id;
    v["blob_name"] = blob;
    v["container_name"] = container;
    return v;
  }
};

void RequireMembers(const Json::Value &v, const char *const *names) {
  for (; *names; names++)
    if (!v.isMember(*names))
      throw std::runtime_error(std::string("missing member: ") + *names);
}

std::string GetString(const Json::Value &v, const char *name) {
  if (!v[name].isString())
    throw std::runtime_error(std::string("not a string: ") + name);
  return v[name].asString();
}

uint64_t GetUInt64(const Json::Value &v, const char *name) {
  if (!v[name].isUInt64())
    throw std::runtime_error(std::string("not an unsigned integer: ") + name);
  return v[name].asUInt64();
}

uint32_t GetUInt(const Json::Value &v, const char *name) {
  if (!v[name].isUInt())
    throw std::runtime_error(std::string("not a 32-bit unsigned integer: ") +
                             name);
  return v[name].asUInt();
}

Operation ParseOperation(const Json::Value &v) {
  static const char *const COMMON[] = {"kind", "id", "blob_name",
                                       "container_name", nullptr};
  static const char *const PUT[] = {"starting_unit_index", "unit_size_bytes",
                                    "unit_count", nullptr};
  static const char *const GET[] = {"start_byte_offset", "total_bytes",
                                    "chunk_size_bytes", nullptr};

  if (!v.isObject()) throw std::runtime_error("operation is not an object");
  RequireMembers(v, COMMON);

  const std::string kind = GetString(v, "kind");

  if (kind == KIND_PUT_RANGE) {
    PutRange op;

    RequireMembers(v, PUT);
    op.id = GetString(v, "id");
    op.blob_name = GetString(v, "blob_name");
    op.container_name = GetString(v, "container_name");
    op.starting_unit_index = GetUInt(v, "starting_unit_index");
    op.unit_size_bytes = GetUInt64(v, "unit_size_bytes");
    op.unit_count = GetUInt(v, "unit_count");

    return op;
  }

  if (kind == KIND_GET_RANGE) {
    GetRange op;

    RequireMembers(v, GET);
    op.id = GetString(v, "id");
    op.blob_name = GetString(v, "blob_name");
    op.container_name = GetString(v, "container_name");
    op.start_byte_offset = GetUInt64(v, "start_byte_offset");
    op.total_bytes = GetUInt64(v, "total_bytes");
    op.chunk_size_bytes = GetUInt64(v, "chunk_size_bytes");

    return op;
  }

  throw std::runtime_error("unknown operation kind: " + kind);
}
}  // namespace

const std::string &GetOperationId(const Operation &op) {
  return boost::apply_visitor(IdVisitor(), op);
}

const char *GetOperationKind(const Operation &op) {
  return boost::apply_visitor(KindVisitor(), op);
}

uint64_t GetOperationBytes(const Operation &op) {
  return boost::apply_visitor(BytesVisitor(), op);
}

std::unique_ptr<JobMessage> JobMessage::Parse(const std::string &body) {
  std::istringstream ss(body);
  Json::Value tree;

  try {
    ss >> tree;

    if (!tree.isObject() || !tree.isMember("sender_node_name") ||
        !tree.isMember("operation"))
      throw std::runtime_error("not a job message");

    std::unique_ptr<JobMessage> job(new JobMessage());
    job->sender_node_name = GetString(tree, "sender_node_name");
    job->operation = ParseOperation(tree["operation"]);

    if (GetOperationId(job->operation).empty())
      throw std::runtime_error("operation has no id");

    return job;
  } catch (const std::exception &e) {
    DXFER_LOG(LOG_WARNING, "JobMessage::Parse", "cannot decode job: %s\n",
              e.what());
  }

  return {};
}

std::string JobMessage::Serialize() const {
  Json::Value tree(Json::objectValue);
  Json::StreamWriterBuilder builder;

  tree["sender_node_name"] = sender_node_name;
  tree["operation"] = boost::apply_visitor(JsonVisitor(), operation);

  builder["indentation"] = "";
  return Json::writeString(builder, tree);
}

}  // namespace transfer
}  // namespace dxfer
