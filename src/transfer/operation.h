/*
 * transfer/operation.h
 * -------------------------------------------------------------------------
 * Transfer operations and the job message that carries them.
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

#ifndef DXFER_TRANSFER_OPERATION_H
#define DXFER_TRANSFER_OPERATION_H

#include <boost/variant.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace dxfer {
namespace transfer {
// Uploads units [starting_unit_index, starting_unit_index + unit_count), each
// unit_size_bytes long.
struct PutRange {
  std::string id;
  std::string blob_name;
  std::string container_name;
  uint32_t starting_unit_index = 0;
  uint64_t unit_size_bytes = 0;
  uint32_t unit_count = 0;
};

// Reads [start_byte_offset, start_byte_offset + total_bytes) in chunks of
// chunk_size_bytes; the last chunk may be shorter.
struct GetRange {
  std::string id;
  std::string blob_name;
  std::string container_name;
  uint64_t start_byte_offset = 0;
  uint64_t total_bytes = 0;
  uint64_t chunk_size_bytes = 0;
};

using Operation = boost::variant<PutRange, GetRange>;

const std::string &GetOperationId(const Operation &op);
const char *GetOperationKind(const Operation &op);

// Bytes moved by the operation.
uint64_t GetOperationBytes(const Operation &op);

struct JobMessage {
  std::string sender_node_name;
  Operation operation;

  // Returns nullptr if |body| isn't a well-formed job message.
  static std::unique_ptr<JobMessage> Parse(const std::string &body);

  std::string Serialize() const;
};
}  // namespace transfer
}  // namespace dxfer

#endif
