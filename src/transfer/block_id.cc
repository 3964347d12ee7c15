/*
 * transfer/block_id.cc
 * -------------------------------------------------------------------------
 * Remote identifiers of upload units (implementation).
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

#include "transfer/block_id.h"

#include "crypto/base64.h"
#include "crypto/encoder.h"

namespace dxfer {
namespace transfer {

std::string BlockId::FromIndex(uint32_t index) {
  const uint8_t bytes[] = {
      static_cast<uint8_t>(index & 0xff),
      static_cast<uint8_t>((index >> 8) & 0xff),
      static_cast<uint8_t>((index >> 16) & 0xff),
      static_cast<uint8_t>((index >> 24) & 0xff)};

  return crypto::Encoder::Encode<crypto::Base64>(bytes, sizeof(bytes));
}

std::vector<std::string> BlockId::Sequence(uint32_t count) {
  std::vector<std::string> ids;

  ids.reserve(count);
  for (uint32_t i = 0; i < count; i++) ids.push_back(FromIndex(i));

  return ids;
}

}  // namespace transfer
}  // namespace dxfer
