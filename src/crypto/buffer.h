/*
 * crypto/buffer.h
 * -------------------------------------------------------------------------
 * Randomly generated byte buffer.
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

#ifndef DXFER_CRYPTO_BUFFER_H
#define DXFER_CRYPTO_BUFFER_H

#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dxfer {
namespace crypto {
class Buffer {
 public:
  inline static Buffer Empty() { return Buffer(std::vector<uint8_t>()); }

  inline static Buffer Generate(size_t len) {
    if (!len) throw std::runtime_error("cannot generate empty buffer");
    std::vector<uint8_t> random(len);
    FillRandom(&random[0], len);
    return Buffer(std::move(random));
  }

  // RAND_bytes() takes an int length, so larger buffers are filled in slices.
  inline static void FillRandom(uint8_t *data, size_t len,
                                size_t slice = INT_MAX) {
    while (len) {
      const size_t n = std::min(len, slice);
      if (RAND_bytes(data, static_cast<int>(n)) != 1)
        throw std::runtime_error("failed to generate random bytes");
      data += n;
      len -= n;
    }
  }

  inline const uint8_t *get() const { return buf_.empty() ? nullptr : &buf_[0]; }
  inline size_t size() const { return buf_.size(); }

  inline operator bool() const { return !buf_.empty(); }

 private:
  inline explicit Buffer(std::vector<uint8_t> buf) : buf_(std::move(buf)) {}

  std::vector<uint8_t> buf_;
};
}  // namespace crypto
}  // namespace dxfer

#endif
