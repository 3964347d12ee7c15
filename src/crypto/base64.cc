/*
 * crypto/base64.cc
 * -------------------------------------------------------------------------
 * Base64 encoding/decoding (implementation).
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

#include "crypto/base64.h"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <string.h>

#include <memory>
#include <stdexcept>

namespace dxfer {
namespace crypto {

namespace {
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;
}  // namespace

std::string Base64::Encode(const uint8_t *input, size_t size) {
  BIO *bio_b64 = BIO_new(BIO_f_base64());
  BIO *bio_mem = BIO_new(BIO_s_mem());
  if (!bio_b64 || !bio_mem) {
    if (bio_b64) BIO_free(bio_b64);
    if (bio_mem) BIO_free(bio_mem);
    throw std::runtime_error("failed to allocate base64 BIO.");
  }

  BIO_set_flags(bio_b64, BIO_FLAGS_BASE64_NO_NL);
  BioPtr chain(BIO_push(bio_b64, bio_mem), &BIO_free_all);

  if (size > 0 && BIO_write(chain.get(), input, static_cast<int>(size)) !=
                      static_cast<int>(size))
    throw std::runtime_error("failed while encoding base64.");
  if (BIO_flush(chain.get()) != 1)
    throw std::runtime_error("failed to flush base64 BIO.");

  BUF_MEM *mem = nullptr;
  BIO_get_mem_ptr(chain.get(), &mem);

  std::string ret;
  ret.resize(mem->length);
  if (mem->length) memcpy(&ret[0], mem->data, mem->length);

  return ret;
}

std::vector<uint8_t> Base64::Decode(const std::string &input) {
  constexpr size_t READ_CHUNK = 1024;

  BIO *bio_b64 = BIO_new(BIO_f_base64());
  BIO *bio_input = BIO_new_mem_buf(input.c_str(), static_cast<int>(input.size()));
  if (!bio_b64 || !bio_input) {
    if (bio_b64) BIO_free(bio_b64);
    if (bio_input) BIO_free(bio_input);
    throw std::runtime_error("failed to allocate base64 BIO.");
  }

  BIO_set_flags(bio_b64, BIO_FLAGS_BASE64_NO_NL);
  BioPtr chain(BIO_push(bio_b64, bio_input), &BIO_free_all);

  std::vector<uint8_t> output;
  size_t total_bytes = 0;

  while (true) {
    output.resize(total_bytes + READ_CHUNK);
    int r = BIO_read(chain.get(), &output[total_bytes], READ_CHUNK);

    if (r < 0) throw std::runtime_error("failed while decoding base64.");

    output.resize(total_bytes + r);
    total_bytes += r;

    if (r == 0) break;
  }

  // OpenSSL quietly returns nothing for input that isn't base64
  if (output.empty() && !input.empty())
    throw std::runtime_error("input is not valid base64.");

  return output;
}

}  // namespace crypto
}  // namespace dxfer
