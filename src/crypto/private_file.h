/*
 * crypto/private_file.h
 * -------------------------------------------------------------------------
 * Creates and opens files readable only by their owner.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2013, Tarick Bedeir.
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

#ifndef DXFER_CRYPTO_PRIVATE_FILE_H
#define DXFER_CRYPTO_PRIVATE_FILE_H

#include <string>

namespace dxfer {
namespace crypto {
// Files holding account keys. They must be readable and writable by their
// owner only.
class PrivateFile {
 public:
  enum class WriteMode { CREATE, OVERWRITE };

  // Returns the first line, without the line terminator.
  static std::string ReadLine(const std::string &file);

  // CREATE refuses to replace an existing file.
  static void Write(const std::string &file, const std::string &contents,
                    WriteMode mode = WriteMode::CREATE);
};
}  // namespace crypto
}  // namespace dxfer

#endif
