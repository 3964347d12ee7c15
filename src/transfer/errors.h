/*
 * transfer/errors.h
 * -------------------------------------------------------------------------
 * Failures raised by the transfer core.
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

#ifndef DXFER_TRANSFER_ERRORS_H
#define DXFER_TRANSFER_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dxfer {
namespace transfer {
class TransferError : public std::runtime_error {
 public:
  inline explicit TransferError(const std::string &what)
      : std::runtime_error(what) {}
};

// A channel call failed after the request layer's retries. Pollers log it and
// try again on the next poll.
class ChannelUnavailable : public TransferError {
 public:
  inline ChannelUnavailable(const std::string &channel, int code)
      : TransferError("channel [" + channel + "] unavailable (" +
                      std::to_string(code) + ")"),
        code_(code) {}

  inline int code() const { return code_; }

 private:
  int code_;
};

class InvalidPartition : public TransferError {
 public:
  inline explicit InvalidPartition(const std::string &what)
      : TransferError("invalid partition: " + what) {}
};

// One or more units of an operation failed. Units that succeeded stay in
// place.
class PartialFailure : public TransferError {
 public:
  inline PartialFailure(const std::string &kind,
                        std::vector<std::string> causes, size_t total)
      : TransferError(Describe(kind, causes, total)),
        causes_(std::move(causes)) {}

  inline const std::vector<std::string> &causes() const { return causes_; }

 private:
  static std::string Describe(const std::string &kind,
                              const std::vector<std::string> &causes,
                              size_t total);

  std::vector<std::string> causes_;
};

class PartialUploadFailure : public PartialFailure {
 public:
  inline PartialUploadFailure(std::vector<std::string> causes, size_t total)
      : PartialFailure("upload", std::move(causes), total) {}
};

class PartialDownloadFailure : public PartialFailure {
 public:
  inline PartialDownloadFailure(std::vector<std::string> causes, size_t total)
      : PartialFailure("download", std::move(causes), total) {}
};

class CommitFailed : public TransferError {
 public:
  inline CommitFailed(const std::string &blob, int cause)
      : TransferError("commit of [" + blob + "] failed (" +
                      std::to_string(cause) + ")"),
        cause_(cause) {}

  inline int cause() const { return cause_; }

 private:
  int cause_;
};

class FinalizeTimeout : public TransferError {
 public:
  inline FinalizeTimeout(const std::string &blob, size_t observed,
                         size_t expected)
      : TransferError("timed out waiting for units of [" + blob + "]: " +
                      std::to_string(observed) + "/" +
                      std::to_string(expected) + " present"),
        observed_(observed),
        expected_(expected) {}

  inline size_t observed() const { return observed_; }
  inline size_t expected() const { return expected_; }

 private:
  size_t observed_, expected_;
};
}  // namespace transfer
}  // namespace dxfer

#endif
