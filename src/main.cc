/*
 * main.cc
 * -------------------------------------------------------------------------
 * Coordinator and worker entry point for distributed blob transfers.
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

#include <getopt.h>
#include <unistd.h>

#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "base/config.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/xml.h"
#include "services/service.h"
#include "threads/pool.h"
#include "transfer/channel.h"
#include "transfer/coordinator.h"
#include "transfer/errors.h"
#include "transfer/worker_engine.h"

namespace dxfer {
namespace {
constexpr int EXIT_RUN_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_RUN_FAILED = 2;

constexpr char SHORT_OPTIONS[] = "c:v::qhV";

enum { OPT_CLEANUP = 256 };

const option LONG_OPTIONS[] = {
    {"config-file", required_argument, nullptr, 'c'},
    {"verbose", optional_argument, nullptr, 'v'},
    {"quiet", no_argument, nullptr, 'q'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {"cleanup", no_argument, nullptr, OPT_CLEANUP},
    {nullptr, 0, nullptr, '\0'}};

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string &what) : std::runtime_error(what) {}
};

struct Options {
  const char *base_name = nullptr;
  std::string config;
  int verbosity = LOG_NOTICE;
  bool cleanup = false;

  std::string command;
  std::vector<std::string> args;

  explicit Options(const char *arg0) {
    base_name = std::strrchr(arg0, '/');
    base_name = base_name ? base_name + 1 : arg0;
  }
};

int PrintUsage(const char *base_name) {
  std::cerr
      << "Usage: " << base_name
      << " [options] <command> [...]\n"
         "\n"
         "Where <command> is one of:\n"
         "\n"
         "  upload <block-size> <blocks> <instances> [object] [container]\n"
         "                       Have <instances> workers upload <blocks> "
         "blocks of\n"
         "                       <block-size> bytes each, then commit them as "
         "one object.\n"
         "  download <chunk-size> - <instances> [object] [container]\n"
         "                       Have <instances> workers read the object in "
         "chunks of\n"
         "                       <chunk-size> bytes.\n"
         "  worker [concurrency] Execute jobs as they arrive, with up to\n"
         "                       [concurrency] requests in flight.\n"
         "\n"
         "[options] can be:\n"
         "\n"
         "  -c, --config-file <path>  Use configuration at <path> rather than "
         "the default.\n"
         "      --cleanup        Delete the object and its container after a "
         "committed\n"
         "                       upload.\n"
         "  -h, --help           Print this help message and exit.\n"
         "  -q, --quiet          Only log errors.\n"
         "  -v, --verbose        Log more (can be repeated).\n"
         "  -vN, --verbose=N     Set verbosity to N.\n"
         "  -V, --version        Print version and exit.\n"
      << std::endl;
  return EXIT_USAGE;
}

int PrintVersion() {
  std::cout << PACKAGE_NAME << ", " << PACKAGE_VERSION_WITH_REV << ", "
            << "distributed blob transfer driver" << std::endl;
  std::cout << "enabled services: " << services::Service::GetEnabledServices()
            << std::endl;
  return EXIT_RUN_OK;
}

template <class T>
T ParsePositive(const std::string &value, const char *name) {
  long long v = 0;

  try {
    v = boost::lexical_cast<long long>(value);
  } catch (const boost::bad_lexical_cast &) {
    throw UsageError(std::string("invalid ") + name + ": " + value);
  }

  if (v <= 0) throw UsageError(std::string(name) + " must be positive");
  if (static_cast<unsigned long long>(v) >
      static_cast<unsigned long long>(std::numeric_limits<T>::max()))
    throw UsageError(std::string(name) + " is too large: " + value);

  return static_cast<T>(v);
}

const std::string &GetArg(const Options &opts, size_t i,
                          const std::string &def) {
  return (i < opts.args.size()) ? opts.args[i] : def;
}

std::string GetHostName() {
  char name[256];

  if (gethostname(name, sizeof(name)) != 0) return "unknown";

  name[sizeof(name) - 1] = '\0';
  return name;
}

void Init(const Options &opts) {
  base::Logger::Init(base::Logger::Mode::STDERR, opts.verbosity);
  base::Config::Init(opts.config);
  base::XmlDocument::Init();

  if (!base::Config::stats_file().empty())
    base::Statistics::Init(base::Config::stats_file());

  // pool threads size themselves from, and sign requests with, what's set
  // here
  if (opts.command == "worker" && !opts.args.empty())
    base::Config::set_transfer_concurrency(
        ParsePositive<int>(opts.args[0], "concurrency"));

  services::Service::Init();
  threads::Pool::Init();
}

int RunWorker(transfer::JobChannel *jobs, transfer::StatusChannel *status) {
  transfer::WorkerEngine engine(services::Service::blob_store(), jobs, status,
                                base::Config::transfer_concurrency(),
                                GetHostName());

  engine.Run();
  return EXIT_RUN_OK;
}

int RunUpload(const Options &opts, transfer::Coordinator *coordinator) {
  transfer::UploadRequest request;

  if (opts.args.size() < 3) throw UsageError("upload needs three arguments");

  request.unit_size = ParsePositive<uint64_t>(opts.args[0], "block size");
  request.total_units = ParsePositive<uint32_t>(opts.args[1], "block count");
  request.instances = ParsePositive<uint32_t>(opts.args[2], "instance count");
  request.object_name = GetArg(opts, 3, base::Config::default_object_name());
  request.container_name =
      GetArg(opts, 4, base::Config::default_container_name());
  request.cleanup = opts.cleanup;

  auto result = coordinator->RunUpload(request);
  transfer::Coordinator::LogResult("upload", result);

  return result.success() ? EXIT_RUN_OK : EXIT_RUN_FAILED;
}

int RunDownload(const Options &opts, transfer::Coordinator *coordinator) {
  transfer::DownloadRequest request;

  if (opts.args.size() < 3) throw UsageError("download needs three arguments");
  if (opts.args[1] != "-")
    throw UsageError("download takes \"-\" in place of the block count");

  request.chunk_size = ParsePositive<uint64_t>(opts.args[0], "chunk size");
  request.instances = ParsePositive<uint32_t>(opts.args[2], "instance count");
  request.object_name = GetArg(opts, 3, base::Config::default_object_name());
  request.container_name =
      GetArg(opts, 4, base::Config::default_container_name());

  auto result = coordinator->RunDownload(request);
  transfer::Coordinator::LogResult("download", result);

  return result.success() ? EXIT_RUN_OK : EXIT_RUN_FAILED;
}

int Run(const Options &opts) {
  transfer::JobChannel jobs(services::Service::message_queue(),
                            base::Config::job_queue_name());
  transfer::StatusChannel status(services::Service::message_queue(),
                                 base::Config::status_queue_name());

  jobs.CreateIfMissing();
  status.CreateIfMissing();

  if (opts.command == "worker") return RunWorker(&jobs, &status);

  transfer::Coordinator coordinator(services::Service::blob_store(), &jobs,
                                    &status, GetHostName());

  if (opts.command == "upload") return RunUpload(opts, &coordinator);

  return RunDownload(opts, &coordinator);
}
}  // namespace
}  // namespace dxfer

int main(int argc, char **argv) {
  dxfer::Options opts(argv[0]);
  int opt = 0;

  while ((opt = getopt_long(argc, argv, dxfer::SHORT_OPTIONS,
                            dxfer::LONG_OPTIONS, nullptr)) != -1) {
    switch (opt) {
      case 'c':
        opts.config = optarg;
        break;

      case 'v':
        if (optarg)
          opts.verbosity = atoi(optarg);
        else
          opts.verbosity++;
        break;

      case 'q':
        opts.verbosity = LOG_ERR;
        break;

      case 'V':
        return dxfer::PrintVersion();

      case dxfer::OPT_CLEANUP:
        opts.cleanup = true;
        break;

      default:
        return dxfer::PrintUsage(opts.base_name);
    }
  }

  if (optind < argc) opts.command = argv[optind++];
  while (optind < argc) opts.args.push_back(argv[optind++]);

  if (opts.command != "upload" && opts.command != "download" &&
      opts.command != "worker")
    return dxfer::PrintUsage(opts.base_name);

  int r = dxfer::EXIT_RUN_OK;

  try {
    dxfer::Init(opts);

    DXFER_LOG(LOG_INFO, "::main", "%s version %s, initialized\n", PACKAGE_NAME,
              PACKAGE_VERSION_WITH_REV);

    r = dxfer::Run(opts);
  } catch (const dxfer::UsageError &e) {
    std::cerr << e.what() << std::endl;
    dxfer::PrintUsage(opts.base_name);
    r = dxfer::EXIT_USAGE;
  } catch (const dxfer::transfer::InvalidPartition &e) {
    DXFER_LOG(LOG_ERR, "::main", "%s\n", e.what());
    r = dxfer::EXIT_USAGE;
  } catch (const dxfer::transfer::TransferError &e) {
    DXFER_LOG(LOG_ERR, "::main", "%s failed: %s\n", opts.command.c_str(),
              e.what());
    r = dxfer::EXIT_RUN_FAILED;
  } catch (const std::exception &e) {
    DXFER_LOG(LOG_ERR, "::main", "caught exception: %s\n", e.what());
    r = dxfer::EXIT_USAGE;
  }

  try {
    dxfer::threads::Pool::Terminate();
    // these won't do anything if statistics::init() wasn't called
    dxfer::base::Statistics::Collect();
    dxfer::base::Statistics::Flush();
  } catch (const std::exception &e) {
    DXFER_LOG(LOG_ERR, "::main", "caught exception while cleaning up: %s\n",
              e.what());
  }

  return r;
}
