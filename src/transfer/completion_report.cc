/*
 * transfer/completion_report.cc
 * -------------------------------------------------------------------------
 * Result of executing one transfer operation (implementation).
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

#include "transfer/completion_report.h"

#include <json/json.h>

#include <sstream>
#include <stdexcept>

#include "base/logger.h"
#include "base/timer.h"

namespace dxfer {
namespace transfer {

std::unique_ptr<CompletionReport> CompletionReport::Parse(
    const std::string &body) {
  std::istringstream ss(body);
  Json::Value tree;

  try {
    ss >> tree;

    if (!tree.isObject() || !tree["id"].isString() ||
        !tree["success"].isBool() || !tree["start_time"].isNumeric() ||
        !tree["duration_seconds"].isNumeric())
      throw std::runtime_error("not a status message");

    std::unique_ptr<CompletionReport> report(new CompletionReport());
    report->id = tree["id"].asString();
    report->success = tree["success"].asBool();
    report->start_time = tree["start_time"].asDouble();
    report->duration = tree["duration_seconds"].asDouble();

    if (tree["detail"].isString()) report->detail = tree["detail"].asString();
    if (tree["node_name"].isString())
      report->node_name = tree["node_name"].asString();

    if (report->id.empty()) throw std::runtime_error("report has no id");
    if (report->duration < 0.0)
      throw std::runtime_error("report has negative duration");

    return report;
  } catch (const std::exception &e) {
    DXFER_LOG(LOG_WARNING, "CompletionReport::Parse",
              "cannot decode status: %s\n", e.what());
  }

  return {};
}

std::string CompletionReport::Serialize() const {
  Json::Value tree(Json::objectValue);
  Json::StreamWriterBuilder builder;

  tree["id"] = id;
  tree["node_name"] = node_name;
  tree["success"] = success;
  tree["detail"] = detail;
  tree["start_time"] = start_time;
  tree["start_time_utc"] = base::Timer::FormatTime(start_time);
  tree["duration_seconds"] = duration;

  builder["indentation"] = "";
  return Json::writeString(builder, tree);
}

}  // namespace transfer
}  // namespace dxfer
