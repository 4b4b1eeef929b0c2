//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "storage/service/scan_job/scan_job_service.hpp"

#include <format>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace inkstone {
namespace {
auto FromPtr(std::unique_ptr<std::string>& value) -> std::optional<std::string> {
  if (!value) return std::nullopt;
  return std::move(*value);
}

auto ErrorsFromJson(const std::unique_ptr<std::string>& raw) -> std::vector<std::string> {
  std::vector<std::string> errors;
  if (!raw || raw->empty()) return errors;
  auto doc = nlohmann::json::parse(*raw, nullptr, false);
  if (doc.is_discarded() || !doc.is_array()) {
    std::cerr << "[WARN] ScanJobService: Unreadable error list on scan job\n";
    return errors;
  }
  for (const auto& item : doc) {
    if (item.is_string()) errors.push_back(item.get<std::string>());
  }
  return errors;
}
}  // namespace

auto ScanJobService::FromParams(ScanJobMapperParams&& param) -> ScanJob {
  ScanJob job;
  job.id_                             = param.id;
  job.type_                           = ScanTypeFromString(param.scan_type ? *param.scan_type : "full");
  job.status_                         = ScanStatusFromString(param.status ? *param.status : "failed");
  job.phase_                          = ScanPhaseFromString(param.phase ? *param.phase : "done");
  job.started_at_                     = param.started_at ? std::move(*param.started_at) : "";
  job.completed_at_                   = FromPtr(param.completed_at);
  job.counters_.total_comics_         = param.total_comics;
  job.counters_.processed_comics_     = param.processed_comics;
  job.counters_.new_comics_           = param.new_comics;
  job.counters_.changed_comics_       = param.changed_comics;
  job.counters_.deleted_comics_       = param.deleted_comics;
  job.counters_.processed_pages_      = param.processed_pages;
  job.counters_.page_errors_          = param.page_errors;
  job.counters_.processed_thumbnails_ = param.processed_thumbnails;
  job.counters_.thumbnail_errors_     = param.thumbnail_errors;
  job.counters_.thumb_bytes_written_  = param.thumb_bytes_written;
  job.counters_.thumb_bytes_saved_    = param.thumb_bytes_saved;
  job.current_file_                   = FromPtr(param.current_file);
  job.errors_                         = ErrorsFromJson(param.errors);
  job.failure_                        = FromPtr(param.failure);
  job.cancel_requested_               = param.cancel_requested;
  return job;
}

auto ScanJobService::GetJobById(const job_id_t id) -> std::vector<ScanJob> {
  return GetByPredicate(std::format("id={}", id));
}

auto ScanJobService::GetRunningJobs() -> std::vector<ScanJob> {
  return GetByPredicate("status='running' ORDER BY id");
}

auto ScanJobService::GetRecentJobs(size_t limit) -> std::vector<ScanJob> {
  return GetByPredicate(std::format("true ORDER BY id DESC LIMIT {}", limit));
}
};  // namespace inkstone
