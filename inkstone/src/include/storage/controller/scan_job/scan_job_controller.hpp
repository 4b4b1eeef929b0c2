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

#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "library/scan_job.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/service/scan_job/scan_job_service.hpp"
#include "type/type.hpp"

namespace inkstone {
class ScanJobController {
 private:
  ConnectionGuard _guard;
  ScanJobService  _service;
  std::mutex      _mtx;

 public:
  explicit ScanJobController(ConnectionGuard&& guard);

  /**
   * @brief Create a running job unless one is already running. The check and the insert share
   *        one transaction and the controller mutex.
   *
   * @return std::optional<ScanJob> nullopt when another job is running, nothing is written then
   */
  auto TryStartJob(ScanType type) -> std::optional<ScanJob>;

  /**
   * @brief Persist phase, counters, current file and errors. Leaves status and the cancel flag
   *        alone.
   */
  void UpdateProgress(const ScanJob& job);

  /**
   * @brief Move the job into a terminal state with its final counters
   */
  void Finish(const ScanJob& job, ScanStatus status);

  /**
   * @brief Set the cancel flag on every running job
   *
   * @return true if there was a running job
   */
  auto RequestCancel() -> bool;
  auto IsCancelRequested(job_id_t id) -> bool;

  auto GetJob(job_id_t id) -> std::optional<ScanJob>;
  auto GetRunning() -> std::optional<ScanJob>;
  auto GetLatest() -> std::optional<ScanJob>;

  /**
   * @brief Fail jobs a previous process left running
   *
   * @return int64_t number of jobs marked
   */
  auto MarkInterrupted() -> int64_t;
};
};  // namespace inkstone
