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

#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "config/library_config.hpp"
#include "library/scan_job.hpp"
#include "nsfw/nsfw_classifier.hpp"
#include "search/search_index.hpp"
#include "storage/storage_service.hpp"
#include "tags/metadata_cache.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Runs scans as background jobs. At most one job runs at a time across every process
 *        sharing the database: the running check and the job insert share one transaction.
 *
 */
class ScanService {
 private:
  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<MetadataCache>  cache_;
  std::shared_ptr<SearchIndex>    search_;
  std::shared_ptr<NsfwClassifier> nsfw_;
  LibraryConfig                   config_;

  std::mutex                      thread_lock_;
  std::thread                     worker_;

  void                            Execute(ScanJob job);
  void                            RunPhases(ScanJob& job, ScanLog& log);
  void                            Publish(ScanJob& job, const ScanLog& log);

 public:
  ScanService() = delete;
  ScanService(std::shared_ptr<StorageService> storage, std::shared_ptr<MetadataCache> cache,
              std::shared_ptr<SearchIndex> search, std::shared_ptr<NsfwClassifier> nsfw,
              LibraryConfig config);
  ~ScanService();

  /**
   * @brief Create a job and run it on the background thread
   *
   * @return std::optional<job_id_t> nullopt when a scan is already running, no job state is
   *         touched then
   */
  auto Start(ScanType type) -> std::optional<job_id_t>;

  /**
   * @brief Run a scan on the calling thread
   *
   * @return std::optional<ScanJob> the finished job, nullopt when a scan is already running
   */
  auto RunBlocking(ScanType type) -> std::optional<ScanJob>;

  // Ask the running job to stop at its next batch boundary
  auto RequestCancel() -> bool;

  auto GetJob(job_id_t id) -> std::optional<ScanJob>;
  auto GetLatest() -> std::optional<ScanJob>;

  // Block until the background scan, if any, has finished
  void Wait();

  /**
   * @brief Fail jobs left running by a process that died mid-scan
   */
  auto RecoverInterrupted() -> int64_t;
};
};  // namespace inkstone
