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

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scanner/thumbnail_store.hpp"
#include "storage/storage_service.hpp"
#include "type/type.hpp"

namespace inkstone {
struct CoverOutcome {
  std::optional<file_path_t> path_;
  std::vector<std::string>   errors_;
};

struct CoverResult {
  // Installed thumbnail, empty when the placeholder is returned
  std::optional<file_path_t> path_;
  bool                       placeholder_ = false;
  bool                       timed_out_   = false;
  std::vector<std::string>   errors_;
};

/**
 * @brief Interactive cover requests outside of a scan. Extraction runs on its own thread and
 *        the caller waits at most the configured timeout. Work that outlives the wait still
 *        installs its thumbnail, unless another writer got there first.
 *
 */
class CoverService {
 private:
  std::shared_ptr<StorageService>                             storage_;
  ThumbnailStore                                              store_;
  std::chrono::milliseconds                                   timeout_;

  std::mutex                                                  inflight_lock_;
  std::unordered_map<comic_id_t, std::shared_future<CoverOutcome>> inflight_;
  std::vector<std::shared_future<CoverOutcome>>               detached_;

  auto Extract(const comic_id_t& id, const std::string& path) -> CoverOutcome;

 public:
  CoverService() = delete;
  CoverService(std::shared_ptr<StorageService> storage, const file_path_t& thumbnail_dir,
               std::chrono::milliseconds timeout);
  ~CoverService();

  /**
   * @brief Cover of one comic, extracting it on demand
   *
   * @throws std::invalid_argument for an unknown comic id
   */
  auto GetCover(const comic_id_t& id) -> CoverResult;

  // Block until every extraction started by this service has finished
  void WaitForPending();

  /**
   * @brief Neutral image in the configured thumbnail size, PNG encoded
   */
  auto PlaceholderImage() -> std::vector<uchar>;
};
};  // namespace inkstone
