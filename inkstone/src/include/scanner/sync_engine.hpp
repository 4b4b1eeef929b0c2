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

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "library/comic.hpp"
#include "library/series_metadata.hpp"
#include "scanner/sidecar_resolver.hpp"
#include "storage/controller/comic/comic_controller.hpp"
#include "storage/controller/series/series_controller.hpp"
#include "type/type.hpp"
#include "utils/scan/scan_log.hpp"

namespace inkstone {
/**
 * @brief A library root cannot be walked. Fatal to the scan, nothing is written.
 */
class ScanConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct SyncOptions {
  std::vector<file_path_t> roots_;
  std::string              sidecar_name_      = "series.json";
  size_t                   upsert_batch_size_ = 500;
  size_t                   progress_interval_ = 50;
};

struct SyncStats {
  int64_t total_files_    = 0;
  int64_t new_comics_     = 0;
  int64_t changed_comics_ = 0;
  int64_t deleted_comics_ = 0;
  int64_t series_written_ = 0;
  bool    cancelled_      = false;

  auto    HasChanges() const -> bool {
    return new_comics_ > 0 || changed_comics_ > 0 || deleted_comics_ > 0;
  }
};

struct SyncProgress {
  int64_t     files_seen_     = 0;
  int64_t     new_comics_     = 0;
  int64_t     changed_comics_ = 0;
  std::string current_file_;
};

// Return true to cancel the walk
using SyncProgressCallback  = std::function<bool(const SyncProgress&)>;
// Fired once after a sync that wrote anything
using LibraryChangedCallback = std::function<void()>;

/**
 * @brief Phase 1 of a scan: walk the library roots, diff the archives against the stored
 *        snapshot and write new, changed and missing comics plus their series.
 *
 */
class SyncEngine {
 public:
  SyncEngine(ComicController& comics, SeriesController& series, SyncOptions options,
             LibraryChangedCallback on_changed = {});

  /**
   * @brief Run one sync. The walk is single threaded and visits entries in sorted order.
   *
   * @param log per-file errors (unreadable entries, broken sidecars) go here
   * @param progress polled every progress_interval_ files
   * @return SyncStats
   * @throws ScanConfigError if a root is missing or unreadable
   */
  auto Run(ScanLog& log, const SyncProgressCallback& progress = {}) -> SyncStats;

  /**
   * @brief Absolute, lexically normal form used for ids and stored paths
   */
  static auto NormalizePath(const file_path_t& path) -> file_path_t;
  static auto ComicIdFor(const file_path_t& normalized_path) -> comic_id_t;

 private:
  struct PendingSeries {
    std::shared_ptr<const SeriesMetadata> metadata_;
    SeriesPlacement                       placement_;
  };

  struct WalkState {
    const std::unordered_map<comic_id_t, ComicFingerprint>* snapshot_ = nullptr;
    std::unordered_set<comic_id_t>                          seen_;
    std::vector<Comic>                                      upserts_;
    // Insertion order keeps the first comic of each series as its cover
    std::vector<std::string>                                series_order_;
    std::unordered_map<std::string, PendingSeries>          series_;
    SyncStats                                               stats_;
    bool                                                    cancelled_ = false;
  };

  void                   WalkDir(const file_path_t& root, const file_path_t& dir,
                                 const std::vector<std::string>& rel_parts, SidecarResolver& sidecars,
                                 WalkState& state, ScanLog& log,
                                 const SyncProgressCallback& progress);

  void                   VisitFile(const file_path_t& file, const std::vector<std::string>& rel_parts,
                                   SidecarResolver& sidecars, const file_path_t& dir,
                                   WalkState& state, ScanLog& log);

  ComicController&       comics_;
  SeriesController&      series_;
  SyncOptions            options_;
  LibraryChangedCallback on_changed_;
};
};  // namespace inkstone
