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
#include <string>

#include "concurrency/thread_pool.hpp"
#include "library/comic.hpp"
#include "scanner/archive_inspector.hpp"
#include "scanner/thumbnail_store.hpp"
#include "storage/controller/comic/comic_controller.hpp"
#include "utils/scan/scan_log.hpp"

namespace inkstone {
struct ProcessingStats {
  int64_t processed_comics_     = 0;
  int64_t processed_pages_      = 0;
  int64_t page_errors_          = 0;
  int64_t processed_thumbnails_ = 0;
  int64_t thumbnail_errors_     = 0;
  int64_t thumb_bytes_written_  = 0;
  int64_t thumb_bytes_saved_    = 0;
  int64_t batches_              = 0;
  bool    cancelled_            = false;

  /**
   * @brief Fold one item's outcome into the counters. Order independent.
   */
  void    Tally(const InspectionResult& result);
};

struct ProcessingProgress {
  ProcessingStats stats_;
  std::string     current_file_;
};

// Called before every batch, return true to cancel
using ProcessingCheckpoint = std::function<bool(const ProcessingProgress&)>;

/**
 * @brief Phase 2 of a scan: drains unprocessed comics in bounded batches through a fixed worker
 *        pool. Workers only inspect, every batch is written by the calling thread in one
 *        transaction.
 *
 */
class ProcessingPool {
 public:
  using Worker = std::function<InspectionResult(const Comic&)>;

  ProcessingPool(ComicController& comics, Worker worker, size_t worker_count, size_t batch_size);

  auto        Run(ScanLog& log, const ProcessingCheckpoint& checkpoint = {}) -> ProcessingStats;

  /**
   * @brief Inspect the archive and install its thumbnail, replacing an older one. A failed
   *        install drops the thumbnail from the result.
   */
  static auto MakeInspectorWorker(const ArchiveInspector& inspector, const ThumbnailStore& store)
      -> Worker;

 private:
  ComicController& comics_;
  Worker           worker_;
  ThreadPool       thread_pool_;
  size_t           batch_size_;
};
};  // namespace inkstone
