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

#include "scanner/processing_pool.hpp"

#include <format>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include "utils/string/convert.hpp"

namespace inkstone {
void ProcessingStats::Tally(const InspectionResult& result) {
  ++processed_comics_;
  if (result.error_code_ == InspectionError::FILE_MISSING ||
      (!result.errors_.empty() && result.pages_ == 0)) {
    ++page_errors_;
    ++thumbnail_errors_;
    return;
  }
  if (result.pages_ > 0) {
    ++processed_pages_;
  } else {
    ++page_errors_;
  }
  if (result.thumbnail_) {
    ++processed_thumbnails_;
    thumb_bytes_written_ += static_cast<int64_t>(result.thumbnail_->bytes_.size());
    thumb_bytes_saved_ += result.thumbnail_->bytes_saved_;
  } else {
    ++thumbnail_errors_;
  }
}

ProcessingPool::ProcessingPool(ComicController& comics, Worker worker, size_t worker_count,
                               size_t batch_size)
    : comics_(comics),
      worker_(std::move(worker)),
      thread_pool_(worker_count == 0 ? 1 : worker_count),
      batch_size_(batch_size == 0 ? 100 : batch_size) {}

auto ProcessingPool::MakeInspectorWorker(const ArchiveInspector& inspector,
                                         const ThumbnailStore&   store) -> Worker {
  return [&inspector, &store](const Comic& comic) {
    auto result = inspector.Inspect(comic.id_, conv::BytesToPath(comic.path_));
    if (result.thumbnail_) {
      try {
        store.Install(comic.id_, *result.thumbnail_, true);
      } catch (const std::exception& e) {
        result.thumbnail_.reset();
        result.AddError(InspectionError::INSTALL_FAILED, e.what());
      }
    }
    return result;
  };
}

auto ProcessingPool::Run(ScanLog& log, const ProcessingCheckpoint& checkpoint) -> ProcessingStats {
  ProcessingStats stats;
  std::string     last_file;

  while (true) {
    if (checkpoint && checkpoint(ProcessingProgress{stats, last_file})) {
      stats.cancelled_ = true;
      std::cout << std::format("[INFO] ProcessingPool: Cancelled after {} comics\n",
                               stats.processed_comics_);
      break;
    }

    auto batch = comics_.FetchPending(batch_size_);
    if (batch.empty()) break;

    std::vector<std::future<InspectionResult>> futures;
    futures.reserve(batch.size());
    for (const auto& comic : batch) {
      futures.push_back(thread_pool_.SubmitTask([this, &comic]() { return worker_(comic); }));
    }

    std::vector<ComicProcessingUpdate> updates;
    updates.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
      InspectionResult result;
      auto             fail = [&](const std::string& reason) {
        // Marked processed with no pages so the batch cannot be fetched again
        result       = InspectionResult{};
        result.id_   = batch[i].id_;
        result.path_ = conv::BytesToPath(batch[i].path_);
        result.AddError(InspectionError::UNEXPECTED, std::format("Worker failed: {}", reason));
        std::cerr << std::format("[ERROR] ProcessingPool: {} - {}\n", batch[i].path_, reason);
      };
      try {
        result = futures[i].get();
      } catch (const std::exception& e) {
        fail(e.what());
      } catch (...) {
        fail("unknown exception");
      }

      stats.Tally(result);
      for (const auto& message : result.errors_) log.Add(batch[i].path_, message);

      ComicProcessingUpdate update;
      update.id_            = batch[i].id_;
      update.pages_         = result.pages_;
      update.has_thumbnail_ = result.thumbnail_.has_value();
      if (result.thumbnail_) update.thumbnail_ext_ = result.thumbnail_->ext_;
      update.file_hash_ = result.file_hash_;
      updates.push_back(std::move(update));
    }

    comics_.ApplyProcessingResults(updates);
    ++stats.batches_;
    last_file = batch.back().filename_;
  }
  return stats;
}
};  // namespace inkstone
