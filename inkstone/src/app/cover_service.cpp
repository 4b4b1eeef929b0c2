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

#include "app/cover_service.hpp"

#include <format>
#include <iostream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

#include "config/scan_settings.hpp"
#include "scanner/archive_inspector.hpp"
#include "utils/string/convert.hpp"

namespace inkstone {
CoverService::CoverService(std::shared_ptr<StorageService> storage,
                           const file_path_t& thumbnail_dir, std::chrono::milliseconds timeout)
    : storage_(std::move(storage)), store_(thumbnail_dir), timeout_(timeout) {}

CoverService::~CoverService() { WaitForPending(); }

auto CoverService::Extract(const comic_id_t& id, const std::string& path) -> CoverOutcome {
  CoverOutcome outcome;
  try {
    auto             settings = ScanSettings::Load(storage_->GetSettingsController());
    ArchiveInspector inspector(InspectorOptions{settings.thumbnail_, false});
    auto             result = inspector.Inspect(id, conv::BytesToPath(path));
    outcome.errors_         = result.errors_;
    if (result.thumbnail_) {
      // A concurrent request or a scan may have installed one meanwhile, theirs stays
      if (!store_.Install(id, *result.thumbnail_, false)) {
        std::cout << std::format("[INFO] CoverService: Kept the existing cover of {}\n", id);
      }
    }
    outcome.path_ = store_.Find(id);
    if (outcome.path_) {
      auto ext = conv::PathToBytes(outcome.path_->extension());
      if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
      storage_->GetComicController().SetThumbnail(id, ext);
    }
  } catch (const std::exception& e) {
    std::cerr << std::format("[ERROR] CoverService: Cover extraction for {} failed: {}\n", id,
                             e.what());
    outcome.errors_.push_back(e.what());
  }
  return outcome;
}

auto CoverService::GetCover(const comic_id_t& id) -> CoverResult {
  CoverResult result;
  if (auto existing = store_.Find(id)) {
    result.path_ = existing;
    return result;
  }

  std::shared_future<CoverOutcome> pending;
  {
    std::lock_guard<std::mutex> lock(inflight_lock_);
    auto                        it = inflight_.find(id);
    if (it != inflight_.end()) {
      pending = it->second;
    } else {
      auto comic = storage_->GetComicController().GetById(id);
      if (!comic) {
        throw std::invalid_argument(std::format("[ERROR] CoverService: Unknown comic {}", id));
      }
      pending = std::async(std::launch::async,
                           [this, id, path = comic->path_]() {
                             auto outcome = Extract(id, path);
                             std::lock_guard<std::mutex> done_lock(inflight_lock_);
                             inflight_.erase(id);
                             return outcome;
                           })
                    .share();
      inflight_.emplace(id, pending);
      std::erase_if(detached_, [](const std::shared_future<CoverOutcome>& future) {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
      });
      detached_.push_back(pending);
    }
  }

  if (pending.wait_for(timeout_) != std::future_status::ready) {
    std::cerr << std::format("[WARN] CoverService: Cover of {} not ready after {} ms\n", id,
                             timeout_.count());
    result.placeholder_ = true;
    result.timed_out_   = true;
    return result;
  }
  const auto& outcome = pending.get();
  result.path_        = outcome.path_;
  result.errors_      = outcome.errors_;
  result.placeholder_ = !outcome.path_.has_value();
  return result;
}

void CoverService::WaitForPending() {
  std::vector<std::shared_future<CoverOutcome>> pending;
  {
    std::lock_guard<std::mutex> lock(inflight_lock_);
    pending.swap(detached_);
  }
  for (auto& future : pending) future.wait();
}

auto CoverService::PlaceholderImage() -> std::vector<uchar> {
  auto               settings = ScanSettings::Load(storage_->GetSettingsController());
  cv::Mat            canvas(settings.thumbnail_.height_, settings.thumbnail_.width_, CV_8UC3,
                            cv::Scalar(64, 64, 64));
  std::vector<uchar> encoded;
  if (!cv::imencode(".png", canvas, encoded)) {
    throw std::runtime_error("[ERROR] CoverService: Cannot encode the placeholder image");
  }
  return encoded;
}
};  // namespace inkstone
