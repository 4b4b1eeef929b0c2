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

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace inkstone {

struct ScanLogEntry {
  std::string file_{};
  std::string message_{};
};

struct ScanLogSnapshot {
  std::vector<ScanLogEntry> entries_{};
  // Errors seen past the cap, counted but not kept
  size_t                    dropped_ = 0;
};

/**
 * @brief Per-job error list shared by the walk and the workers. Keeps the first max_entries
 *        errors so a broken library cannot grow the job row without bound.
 */
class ScanLog {
 public:
  explicit ScanLog(size_t max_entries) : max_entries_(max_entries) {}

  void Add(const std::string& file, const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (entries_.size() >= max_entries_) {
      ++dropped_;
      return;
    }
    entries_.push_back(ScanLogEntry{file, message});
  }

  auto Size() const -> size_t {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size() + dropped_;
  }

  auto Snapshot() const -> ScanLogSnapshot {
    std::lock_guard<std::mutex> lock(mtx_);
    return ScanLogSnapshot{entries_, dropped_};
  }

  /**
   * @brief "file: message" lines, with a trailing note when entries were dropped
   */
  auto Lines() const -> std::vector<std::string> {
    auto                     snapshot = Snapshot();
    std::vector<std::string> lines;
    lines.reserve(snapshot.entries_.size() + 1);
    for (const auto& entry : snapshot.entries_) {
      lines.push_back(entry.file_.empty() ? entry.message_ : entry.file_ + ": " + entry.message_);
    }
    if (snapshot.dropped_ > 0) {
      lines.push_back("... " + std::to_string(snapshot.dropped_) + " more error(s) not recorded");
    }
    return lines;
  }

 private:
  mutable std::mutex        mtx_{};
  size_t                    max_entries_;
  std::vector<ScanLogEntry> entries_{};
  size_t                    dropped_ = 0;
};

}  // namespace inkstone
