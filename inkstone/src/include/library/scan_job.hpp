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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "type/type.hpp"

namespace inkstone {
enum class ScanStatus : uint8_t { RUNNING = 0, COMPLETED, FAILED, CANCELLED };

enum class ScanPhase : uint8_t { SYNC = 0, PROCESSING, DONE };

enum class ScanType : uint8_t {
  FULL = 0,  // DEFAULT: sync, then process pending comics
  SYNC_ONLY,
  RESCAN  // wipe comics and series first
};

auto ToString(ScanStatus status) -> std::string_view;
auto ToString(ScanPhase phase) -> std::string_view;
auto ToString(ScanType type) -> std::string_view;
auto ScanStatusFromString(std::string_view text) -> ScanStatus;
auto ScanPhaseFromString(std::string_view text) -> ScanPhase;
auto ScanTypeFromString(std::string_view text) -> ScanType;

struct ScanCounters {
  int64_t total_comics_         = 0;
  int64_t processed_comics_     = 0;
  int64_t new_comics_           = 0;
  int64_t changed_comics_       = 0;
  int64_t deleted_comics_       = 0;
  int64_t processed_pages_      = 0;
  int64_t page_errors_          = 0;
  int64_t processed_thumbnails_ = 0;
  int64_t thumbnail_errors_     = 0;
  int64_t thumb_bytes_written_  = 0;
  int64_t thumb_bytes_saved_    = 0;
};

/**
 * @brief Pollable state of one scan run, as persisted in the ScanJob table
 *
 */
struct ScanJob {
  job_id_t                   id_               = 0;
  ScanType                   type_             = ScanType::FULL;
  ScanStatus                 status_           = ScanStatus::RUNNING;
  ScanPhase                  phase_            = ScanPhase::SYNC;
  std::string                started_at_;
  std::optional<std::string> completed_at_;
  ScanCounters               counters_;
  std::optional<std::string> current_file_;
  std::vector<std::string>   errors_;
  std::optional<std::string> failure_;
  bool                       cancel_requested_ = false;

  auto IsTerminal() const -> bool { return status_ != ScanStatus::RUNNING; }
};
};  // namespace inkstone
