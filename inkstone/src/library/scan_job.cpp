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

#include "library/scan_job.hpp"

#include <format>
#include <stdexcept>
#include <string>

namespace inkstone {
auto ToString(ScanStatus status) -> std::string_view {
  switch (status) {
    case ScanStatus::RUNNING:
      return "running";
    case ScanStatus::COMPLETED:
      return "completed";
    case ScanStatus::FAILED:
      return "failed";
    case ScanStatus::CANCELLED:
      return "cancelled";
  }
  return "failed";
}

auto ToString(ScanPhase phase) -> std::string_view {
  switch (phase) {
    case ScanPhase::SYNC:
      return "sync";
    case ScanPhase::PROCESSING:
      return "processing";
    case ScanPhase::DONE:
      return "done";
  }
  return "done";
}

auto ToString(ScanType type) -> std::string_view {
  switch (type) {
    case ScanType::FULL:
      return "full";
    case ScanType::SYNC_ONLY:
      return "sync_only";
    case ScanType::RESCAN:
      return "rescan";
  }
  return "full";
}

auto ScanStatusFromString(std::string_view text) -> ScanStatus {
  if (text == "running") return ScanStatus::RUNNING;
  if (text == "completed") return ScanStatus::COMPLETED;
  if (text == "failed") return ScanStatus::FAILED;
  if (text == "cancelled") return ScanStatus::CANCELLED;
  throw std::invalid_argument(std::format("Unknown scan status '{}'", text));
}

auto ScanPhaseFromString(std::string_view text) -> ScanPhase {
  if (text == "sync") return ScanPhase::SYNC;
  if (text == "processing") return ScanPhase::PROCESSING;
  if (text == "done") return ScanPhase::DONE;
  throw std::invalid_argument(std::format("Unknown scan phase '{}'", text));
}

auto ScanTypeFromString(std::string_view text) -> ScanType {
  if (text == "full") return ScanType::FULL;
  if (text == "sync_only") return ScanType::SYNC_ONLY;
  if (text == "rescan") return ScanType::RESCAN;
  throw std::invalid_argument(std::format("Unknown scan type '{}'", text));
}
};  // namespace inkstone
