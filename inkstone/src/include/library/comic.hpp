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

#include "type/type.hpp"

namespace inkstone {
/**
 * @brief One archive file in the library. Identity is the hash of its absolute path.
 *
 */
struct Comic {
  comic_id_t                 id_;
  std::string                path_;
  std::string                filename_;
  // Denormalized series name, kept even when series_id_ is missing
  std::string                series_;
  std::optional<series_id_t> series_id_;
  std::string                category_;
  std::optional<std::string> subcategory_;
  int64_t                    size_bytes_    = 0;
  std::string                size_str_;
  // Nanoseconds on the filesystem clock, compared for equality only
  int64_t                    mtime_         = 0;
  std::optional<int64_t>     pages_;
  bool                       processed_     = false;
  bool                       has_thumbnail_ = false;
  std::optional<std::string> thumbnail_ext_;
  std::optional<std::string> file_hash_;
  std::optional<double>      volume_;
  std::optional<double>      chapter_;
};

/**
 * @brief (mtime, size) pair the sync engine diffs against
 */
struct ComicFingerprint {
  int64_t mtime_      = 0;
  int64_t size_bytes_ = 0;

  bool    operator==(const ComicFingerprint& other) const = default;
};

/**
 * @brief Outcome of inspecting one comic, applied to the row in a batched update
 */
struct ComicProcessingUpdate {
  comic_id_t                 id_;
  int64_t                    pages_         = 0;
  bool                       has_thumbnail_ = false;
  std::optional<std::string> thumbnail_ext_;
  std::optional<std::string> file_hash_;
};
};  // namespace inkstone
