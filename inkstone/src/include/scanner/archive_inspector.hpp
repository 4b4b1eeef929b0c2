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

#include "scanner/thumbnail_encoder.hpp"
#include "type/type.hpp"

namespace inkstone {
enum class InspectionError : uint8_t {
  NONE = 0,
  FILE_MISSING,
  OPEN_FAILED,  // unreadable or corrupt container
  NO_IMAGES,
  COVER_FAILED,  // pages counted, cover could not be read or encoded
  HASH_FAILED,
  INSTALL_FAILED,  // thumbnail encoded but not written to the cache
  UNEXPECTED  // worker raised past the inspector
};

auto ToString(InspectionError error) -> std::string_view;

/**
 * @brief Outcome of inspecting one archive. Failures are reported here, never thrown.
 *
 */
struct InspectionResult {
  comic_id_t                      id_;
  file_path_t                     path_;
  int64_t                         pages_ = 0;
  std::optional<EncodedThumbnail> thumbnail_;
  std::optional<std::string>      file_hash_;
  InspectionError                 error_code_ = InspectionError::NONE;
  std::vector<std::string>        errors_;

  void                            AddError(InspectionError code, std::string message) {
    if (error_code_ == InspectionError::NONE) error_code_ = code;
    errors_.push_back(std::move(message));
  }
};

struct InspectorOptions {
  ThumbnailSettings thumbnail_;
  bool              compute_file_hash_ = false;
};

class ArchiveInspector {
 public:
  explicit ArchiveInspector(const InspectorOptions& options);

  /**
   * @brief Count the pages, encode the cover (first page in natural order) and optionally hash
   *        the archive. Safe to call from several threads at once.
   *
   * @param id
   * @param path
   * @return InspectionResult
   */
  auto Inspect(const comic_id_t& id, const file_path_t& path) const -> InspectionResult;

  /**
   * @brief Page entries of the archive in reading order
   *
   * @throws std::runtime_error if the archive cannot be read
   */
  static auto ListPages(const file_path_t& path) -> std::vector<std::string>;

 private:
  InspectorOptions options_;
  ThumbnailEncoder encoder_;
};
};  // namespace inkstone
