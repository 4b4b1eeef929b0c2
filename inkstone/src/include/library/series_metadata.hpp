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
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkstone {
/**
 * @brief Series metadata as supplied by a per-directory sidecar document. Every field is optional,
 *        a missing key leaves the stored value untouched when the series is upserted.
 *
 */
struct SeriesMetadata {
  std::optional<std::string>              series_;
  std::optional<std::string>              title_;
  std::optional<std::string>              title_english_;
  std::optional<std::string>              title_japanese_;
  std::optional<std::string>              synonyms_;
  std::optional<std::string>              authors_;
  std::optional<std::string>              synopsis_;
  std::optional<std::vector<std::string>> genres_;
  std::optional<std::vector<std::string>> tags_;
  std::optional<std::vector<std::string>> demographics_;
  std::optional<std::string>              status_;
  std::optional<int64_t>                  total_volumes_;
  std::optional<int64_t>                  total_chapters_;
  std::optional<int64_t>                  release_year_;
  std::optional<int64_t>                  mal_id_;
  std::optional<int64_t>                  anilist_id_;
  std::optional<bool>                     is_adult_;

  // "series" wins over "title"
  auto SeriesName() const -> std::optional<std::string>;

  /**
   * @brief Pick the known keys out of a JSON object. Unknown keys and keys of the wrong type are
   *        ignored.
   */
  static auto FromJson(const nlohmann::json& doc) -> SeriesMetadata;

  /**
   * @brief Read and parse a sidecar file
   *
   * @throws std::runtime_error if the file cannot be read or is not a JSON object
   */
  static auto LoadFile(const std::filesystem::path& path) -> SeriesMetadata;
};

/**
 * @brief Flatten a stored tag column into plain strings. Older rows hold JSON arrays whose
 *        elements are themselves JSON-encoded arrays, those are unwrapped recursively.
 */
auto ExtractTags(std::string_view raw) -> std::vector<std::string>;
auto ExtractTags(const nlohmann::json& value) -> std::vector<std::string>;

auto TagsToJson(const std::vector<std::string>& tags) -> std::string;
};  // namespace inkstone
