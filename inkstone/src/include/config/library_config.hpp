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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Process-level settings of one library. Runtime admin settings (thumbnails, NSFW rules,
 *        content hashing) live in the AdminSetting table instead.
 *
 */
struct LibraryConfig {
  file_path_t              db_path_;
  std::vector<file_path_t> roots_;
  // Thumbnails are written to <cache_dir_>/thumbnails
  file_path_t              cache_dir_;
  size_t                   worker_count_      = 4;
  size_t                   batch_size_        = 100;
  size_t                   upsert_batch_size_ = 500;
  size_t                   progress_interval_ = 50;
  std::string              sidecar_name_      = "series.json";
  std::chrono::milliseconds cover_timeout_{10000};
  size_t                   max_errors_        = 200;

  auto ThumbnailDir() const -> file_path_t { return cache_dir_ / "thumbnails"; }

  /**
   * @brief Read the known keys, missing keys keep their defaults
   *
   * @throws std::runtime_error on a wrong-typed key or a config without roots or db_path
   */
  static auto FromJson(const nlohmann::json& doc) -> LibraryConfig;
  auto        ToJson() const -> nlohmann::json;

  static auto Load(const file_path_t& path) -> LibraryConfig;
  void        Save(const file_path_t& path) const;
};
};  // namespace inkstone
