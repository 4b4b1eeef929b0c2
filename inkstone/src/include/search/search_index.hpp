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

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "library/series.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/service/series/series_service.hpp"

namespace inkstone {
struct SearchResult {
  std::vector<Series> series_;
  // false when the substring fallback produced the rows
  bool                full_text_ = false;
};

/**
 * @brief Full-text index over series names, titles, authors and synopses. DuckDB does not
 *        maintain the index on writes, so writers mark it dirty and the next search rebuilds it.
 *        Without the fts extension every search uses substring matching.
 *
 */
class SearchIndex {
 public:
  static constexpr size_t default_limit = 50;

  explicit SearchIndex(ConnectionGuard&& guard);

  void MarkDirty();
  auto IsDirty() const -> bool { return dirty_.load(); }

  /**
   * @brief Recreate the index from the Series table
   *
   * @return true if the full-text index is available afterwards
   */
  auto Rebuild() -> bool;

  /**
   * @brief Ranked matches for a free-text query, substring matches when the index is missing or
   *        finds nothing
   */
  auto Search(const std::string& query, size_t limit = default_limit) -> SearchResult;

 private:
  auto              RebuildLocked() -> bool;
  auto              FullTextIds(const std::string& words, size_t limit) -> std::vector<series_id_t>;
  auto              SubstringIds(const std::string& query, size_t limit) -> std::vector<series_id_t>;
  auto              LoadInOrder(const std::vector<series_id_t>& ids) -> std::vector<Series>;

  ConnectionGuard   _guard;
  SeriesService     _service;
  std::mutex        _mtx;

  std::atomic<bool> dirty_{true};
  bool              fts_loaded_    = false;
  bool              fts_missing_   = false;
  bool              fts_available_ = false;
};
};  // namespace inkstone
