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
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "library/comic.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/service/comic/comic_service.hpp"
#include "type/type.hpp"

namespace inkstone {
class ComicController {
 private:
  ConnectionGuard _guard;
  ComicService    _service;
  std::mutex      _mtx;

  auto            CountWhere(const char* predicate) -> int64_t;

 public:
  explicit ComicController(ConnectionGuard&& guard);

  /**
   * @brief Every stored comic keyed by id, with the fields the sync engine diffs against
   */
  auto GetSnapshot() -> std::unordered_map<comic_id_t, ComicFingerprint>;

  /**
   * @brief INSERT OR REPLACE the comics, one transaction per batch
   *
   * @param comics
   * @param batch_size
   */
  void UpsertComics(const std::vector<Comic>& comics, size_t batch_size);

  /**
   * @brief Delete comics together with their reading progress and bookmarks, all in one
   *        transaction
   *
   * @return size_t number of comic rows removed
   */
  auto DeleteByIds(const std::vector<comic_id_t>& ids) -> size_t;

  auto FetchPending(size_t limit) -> std::vector<Comic>;
  auto CountPending() -> int64_t;
  auto CountAll() -> int64_t;

  /**
   * @brief Write a drained batch of inspection outcomes as one atomic update. Every listed comic
   *        is marked processed.
   */
  void ApplyProcessingResults(const std::vector<ComicProcessingUpdate>& updates);

  // Comics marked processed without a page count are retried by the next full scan
  auto ResetStaleProcessed() -> int64_t;

  auto GetById(const comic_id_t& id) -> std::optional<Comic>;
  auto GetBySeries(series_id_t series_id) -> std::vector<Comic>;
  auto GetAll() -> std::vector<Comic>;

  /**
   * @brief First comics of each series in reading order (volume, chapter, filename)
   *
   * @param per_series
   * @return std::unordered_map<series_id_t, std::vector<comic_id_t>>
   */
  auto GetLeadingComics(size_t per_series) -> std::unordered_map<series_id_t, std::vector<comic_id_t>>;

  void SetThumbnail(const comic_id_t& id, const std::string& ext);

  /**
   * @brief Comics sharing a content hash, grouped, each group ordered by path
   */
  auto GetDuplicateGroups() -> std::vector<std::vector<Comic>>;

  /**
   * @brief Remove every comic, every series and their dependents
   */
  void WipeLibrary();
};
};  // namespace inkstone
