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
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "library/series.hpp"
#include "storage/controller/comic/comic_controller.hpp"
#include "storage/controller/series/series_controller.hpp"
#include "storage/controller/tag/tag_modification_controller.hpp"
#include "tags/tag_graph.hpp"
#include "tags/tag_modification.hpp"
#include "tags/tag_resolver.hpp"
#include "type/type.hpp"

namespace inkstone {
struct SeriesTagEntry {
  series_id_t                id_ = 0;
  std::string                name_;
  std::string                display_name_;
  std::optional<comic_id_t>  cover_comic_id_;
  int64_t                    total_chapters_ = 0;
  std::vector<comic_id_t>    leading_comics_;
  // Canonical norms: explicit tags, tags found in the text, one level of parents. Sorted.
  std::vector<tag_norm_t>    expanded_;
};

/**
 * @brief Immutable tag data derived from all series and modifications
 *
 */
struct TagSnapshot {
  // Canonical norm -> display string
  std::unordered_map<tag_norm_t, std::string> vocabulary_;
  ContainmentMap                              containment_;
  FirstWordIndex                              first_word_index_;
  std::vector<TagModification>                modifications_;
  TagResolver                                 resolver_;
  std::unordered_map<tag_norm_t, int64_t>     series_counts_;
  // Ordered by series name
  std::vector<SeriesTagEntry>                 series_;

  /**
   * @brief Derive everything from committed rows
   *
   * @param series
   * @param modifications
   * @param leading_comics first comics of each series, in reading order
   */
  static auto Build(const std::vector<Series>& series, std::vector<TagModification> modifications,
                    const std::unordered_map<series_id_t, std::vector<comic_id_t>>& leading_comics)
      -> TagSnapshot;
};

/**
 * @brief Lazily built, explicitly invalidated holder of the TagSnapshot. There is no expiry:
 *        every write that changes series tags or modifications must call Invalidate().
 *
 */
class MetadataCache {
 public:
  static constexpr size_t leading_comics_per_series = 3;

  MetadataCache(SeriesController& series, ComicController& comics,
                TagModificationController& modifications);

  /**
   * @brief Current snapshot, built first when the cache is empty. Readers keep a built snapshot
   *        alive after a later invalidation.
   */
  auto GetOrBuild() -> std::shared_ptr<const TagSnapshot>;
  void Invalidate();
  auto IsBuilt() -> bool;
  auto BuildCount() const -> int64_t { return build_count_.load(); }

 private:
  SeriesController&                  series_;
  ComicController&                   comics_;
  TagModificationController&         modifications_;

  std::mutex                         mtx_;
  std::shared_ptr<const TagSnapshot> snapshot_;
  std::atomic<int64_t>               build_count_{0};
};
};  // namespace inkstone
