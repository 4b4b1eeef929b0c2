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
#include <vector>

#include "storage/controller/tag/tag_modification_controller.hpp"
#include "tags/metadata_cache.hpp"
#include "tags/tag_modification.hpp"
#include "type/type.hpp"

namespace inkstone {
struct RelatedTag {
  tag_norm_t               norm_;
  std::string              name_;
  int64_t                  count_ = 0;
  std::vector<comic_id_t>  covers_;
  std::vector<std::string> series_names_;
};

struct SeriesSummary {
  series_id_t               id_ = 0;
  std::string               name_;
  std::string               display_name_;
  std::optional<comic_id_t> cover_comic_id_;
  int64_t                   total_chapters_ = 0;
  std::vector<comic_id_t>   comics_;
};

struct TagQueryResult {
  int64_t                    matching_count_ = 0;
  // Count descending, then name
  std::vector<RelatedTag>    related_tags_;
  std::vector<SeriesSummary> series_;
};

struct VocabularyEntry {
  tag_norm_t  norm_;
  std::string display_;
  int64_t     series_count_ = 0;
};

/**
 * @brief Faceted tag queries over the cached snapshot, and the admin commands that edit tag
 *        modifications. Every command invalidates the cache.
 *
 */
class TagTaxonomy {
 public:
  static constexpr size_t samples_per_tag = 3;

  TagTaxonomy(MetadataCache& cache, TagModificationController& modifications);

  /**
   * @brief Series carrying every selected tag, and the other tags found on them
   *
   * @param selected raw tag strings, normalized and resolved here. A blacklisted selection
   *        matches nothing.
   * @return TagQueryResult
   */
  auto QueryByTags(const std::vector<std::string>& selected) -> TagQueryResult;

  auto Blacklist(const std::string& tag) -> TagModification;

  /**
   * @brief Pin the display string of a tag. When the display normalizes to another existing tag
   *        the tag is merged into that one instead.
   *
   * @return TagModification what was stored
   */
  auto Whitelist(const std::string& tag, const std::string& display) -> TagModification;

  /**
   * @throws std::invalid_argument when source and target normalize to the same tag
   */
  auto Merge(const std::string& source, const std::string& target) -> TagModification;

  auto RemoveModification(const std::string& tag) -> bool;
  auto ListModifications() -> std::vector<TagModification>;

  // Sorted by norm
  auto ListVocabulary() -> std::vector<VocabularyEntry>;

 private:
  auto                       RequireNorm(const std::string& tag) const -> tag_norm_t;
  auto                       Store(TagModification modification) -> TagModification;

  MetadataCache&             cache_;
  TagModificationController& modifications_;
};
};  // namespace inkstone
