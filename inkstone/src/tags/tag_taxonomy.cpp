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

#include "tags/tag_taxonomy.hpp"

#include <algorithm>
#include <format>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "tags/tag_normalizer.hpp"

namespace inkstone {
TagTaxonomy::TagTaxonomy(MetadataCache& cache, TagModificationController& modifications)
    : cache_(cache), modifications_(modifications) {}

auto TagTaxonomy::QueryByTags(const std::vector<std::string>& selected) -> TagQueryResult {
  auto                    snapshot = cache_.GetOrBuild();

  std::vector<tag_norm_t> wanted;
  bool                    impossible = false;
  for (const auto& raw : selected) {
    auto norm = NormalizeTag(raw);
    if (norm.empty()) continue;
    auto canonical = snapshot->resolver_.Resolve(norm);
    if (!canonical) {
      impossible = true;
      break;
    }
    wanted.push_back(*canonical);
  }

  TagQueryResult result;
  if (impossible) return result;

  std::unordered_map<tag_norm_t, RelatedTag> tally;
  for (const auto& entry : snapshot->series_) {
    bool matches = std::all_of(wanted.begin(), wanted.end(), [&](const tag_norm_t& norm) {
      return std::binary_search(entry.expanded_.begin(), entry.expanded_.end(), norm);
    });
    if (!matches) continue;

    result.series_.push_back(SeriesSummary{entry.id_, entry.name_, entry.display_name_,
                                           entry.cover_comic_id_, entry.total_chapters_,
                                           entry.leading_comics_});
    for (const auto& norm : entry.expanded_) {
      if (std::find(wanted.begin(), wanted.end(), norm) != wanted.end()) continue;
      auto& related = tally[norm];
      if (related.count_ == 0) {
        related.norm_ = norm;
        auto display  = snapshot->vocabulary_.find(norm);
        related.name_ = display != snapshot->vocabulary_.end() ? display->second : norm;
      }
      ++related.count_;
      if (related.covers_.size() < samples_per_tag && entry.cover_comic_id_) {
        related.covers_.push_back(*entry.cover_comic_id_);
      }
      if (related.series_names_.size() < samples_per_tag) {
        related.series_names_.push_back(entry.display_name_);
      }
    }
  }

  result.matching_count_ = static_cast<int64_t>(result.series_.size());
  result.related_tags_.reserve(tally.size());
  for (auto& [norm, related] : tally) result.related_tags_.push_back(std::move(related));
  std::sort(result.related_tags_.begin(), result.related_tags_.end(),
            [](const RelatedTag& lhs, const RelatedTag& rhs) {
              if (lhs.count_ != rhs.count_) return lhs.count_ > rhs.count_;
              if (lhs.name_ != rhs.name_) return lhs.name_ < rhs.name_;
              return lhs.norm_ < rhs.norm_;
            });
  return result;
}

auto TagTaxonomy::RequireNorm(const std::string& tag) const -> tag_norm_t {
  auto norm = NormalizeTag(tag);
  if (norm.empty()) {
    throw std::invalid_argument(
        std::format("[ERROR] TagTaxonomy: '{}' does not contain a usable tag", tag));
  }
  return norm;
}

auto TagTaxonomy::Store(TagModification modification) -> TagModification {
  modifications_.Put(modification);
  cache_.Invalidate();
  std::cout << std::format("[INFO] TagTaxonomy: {} '{}'\n", ActionName(modification.action_),
                           modification.source_);
  return modification;
}

auto TagTaxonomy::Blacklist(const std::string& tag) -> TagModification {
  return Store(TagModification{RequireNorm(tag), inkstone::Blacklist{}});
}

auto TagTaxonomy::Whitelist(const std::string& tag, const std::string& display) -> TagModification {
  auto norm          = RequireNorm(tag);
  auto clean_display = SanitizeDisplay(display);
  auto display_norm  = NormalizeTag(clean_display);
  if (display_norm.empty()) {
    throw std::invalid_argument(
        std::format("[ERROR] TagTaxonomy: Display '{}' does not contain a usable tag", display));
  }
  if (display_norm != norm) {
    // A display naming a merged-away surface form lands on its canonical tag
    auto snapshot = cache_.GetOrBuild();
    auto target   = snapshot->resolver_.Resolve(display_norm);
    if (target && *target != norm && snapshot->vocabulary_.contains(*target)) {
      return Store(TagModification{norm, inkstone::Merge{*target}});
    }
  }
  return Store(TagModification{norm, inkstone::Whitelist{clean_display}});
}

auto TagTaxonomy::Merge(const std::string& source, const std::string& target) -> TagModification {
  auto source_norm = RequireNorm(source);
  auto target_norm = RequireNorm(target);
  if (source_norm == target_norm) {
    throw std::invalid_argument(
        std::format("[ERROR] TagTaxonomy: Cannot merge '{}' into itself", source_norm));
  }
  return Store(TagModification{source_norm, inkstone::Merge{target_norm}});
}

auto TagTaxonomy::RemoveModification(const std::string& tag) -> bool {
  auto norm = NormalizeTag(tag);
  if (norm.empty()) return false;
  bool removed = modifications_.Remove(norm);
  if (removed) cache_.Invalidate();
  return removed;
}

auto TagTaxonomy::ListModifications() -> std::vector<TagModification> {
  return modifications_.GetAll();
}

auto TagTaxonomy::ListVocabulary() -> std::vector<VocabularyEntry> {
  auto                         snapshot = cache_.GetOrBuild();
  std::vector<VocabularyEntry> entries;
  entries.reserve(snapshot->vocabulary_.size());
  for (const auto& [norm, display] : snapshot->vocabulary_) {
    auto count = snapshot->series_counts_.find(norm);
    entries.push_back(VocabularyEntry{
        norm, display, count != snapshot->series_counts_.end() ? count->second : 0});
  }
  std::sort(entries.begin(), entries.end(),
            [](const VocabularyEntry& lhs, const VocabularyEntry& rhs) {
              return lhs.norm_ < rhs.norm_;
            });
  return entries;
}
};  // namespace inkstone
