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

#include "tags/metadata_cache.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <iostream>
#include <set>

#include "tags/tag_normalizer.hpp"

namespace inkstone {
namespace {
auto StartsUpper(const std::string& text) -> bool {
  return !text.empty() && std::isupper(static_cast<unsigned char>(text.front())) != 0;
}
}  // namespace

auto TagSnapshot::Build(const std::vector<Series>& series,
                        std::vector<TagModification> modifications,
                        const std::unordered_map<series_id_t, std::vector<comic_id_t>>& leading_comics)
    -> TagSnapshot {
  TagSnapshot snapshot;
  snapshot.modifications_ = std::move(modifications);
  snapshot.resolver_      = TagResolver(snapshot.modifications_);
  const auto& resolver    = snapshot.resolver_;

  // Display candidate per surface norm: first seen, upgraded once to a capitalized spelling
  std::unordered_map<tag_norm_t, std::string> candidates;
  std::vector<std::vector<tag_norm_t>>        explicit_norms(series.size());
  for (size_t i = 0; i < series.size(); ++i) {
    for (const auto& raw : series[i].AllTags()) {
      auto norm = NormalizeTag(raw);
      if (norm.empty()) continue;
      auto display          = SanitizeDisplay(raw);
      auto [it, inserted]   = candidates.try_emplace(norm, display);
      if (!inserted && StartsUpper(display) && !StartsUpper(it->second)) it->second = display;
      explicit_norms[i].push_back(std::move(norm));
    }
  }

  std::set<tag_norm_t> surface;
  for (const auto& [norm, display] : candidates) surface.insert(norm);
  for (const auto& norm : surface) {
    auto canonical = resolver.Resolve(norm);
    if (!canonical) continue;
    snapshot.vocabulary_.try_emplace(*canonical, candidates.at(norm));
  }
  for (auto& [canonical, display] : snapshot.vocabulary_) {
    if (auto override_display = resolver.DisplayOverride(canonical)) {
      display = *override_display;
    } else if (auto own = candidates.find(canonical); own != candidates.end()) {
      display = own->second;
    }
  }

  std::vector<tag_norm_t> canonical_norms;
  canonical_norms.reserve(snapshot.vocabulary_.size());
  for (const auto& [norm, display] : snapshot.vocabulary_) canonical_norms.push_back(norm);
  std::sort(canonical_norms.begin(), canonical_norms.end());
  snapshot.containment_ = ComputeContainment(canonical_norms);

  // Text may spell a tag by any of its merged names
  std::set<tag_norm_t> matchable(canonical_norms.begin(), canonical_norms.end());
  for (const auto& norm : surface) {
    if (resolver.Resolve(norm)) matchable.insert(norm);
  }
  snapshot.first_word_index_ =
      BuildFirstWordIndex(std::vector<tag_norm_t>(matchable.begin(), matchable.end()));

  snapshot.series_.reserve(series.size());
  for (size_t i = 0; i < series.size(); ++i) {
    const auto&          row = series[i];
    std::set<tag_norm_t> expanded;
    auto                 add_resolved = [&](const tag_norm_t& norm) {
      if (auto canonical = resolver.Resolve(norm)) expanded.insert(*canonical);
    };
    for (const auto& norm : explicit_norms[i]) add_resolved(norm);
    for (const auto* text : {&row.name_, row.title_ ? &*row.title_ : nullptr,
                             row.synopsis_ ? &*row.synopsis_ : nullptr}) {
      if (text == nullptr) continue;
      for (const auto& norm : MatchFreeText(FoldTokens(*text), snapshot.first_word_index_)) {
        add_resolved(norm);
      }
    }
    std::vector<tag_norm_t> direct(expanded.begin(), expanded.end());
    for (const auto& norm : direct) {
      auto parents = snapshot.containment_.find(norm);
      if (parents == snapshot.containment_.end()) continue;
      expanded.insert(parents->second.begin(), parents->second.end());
    }

    SeriesTagEntry entry;
    entry.id_             = row.id_;
    entry.name_           = row.name_;
    entry.display_name_   = row.DisplayName();
    entry.cover_comic_id_ = row.cover_comic_id_;
    entry.total_chapters_ = row.total_chapters_.value_or(0);
    if (auto leading = leading_comics.find(row.id_); leading != leading_comics.end()) {
      entry.leading_comics_ = leading->second;
    }
    entry.expanded_.assign(expanded.begin(), expanded.end());
    for (const auto& norm : entry.expanded_) ++snapshot.series_counts_[norm];
    snapshot.series_.push_back(std::move(entry));
  }
  return snapshot;
}

MetadataCache::MetadataCache(SeriesController& series, ComicController& comics,
                             TagModificationController& modifications)
    : series_(series), comics_(comics), modifications_(modifications) {}

auto MetadataCache::GetOrBuild() -> std::shared_ptr<const TagSnapshot> {
  std::lock_guard<std::mutex> lock(mtx_);
  if (snapshot_) return snapshot_;

  auto start     = std::chrono::steady_clock::now();
  auto built     = std::make_shared<const TagSnapshot>(TagSnapshot::Build(
      series_.GetAll(), modifications_.GetAll(), comics_.GetLeadingComics(leading_comics_per_series)));
  auto elapsed   = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  snapshot_      = built;
  ++build_count_;
  std::cout << std::format("[INFO] MetadataCache: Built {} tags over {} series in {} ms\n",
                           built->vocabulary_.size(), built->series_.size(), elapsed.count());
  return snapshot_;
}

void MetadataCache::Invalidate() {
  std::lock_guard<std::mutex> lock(mtx_);
  snapshot_.reset();
}

auto MetadataCache::IsBuilt() -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return snapshot_ != nullptr;
}
};  // namespace inkstone
