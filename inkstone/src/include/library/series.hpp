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

#include "type/type.hpp"

namespace inkstone {
struct Series {
  series_id_t                id_ = 0;
  std::string                name_;
  std::optional<std::string> title_;
  std::optional<std::string> title_english_;
  std::optional<std::string> title_japanese_;
  // JSON text, kept as the sidecar supplied it
  std::optional<std::string> synonyms_;
  std::optional<std::string> authors_;
  std::optional<std::string> synopsis_;
  std::vector<std::string>   genres_;
  std::vector<std::string>   tags_;
  std::vector<std::string>   demographics_;
  std::optional<std::string> status_;
  std::optional<int64_t>     total_volumes_;
  std::optional<int64_t>     total_chapters_;
  std::optional<int64_t>     release_year_;
  std::optional<int64_t>     mal_id_;
  std::optional<int64_t>     anilist_id_;
  std::optional<std::string> cover_comic_id_;
  std::optional<std::string> category_;
  std::optional<std::string> subcategory_;
  bool                       is_adult_ = false;
  bool                       is_nsfw_  = false;
  std::optional<bool>        nsfw_override_;

  auto DisplayName() const -> const std::string& { return title_ ? *title_ : name_; }

  // Genres, tags and demographics in that order
  auto AllTags() const -> std::vector<std::string> {
    std::vector<std::string> all;
    all.reserve(genres_.size() + tags_.size() + demographics_.size());
    all.insert(all.end(), genres_.begin(), genres_.end());
    all.insert(all.end(), tags_.begin(), tags_.end());
    all.insert(all.end(), demographics_.begin(), demographics_.end());
    return all;
  }
};
};  // namespace inkstone
