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

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "tags/tag_modification.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Applies admin tag modifications to normalized tags. Merge chains are resolved once on
 *        construction, a chain that runs into a cycle settles on the lexicographically smallest
 *        norm of the cycle.
 *
 */
class TagResolver {
 public:
  TagResolver() = default;
  explicit TagResolver(const std::vector<TagModification>& modifications);

  /**
   * @brief Canonical norm the tag counts as
   *
   * @return std::optional<tag_norm_t> nullopt when the tag or its merge target is blacklisted
   */
  auto Resolve(const tag_norm_t& norm) const -> std::optional<tag_norm_t>;

  auto IsBlacklisted(const tag_norm_t& norm) const -> bool;
  auto DisplayOverride(const tag_norm_t& norm) const -> std::optional<std::string>;

 private:
  auto                                        WalkChain(const tag_norm_t& start) -> tag_norm_t;

  std::unordered_set<tag_norm_t>              blacklist_;
  std::unordered_map<tag_norm_t, std::string> whitelist_;
  std::unordered_map<tag_norm_t, tag_norm_t>  merges_;
  // Final target of every merge source
  std::unordered_map<tag_norm_t, tag_norm_t>  canonical_;
};
};  // namespace inkstone
