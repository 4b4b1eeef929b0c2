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

#include "tags/tag_resolver.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace inkstone {
TagResolver::TagResolver(const std::vector<TagModification>& modifications) {
  for (const auto& modification : modifications) {
    std::visit(
        [&](const auto& action) {
          using T = std::decay_t<decltype(action)>;
          if constexpr (std::is_same_v<T, Blacklist>) {
            blacklist_.insert(modification.source_);
          } else if constexpr (std::is_same_v<T, Whitelist>) {
            whitelist_[modification.source_] = action.display_;
          } else {
            if (action.target_ != modification.source_) {
              merges_[modification.source_] = action.target_;
            }
          }
        },
        modification.action_);
  }
  for (const auto& [source, target] : merges_) {
    if (!canonical_.contains(source)) WalkChain(source);
  }
}

auto TagResolver::WalkChain(const tag_norm_t& start) -> tag_norm_t {
  std::vector<tag_norm_t> path;
  tag_norm_t              current = start;
  tag_norm_t              result;
  while (true) {
    auto known = canonical_.find(current);
    if (known != canonical_.end()) {
      result = known->second;
      break;
    }
    auto seen = std::find(path.begin(), path.end(), current);
    if (seen != path.end()) {
      result = *std::min_element(seen, path.end());
      break;
    }
    auto next = merges_.find(current);
    if (next == merges_.end()) {
      result = current;
      break;
    }
    path.push_back(current);
    current = next->second;
  }
  for (const auto& norm : path) canonical_[norm] = result;
  return result;
}

auto TagResolver::Resolve(const tag_norm_t& norm) const -> std::optional<tag_norm_t> {
  if (norm.empty() || blacklist_.contains(norm)) return std::nullopt;
  auto it = canonical_.find(norm);
  if (it == canonical_.end()) return norm;
  if (blacklist_.contains(it->second)) return std::nullopt;
  return it->second;
}

auto TagResolver::IsBlacklisted(const tag_norm_t& norm) const -> bool {
  return !Resolve(norm).has_value();
}

auto TagResolver::DisplayOverride(const tag_norm_t& norm) const -> std::optional<std::string> {
  auto it = whitelist_.find(norm);
  if (it == whitelist_.end()) return std::nullopt;
  return it->second;
}
};  // namespace inkstone
