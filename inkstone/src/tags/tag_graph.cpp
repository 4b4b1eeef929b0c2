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

#include "tags/tag_graph.hpp"

#include <algorithm>

#include "tags/tag_normalizer.hpp"

namespace inkstone {
auto ComputeContainment(const std::vector<tag_norm_t>& norms) -> ContainmentMap {
  ContainmentMap containment;
  for (const auto& child : norms) {
    // Single-word tags cannot contain another whole word
    if (child.find(' ') == tag_norm_t::npos) continue;
    std::string padded_child = " " + child + " ";
    for (const auto& parent : norms) {
      if (parent.size() >= child.size()) continue;
      if (padded_child.find(" " + parent + " ") != std::string::npos) {
        containment[child].push_back(parent);
      }
    }
  }
  for (auto& [child, parents] : containment) std::sort(parents.begin(), parents.end());
  return containment;
}

auto BuildFirstWordIndex(const std::vector<tag_norm_t>& norms) -> FirstWordIndex {
  FirstWordIndex index;
  for (const auto& norm : norms) {
    if (norm.size() < 3) continue;
    auto tokens = SplitNorm(norm);
    if (tokens.empty()) continue;
    auto first = tokens.front();
    index[first].push_back(TagPhrase{norm, std::move(tokens)});
  }
  return index;
}

auto MatchFreeText(const std::vector<std::string>& tokens, const FirstWordIndex& index)
    -> std::vector<tag_norm_t> {
  std::vector<tag_norm_t> matches;
  auto                    try_phrases = [&](size_t start, const std::vector<TagPhrase>& phrases) {
    for (const auto& phrase : phrases) {
      size_t length = phrase.tokens_.size();
      if (start + length > tokens.size()) continue;
      bool leading_equal = true;
      for (size_t j = 0; j + 1 < length; ++j) {
        if (tokens[start + j] != phrase.tokens_[j]) {
          leading_equal = false;
          break;
        }
      }
      if (!leading_equal) continue;
      const auto& last = tokens[start + length - 1];
      if (last == phrase.tokens_.back() || SingularizeToken(last) == phrase.tokens_.back()) {
        matches.push_back(phrase.norm_);
      }
    }
  };

  for (size_t i = 0; i < tokens.size(); ++i) {
    auto exact = index.find(tokens[i]);
    if (exact != index.end()) try_phrases(i, exact->second);
    auto singular = SingularizeToken(tokens[i]);
    if (singular != tokens[i]) {
      auto plural_hit = index.find(singular);
      if (plural_hit != index.end()) try_phrases(i, plural_hit->second);
    }
  }
  return matches;
}
};  // namespace inkstone
