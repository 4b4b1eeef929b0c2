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

#include <string>
#include <unordered_map>
#include <vector>

#include "type/type.hpp"

namespace inkstone {
struct TagPhrase {
  tag_norm_t               norm_;
  std::vector<std::string> tokens_;
};

using ContainmentMap = std::unordered_map<tag_norm_t, std::vector<tag_norm_t>>;
using FirstWordIndex = std::unordered_map<std::string, std::vector<TagPhrase>>;

/**
 * @brief Parents of every tag: the shorter tags occurring in it as a whole-word run.
 *        "fantasy" is a parent of "isekai fantasy". Quadratic in the vocabulary size.
 *
 * @param norms distinct normalized tags
 * @return ContainmentMap child -> sorted parents, tags without parents are absent
 */
auto ComputeContainment(const std::vector<tag_norm_t>& norms) -> ContainmentMap;

/**
 * @brief Index tags of at least three characters by their first token
 */
auto BuildFirstWordIndex(const std::vector<tag_norm_t>& norms) -> FirstWordIndex;

/**
 * @brief Known tags occurring in free text on word boundaries. The last word of a phrase also
 *        matches its plural ("video games" finds "video game").
 *
 * @param tokens folded words of the text
 * @param index
 * @return std::vector<tag_norm_t> matched norms, may repeat
 */
auto MatchFreeText(const std::vector<std::string>& tokens, const FirstWordIndex& index)
    -> std::vector<tag_norm_t>;
};  // namespace inkstone
