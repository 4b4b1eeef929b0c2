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
#include <string_view>
#include <vector>

#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Strip JSON array wrapping from a stored tag value. "[\"[\\\"Action\\\"]\"]" and
 *        "[\"Action\", \"Drama\"]" both give "Action". Anything that is not an array comes back
 *        unchanged.
 */
auto UnwrapTagScalar(std::string_view raw) -> std::string;

/**
 * @brief Lowercase, fold Latin diacritics to ASCII and split on everything that is not a letter
 *        or digit.
 *
 * @param text UTF-8, ill-formed sequences count as separators
 * @return std::vector<std::string> tokens in text order
 */
auto FoldTokens(std::string_view text) -> std::vector<std::string>;

/**
 * @brief Suffix-rule singular of one folded token. Tokens of three characters or fewer and a
 *        fixed set of words ending in s ("series", "news", ...) are returned unchanged.
 */
auto SingularizeToken(const std::string& token) -> std::string;

/**
 * @brief Lookup key of a tag: unwrapped, folded, tokens joined by single spaces, a trailing lone
 *        "s" token dropped and the last token singularized. Idempotent.
 *
 * @return tag_norm_t empty when nothing alphanumeric is left
 */
auto NormalizeTag(std::string_view raw) -> tag_norm_t;

// Original-case display candidate with whitespace collapsed
auto SanitizeDisplay(std::string_view raw) -> std::string;

auto SplitNorm(const tag_norm_t& norm) -> std::vector<std::string>;
};  // namespace inkstone
