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
#include <stdexcept>
#include <string>
#include <vector>

#include "library/series.hpp"
#include "storage/controller/series/series_controller.hpp"
#include "storage/controller/settings/settings_controller.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief NSFW rule configuration that cannot be applied, e.g. a pattern with an unclosed '['
 */
class NsfwRuleError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct NsfwRules {
  // Substrings of the lowercased category
  std::vector<std::string> categories_;
  // Whole lowercased subcategory
  std::vector<std::string> subcategories_;
  // Shell-style globs over normalized tags
  std::vector<std::string> tag_patterns_;

  /**
   * @throws NsfwRuleError on the first malformed pattern
   */
  void        Validate() const;

  static auto Defaults() -> NsfwRules;
};

auto DefaultNsfwTagPatterns() -> const std::vector<std::string>&;

/**
 * @brief Parse a stored rule list: a JSON array, else a comma-separated list. Entries are
 *        trimmed and lowercased, blanks dropped.
 *
 * @param value nullopt when the setting is absent
 * @param fallback used for an absent setting or one that yields no entries
 */
auto ParseRuleList(const std::optional<std::string>& value,
                   const std::vector<std::string>& fallback) -> std::vector<std::string>;

struct NsfwRecomputeStats {
  int64_t total_   = 0;
  int64_t flagged_ = 0;
  int64_t changed_ = 0;
};

class NsfwClassifier {
 public:
  static constexpr const char* categories_key    = "nsfw_categories";
  static constexpr const char* subcategories_key = "nsfw_subcategories";
  static constexpr const char* tag_patterns_key  = "nsfw_tag_patterns";

  NsfwClassifier(SeriesController& series, SettingsController& settings);

  /**
   * @brief First applicable rule wins: manual override, adult flag, category substring,
   *        exact subcategory, tag pattern.
   */
  static auto Classify(const Series& series, const NsfwRules& rules) -> bool;

  /**
   * @throws NsfwRuleError when the stored patterns are malformed
   */
  auto        LoadRules() -> NsfwRules;

  /**
   * @brief Reclassify every series and write the flags that changed in one batch. Idempotent.
   */
  auto        RecomputeAll() -> NsfwRecomputeStats;
  auto        Recompute(series_id_t id) -> bool;

  /**
   * @brief Validate, persist and apply new rules
   *
   * @throws NsfwRuleError and leaves the stored rules untouched when validation fails
   */
  auto        SaveRules(const NsfwRules& rules) -> NsfwRecomputeStats;

  /**
   * @brief Pin (or with nullopt, release) the flag of one series and reclassify it
   *
   * @return bool the resulting is_nsfw
   */
  auto        SetOverride(series_id_t id, std::optional<bool> override_value) -> bool;

 private:
  SeriesController&   series_;
  SettingsController& settings_;
};
};  // namespace inkstone
