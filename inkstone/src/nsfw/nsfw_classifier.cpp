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

#include "nsfw/nsfw_classifier.hpp"

#include <format>
#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

#include "tags/tag_normalizer.hpp"
#include "utils/string/convert.hpp"
#include "utils/string/glob_match.hpp"

namespace inkstone {
namespace {
auto CleanEntry(const std::string& entry) -> std::string {
  return conv::ToLowerAscii(conv::Trim(entry));
}

auto ToJsonList(const std::vector<std::string>& entries) -> std::string {
  return nlohmann::json(entries).dump();
}

// Normalized form plus the plain folded form, so plural patterns still match
auto TagForms(const std::string& raw) -> std::vector<std::string> {
  std::vector<std::string> forms;
  auto                     norm = NormalizeTag(raw);
  if (norm.empty()) return forms;
  forms.push_back(norm);
  std::string folded;
  for (const auto& token : FoldTokens(UnwrapTagScalar(raw))) {
    if (!folded.empty()) folded.push_back(' ');
    folded.append(token);
  }
  if (folded != norm) forms.push_back(std::move(folded));
  return forms;
}
}  // namespace

auto DefaultNsfwTagPatterns() -> const std::vector<std::string>& {
  static const std::vector<std::string> defaults = {
      "adultery",     "*breast*",     "futanari",   "lactation",  "pet play",
      "scissoring",   "voyeur",       "sexual*",    "sexless",    "yaoi",
      "yuri",         "vore",         "armpits",    "hypersexuality", "human pet",
      "*chest",       "ero guro",     "eroge",      "rimjob",     "deepthroat",
      "masochism",    "facial",       "anal*",      "oral*",      "boob*",
      "group sex",    "cheating",     "threesome",  "smut",       "* sex",
      "sex *",        "* sex *",      "prostitution", "whore",    "incest",
      "fetish",       "defloration",  "femboy",     "virginity",  "omegaverse",
      "torture",      "masturb*",     "handjob",    "cunnilingus", "femdom",
      "milf",         "fellatio",     "* breasts",  "rape",       "slavery",
      "ecchi",        "erotica"};
  return defaults;
}

void NsfwRules::Validate() const {
  for (const auto& pattern : tag_patterns_) {
    if (!IsValidGlob(pattern)) {
      throw NsfwRuleError(
          std::format("[ERROR] NsfwClassifier: Malformed tag pattern '{}'", pattern));
    }
  }
}

auto NsfwRules::Defaults() -> NsfwRules { return NsfwRules{{}, {}, DefaultNsfwTagPatterns()}; }

auto ParseRuleList(const std::optional<std::string>& value,
                   const std::vector<std::string>& fallback) -> std::vector<std::string> {
  if (!value) return fallback;
  std::vector<std::string> entries;
  auto                     parsed = nlohmann::json::parse(*value, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_array()) {
    for (const auto& item : parsed) {
      auto entry = CleanEntry(item.is_string() ? item.get<std::string>() : item.dump());
      if (!entry.empty()) entries.push_back(std::move(entry));
    }
    return entries;
  }
  size_t start = 0;
  while (start <= value->size()) {
    auto end = value->find(',', start);
    if (end == std::string::npos) end = value->size();
    auto entry = CleanEntry(value->substr(start, end - start));
    if (!entry.empty()) entries.push_back(std::move(entry));
    start = end + 1;
  }
  return entries.empty() ? fallback : entries;
}

NsfwClassifier::NsfwClassifier(SeriesController& series, SettingsController& settings)
    : series_(series), settings_(settings) {}

auto NsfwClassifier::Classify(const Series& series, const NsfwRules& rules) -> bool {
  if (series.nsfw_override_) return *series.nsfw_override_;
  if (series.is_adult_) return true;

  if (series.category_) {
    auto category = CleanEntry(*series.category_);
    if (!category.empty()) {
      for (const auto& entry : rules.categories_) {
        if (!entry.empty() && category.find(entry) != std::string::npos) return true;
      }
    }
  }
  if (series.subcategory_) {
    auto subcategory = CleanEntry(*series.subcategory_);
    if (!subcategory.empty()) {
      for (const auto& entry : rules.subcategories_) {
        if (entry == subcategory) return true;
      }
    }
  }
  if (rules.tag_patterns_.empty()) return false;
  for (const auto& raw : series.AllTags()) {
    for (const auto& form : TagForms(raw)) {
      for (const auto& pattern : rules.tag_patterns_) {
        if (GlobMatch(pattern, form)) return true;
      }
    }
  }
  return false;
}

auto NsfwClassifier::LoadRules() -> NsfwRules {
  NsfwRules rules;
  rules.categories_    = ParseRuleList(settings_.Get(categories_key), {});
  rules.subcategories_ = ParseRuleList(settings_.Get(subcategories_key), {});
  rules.tag_patterns_  = ParseRuleList(settings_.Get(tag_patterns_key), DefaultNsfwTagPatterns());
  rules.Validate();
  return rules;
}

auto NsfwClassifier::RecomputeAll() -> NsfwRecomputeStats {
  auto                                      rules = LoadRules();
  NsfwRecomputeStats                        stats;
  std::vector<std::pair<series_id_t, bool>> changed;
  for (const auto& series : series_.GetAll()) {
    bool is_nsfw = Classify(series, rules);
    ++stats.total_;
    if (is_nsfw) ++stats.flagged_;
    if (is_nsfw != series.is_nsfw_) changed.emplace_back(series.id_, is_nsfw);
  }
  series_.SetNsfwFlags(changed);
  stats.changed_ = static_cast<int64_t>(changed.size());
  std::cout << std::format("[INFO] NsfwClassifier: Recomputed {} series ({} flagged, {} changed)\n",
                           stats.total_, stats.flagged_, stats.changed_);
  return stats;
}

auto NsfwClassifier::Recompute(series_id_t id) -> bool {
  auto series = series_.GetById(id);
  if (!series) {
    throw std::invalid_argument(
        std::format("[ERROR] NsfwClassifier: Series {} does not exist", id));
  }
  bool is_nsfw = Classify(*series, LoadRules());
  if (is_nsfw != series->is_nsfw_) series_.SetNsfwFlags({{id, is_nsfw}});
  return is_nsfw;
}

auto NsfwClassifier::SaveRules(const NsfwRules& rules) -> NsfwRecomputeStats {
  NsfwRules cleaned;
  for (const auto& entry : rules.categories_) {
    if (auto clean = CleanEntry(entry); !clean.empty()) cleaned.categories_.push_back(clean);
  }
  for (const auto& entry : rules.subcategories_) {
    if (auto clean = CleanEntry(entry); !clean.empty()) cleaned.subcategories_.push_back(clean);
  }
  for (const auto& entry : rules.tag_patterns_) {
    if (auto clean = CleanEntry(entry); !clean.empty()) cleaned.tag_patterns_.push_back(clean);
  }
  cleaned.Validate();

  settings_.Set(categories_key, ToJsonList(cleaned.categories_));
  settings_.Set(subcategories_key, ToJsonList(cleaned.subcategories_));
  settings_.Set(tag_patterns_key, ToJsonList(cleaned.tag_patterns_));
  return RecomputeAll();
}

auto NsfwClassifier::SetOverride(series_id_t id, std::optional<bool> override_value) -> bool {
  if (!series_.GetById(id)) {
    throw std::invalid_argument(
        std::format("[ERROR] NsfwClassifier: Series {} does not exist", id));
  }
  series_.SetOverride(id, override_value);
  return Recompute(id);
}
};  // namespace inkstone
