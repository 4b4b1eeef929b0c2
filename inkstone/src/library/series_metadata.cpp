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

#include "library/series_metadata.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
constexpr int max_unwrap_depth = 8;

auto LooksLikeJsonArray(std::string_view text) -> bool {
  std::string trimmed = conv::Trim(text);
  return trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']';
}

void FlattenInto(const nlohmann::json& value, std::vector<std::string>& out, int depth) {
  if (depth > max_unwrap_depth) return;
  if (value.is_array()) {
    for (const auto& item : value) {
      FlattenInto(item, out, depth + 1);
    }
    return;
  }
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    if (LooksLikeJsonArray(text)) {
      auto nested = nlohmann::json::parse(text, nullptr, false);
      if (!nested.is_discarded()) {
        FlattenInto(nested, out, depth + 1);
        return;
      }
    }
    std::string trimmed = conv::Trim(text);
    if (!trimmed.empty()) out.push_back(std::move(trimmed));
    return;
  }
  if (value.is_number() || value.is_boolean()) {
    out.push_back(value.dump());
  }
}

auto OptString(const nlohmann::json& doc, const char* key) -> std::optional<std::string> {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) return std::nullopt;
  if (it->is_string()) {
    std::string trimmed = conv::Trim(it->get_ref<const std::string&>());
    if (trimmed.empty()) return std::nullopt;
    return trimmed;
  }
  if (it->is_array() || it->is_object()) return it->dump();
  if (it->is_number()) return it->dump();
  return std::nullopt;
}

auto OptInt(const nlohmann::json& doc, const char* key) -> std::optional<int64_t> {
  auto it = doc.find(key);
  if (it == doc.end()) return std::nullopt;
  if (it->is_number_integer()) return it->get<int64_t>();
  if (it->is_number_float()) return static_cast<int64_t>(it->get<double>());
  if (it->is_string()) {
    try {
      size_t      consumed = 0;
      std::string text     = it->get<std::string>();
      int64_t     value    = std::stoll(text, &consumed);
      if (consumed == text.size()) return value;
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

auto OptTags(const nlohmann::json& doc, const char* key)
    -> std::optional<std::vector<std::string>> {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) return std::nullopt;
  std::vector<std::string> tags;
  FlattenInto(*it, tags, 0);
  return tags;
}
}  // namespace

auto SeriesMetadata::SeriesName() const -> std::optional<std::string> {
  if (series_) return series_;
  return title_;
}

auto SeriesMetadata::FromJson(const nlohmann::json& doc) -> SeriesMetadata {
  SeriesMetadata meta;
  if (!doc.is_object()) return meta;
  meta.series_         = OptString(doc, "series");
  meta.title_          = OptString(doc, "title");
  meta.title_english_  = OptString(doc, "title_english");
  meta.title_japanese_ = OptString(doc, "title_japanese");
  meta.synonyms_       = OptString(doc, "synonyms");
  meta.authors_        = OptString(doc, "authors");
  meta.synopsis_       = OptString(doc, "synopsis");
  meta.genres_         = OptTags(doc, "genres");
  meta.tags_           = OptTags(doc, "tags");
  meta.demographics_   = OptTags(doc, "demographics");
  meta.status_         = OptString(doc, "status");
  meta.total_volumes_  = OptInt(doc, "total_volumes");
  meta.total_chapters_ = OptInt(doc, "total_chapters");
  meta.release_year_   = OptInt(doc, "release_year");
  meta.mal_id_         = OptInt(doc, "mal_id");
  meta.anilist_id_     = OptInt(doc, "anilist_id");
  auto adult           = doc.find("is_adult");
  if (adult != doc.end() && adult->is_boolean()) {
    meta.is_adult_ = adult->get<bool>();
  }
  return meta;
}

auto SeriesMetadata::LoadFile(const std::filesystem::path& path) -> SeriesMetadata {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(
        std::format("Failed to open sidecar file {}", conv::PathToBytes(path)));
  }
  auto doc = nlohmann::json::parse(file, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw std::runtime_error(
        std::format("Sidecar file {} is not a JSON object", conv::PathToBytes(path)));
  }
  return FromJson(doc);
}

auto ExtractTags(std::string_view raw) -> std::vector<std::string> {
  std::vector<std::string> tags;
  std::string              trimmed = conv::Trim(raw);
  if (trimmed.empty()) return tags;
  auto doc = nlohmann::json::parse(trimmed, nullptr, false);
  if (doc.is_discarded()) {
    // Not JSON at all, keep the text as one tag
    tags.push_back(std::move(trimmed));
    return tags;
  }
  FlattenInto(doc, tags, 0);
  return tags;
}

auto ExtractTags(const nlohmann::json& value) -> std::vector<std::string> {
  std::vector<std::string> tags;
  FlattenInto(value, tags, 0);
  return tags;
}

auto TagsToJson(const std::vector<std::string>& tags) -> std::string {
  return nlohmann::json(tags).dump();
}
};  // namespace inkstone
