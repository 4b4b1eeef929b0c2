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

#include "storage/service/series/series_service.hpp"

#include <format>
#include <memory>
#include <string>
#include <utility>

#include "library/series_metadata.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace inkstone {
namespace {
auto ToPtr(const std::optional<std::string>& value) -> std::unique_ptr<std::string> {
  return value ? std::make_unique<std::string>(*value) : nullptr;
}

auto FromPtr(std::unique_ptr<std::string>& value) -> std::optional<std::string> {
  if (!value) return std::nullopt;
  return std::move(*value);
}

auto TagsFromPtr(const std::unique_ptr<std::string>& value) -> std::vector<std::string> {
  if (!value) return {};
  return ExtractTags(*value);
}
}  // namespace

auto SeriesService::ToParams(const Series& source) -> SeriesMapperParams {
  return {source.id_,
          std::make_unique<std::string>(source.name_),
          ToPtr(source.title_),
          ToPtr(source.title_english_),
          ToPtr(source.title_japanese_),
          ToPtr(source.synonyms_),
          ToPtr(source.authors_),
          ToPtr(source.synopsis_),
          std::make_unique<std::string>(TagsToJson(source.genres_)),
          std::make_unique<std::string>(TagsToJson(source.tags_)),
          std::make_unique<std::string>(TagsToJson(source.demographics_)),
          ToPtr(source.status_),
          source.total_volumes_,
          source.total_chapters_,
          source.release_year_,
          source.mal_id_,
          source.anilist_id_,
          ToPtr(source.cover_comic_id_),
          ToPtr(source.category_),
          ToPtr(source.subcategory_),
          source.is_adult_,
          source.is_nsfw_,
          source.nsfw_override_};
}

auto SeriesService::FromParams(SeriesMapperParams&& param) -> Series {
  Series series;
  series.id_             = param.id;
  series.name_           = param.name ? std::move(*param.name) : std::string{};
  series.title_          = FromPtr(param.title);
  series.title_english_  = FromPtr(param.title_english);
  series.title_japanese_ = FromPtr(param.title_japanese);
  series.synonyms_       = FromPtr(param.synonyms);
  series.authors_        = FromPtr(param.authors);
  series.synopsis_       = FromPtr(param.synopsis);
  series.genres_         = TagsFromPtr(param.genres);
  series.tags_           = TagsFromPtr(param.tags);
  series.demographics_   = TagsFromPtr(param.demographics);
  series.status_         = FromPtr(param.status);
  series.total_volumes_  = param.total_volumes;
  series.total_chapters_ = param.total_chapters;
  series.release_year_   = param.release_year;
  series.mal_id_         = param.mal_id;
  series.anilist_id_     = param.anilist_id;
  series.cover_comic_id_ = FromPtr(param.cover_comic_id);
  series.category_       = FromPtr(param.category);
  series.subcategory_    = FromPtr(param.subcategory);
  series.is_adult_       = param.is_adult;
  series.is_nsfw_        = param.is_nsfw;
  series.nsfw_override_  = param.nsfw_override;
  return series;
}

auto SeriesService::GetSeriesById(const series_id_t id) -> std::vector<Series> {
  return GetByPredicate(std::format("id={}", id));
}

auto SeriesService::GetSeriesByName(const std::string& name) -> std::vector<Series> {
  return GetByPredicate(std::format("name={}", duckorm::quote(name)));
}

auto SeriesService::GetAllSeries() -> std::vector<Series> {
  return GetByPredicate("true ORDER BY name");
}
};  // namespace inkstone
