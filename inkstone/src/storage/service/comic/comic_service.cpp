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

#include "storage/service/comic/comic_service.hpp"

#include <format>
#include <memory>
#include <string>
#include <utility>

#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace inkstone {
namespace {
auto ToPtr(const std::string& value) -> std::unique_ptr<std::string> {
  return std::make_unique<std::string>(value);
}

auto ToPtr(const std::optional<std::string>& value) -> std::unique_ptr<std::string> {
  return value ? std::make_unique<std::string>(*value) : nullptr;
}

auto FromPtr(std::unique_ptr<std::string>& value) -> std::optional<std::string> {
  if (!value) return std::nullopt;
  return std::move(*value);
}

auto FromPtrOrEmpty(std::unique_ptr<std::string>& value) -> std::string {
  return value ? std::move(*value) : std::string{};
}
}  // namespace

auto ComicService::ToParams(const Comic& source) -> ComicMapperParams {
  return {ToPtr(source.id_),           ToPtr(source.path_),         ToPtr(source.filename_),
          ToPtr(source.series_),       source.series_id_,           ToPtr(source.category_),
          ToPtr(source.subcategory_),  source.size_bytes_,          ToPtr(source.size_str_),
          source.mtime_,               source.pages_,               source.processed_,
          source.has_thumbnail_,       ToPtr(source.thumbnail_ext_), ToPtr(source.file_hash_),
          source.volume_,              source.chapter_};
}

auto ComicService::FromParams(ComicMapperParams&& param) -> Comic {
  Comic comic;
  comic.id_            = FromPtrOrEmpty(param.id);
  comic.path_          = FromPtrOrEmpty(param.path);
  comic.filename_      = FromPtrOrEmpty(param.filename);
  comic.series_        = FromPtrOrEmpty(param.series);
  comic.series_id_     = param.series_id;
  comic.category_      = FromPtrOrEmpty(param.category);
  comic.subcategory_   = FromPtr(param.subcategory);
  comic.size_bytes_    = param.size_bytes;
  comic.size_str_      = FromPtrOrEmpty(param.size_str);
  comic.mtime_         = param.mtime;
  comic.pages_         = param.pages;
  comic.processed_     = param.processed;
  comic.has_thumbnail_ = param.has_thumbnail;
  comic.thumbnail_ext_ = FromPtr(param.thumbnail_ext);
  comic.file_hash_     = FromPtr(param.file_hash);
  comic.volume_        = param.volume;
  comic.chapter_       = param.chapter;
  return comic;
}

auto ComicService::GetComicById(const comic_id_t& id) -> std::vector<Comic> {
  return GetByPredicate(std::format("id={}", duckorm::quote(id)));
}

auto ComicService::GetComicsBySeries(const series_id_t series_id) -> std::vector<Comic> {
  return GetByPredicate(std::format("series_id={} ORDER BY volume NULLS LAST, chapter NULLS LAST, "
                                    "filename",
                                    series_id));
}

auto ComicService::GetUnprocessed(size_t limit) -> std::vector<Comic> {
  return GetByPredicate(std::format("processed=false ORDER BY path LIMIT {}", limit));
}
};  // namespace inkstone
