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

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace inkstone {
// genres, tags and demographics hold JSON arrays as text
struct SeriesMapperParams {
  int64_t                      id;
  std::unique_ptr<std::string> name;
  std::unique_ptr<std::string> title;
  std::unique_ptr<std::string> title_english;
  std::unique_ptr<std::string> title_japanese;
  std::unique_ptr<std::string> synonyms;
  std::unique_ptr<std::string> authors;
  std::unique_ptr<std::string> synopsis;
  std::unique_ptr<std::string> genres;
  std::unique_ptr<std::string> tags;
  std::unique_ptr<std::string> demographics;
  std::unique_ptr<std::string> status;
  std::optional<int64_t>       total_volumes;
  std::optional<int64_t>       total_chapters;
  std::optional<int64_t>       release_year;
  std::optional<int64_t>       mal_id;
  std::optional<int64_t>       anilist_id;
  std::unique_ptr<std::string> cover_comic_id;
  std::unique_ptr<std::string> category;
  std::unique_ptr<std::string> subcategory;
  bool                         is_adult;
  bool                         is_nsfw;
  std::optional<bool>          nsfw_override;
};

class SeriesMapper : public MapperInterface<SeriesMapper, SeriesMapperParams, series_id_t>,
                     public FieldReflectable<SeriesMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 23;
  static constexpr const char*                                      _table_name       = "Series";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(SeriesMapperParams, id, INT64),
      FIELD(SeriesMapperParams, name, VARCHAR),
      FIELD(SeriesMapperParams, title, VARCHAR),
      FIELD(SeriesMapperParams, title_english, VARCHAR),
      FIELD(SeriesMapperParams, title_japanese, VARCHAR),
      FIELD(SeriesMapperParams, synonyms, VARCHAR),
      FIELD(SeriesMapperParams, authors, VARCHAR),
      FIELD(SeriesMapperParams, synopsis, VARCHAR),
      FIELD(SeriesMapperParams, genres, JSON),
      FIELD(SeriesMapperParams, tags, JSON),
      FIELD(SeriesMapperParams, demographics, JSON),
      FIELD(SeriesMapperParams, status, VARCHAR),
      FIELD(SeriesMapperParams, total_volumes, OPT_INT64),
      FIELD(SeriesMapperParams, total_chapters, OPT_INT64),
      FIELD(SeriesMapperParams, release_year, OPT_INT64),
      FIELD(SeriesMapperParams, mal_id, OPT_INT64),
      FIELD(SeriesMapperParams, anilist_id, OPT_INT64),
      FIELD(SeriesMapperParams, cover_comic_id, VARCHAR),
      FIELD(SeriesMapperParams, category, VARCHAR),
      FIELD(SeriesMapperParams, subcategory, VARCHAR),
      FIELD(SeriesMapperParams, is_adult, BOOLEAN),
      FIELD(SeriesMapperParams, is_nsfw, BOOLEAN),
      FIELD(SeriesMapperParams, nsfw_override, OPT_BOOLEAN)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> SeriesMapperParams;
  friend struct FieldReflectable<SeriesMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace inkstone
