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
// CREATE TABLE Comic (id VARCHAR PRIMARY KEY, path VARCHAR, filename VARCHAR, series VARCHAR,
// series_id BIGINT, category VARCHAR, subcategory VARCHAR, size_bytes BIGINT, size_str VARCHAR,
// mtime BIGINT, pages BIGINT, processed BOOLEAN, has_thumbnail BOOLEAN, thumbnail_ext VARCHAR,
// file_hash VARCHAR, volume DOUBLE, chapter DOUBLE);
struct ComicMapperParams {
  std::unique_ptr<std::string> id;
  std::unique_ptr<std::string> path;
  std::unique_ptr<std::string> filename;
  std::unique_ptr<std::string> series;
  std::optional<int64_t>       series_id;
  std::unique_ptr<std::string> category;
  std::unique_ptr<std::string> subcategory;
  int64_t                      size_bytes;
  std::unique_ptr<std::string> size_str;
  int64_t                      mtime;
  std::optional<int64_t>       pages;
  bool                         processed;
  bool                         has_thumbnail;
  std::unique_ptr<std::string> thumbnail_ext;
  std::unique_ptr<std::string> file_hash;
  std::optional<double>        volume;
  std::optional<double>        chapter;
};

class ComicMapper : public MapperInterface<ComicMapper, ComicMapperParams, comic_id_t>,
                    public FieldReflectable<ComicMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 17;
  static constexpr const char*                                      _table_name       = "Comic";
  static constexpr const char*                                      _prime_key_clause = "id='{}'";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(ComicMapperParams, id, VARCHAR),
      FIELD(ComicMapperParams, path, VARCHAR),
      FIELD(ComicMapperParams, filename, VARCHAR),
      FIELD(ComicMapperParams, series, VARCHAR),
      FIELD(ComicMapperParams, series_id, OPT_INT64),
      FIELD(ComicMapperParams, category, VARCHAR),
      FIELD(ComicMapperParams, subcategory, VARCHAR),
      FIELD(ComicMapperParams, size_bytes, INT64),
      FIELD(ComicMapperParams, size_str, VARCHAR),
      FIELD(ComicMapperParams, mtime, INT64),
      FIELD(ComicMapperParams, pages, OPT_INT64),
      FIELD(ComicMapperParams, processed, BOOLEAN),
      FIELD(ComicMapperParams, has_thumbnail, BOOLEAN),
      FIELD(ComicMapperParams, thumbnail_ext, VARCHAR),
      FIELD(ComicMapperParams, file_hash, VARCHAR),
      FIELD(ComicMapperParams, volume, OPT_DOUBLE),
      FIELD(ComicMapperParams, chapter, OPT_DOUBLE)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> ComicMapperParams;
  friend struct FieldReflectable<ComicMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace inkstone
