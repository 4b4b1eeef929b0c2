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
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace inkstone {
// CREATE TABLE TagModification (source_norm VARCHAR PRIMARY KEY, action VARCHAR, target_norm
// VARCHAR, display_name VARCHAR);
struct TagModificationMapperParams {
  std::unique_ptr<std::string> source_norm;
  std::unique_ptr<std::string> action;
  std::unique_ptr<std::string> target_norm;
  std::unique_ptr<std::string> display_name;
};

class TagModificationMapper
    : public MapperInterface<TagModificationMapper, TagModificationMapperParams, tag_norm_t>,
      public FieldReflectable<TagModificationMapper> {
 private:
  static constexpr uint32_t    _field_count      = 4;
  static constexpr const char* _table_name       = "TagModification";
  static constexpr const char* _prime_key_clause = "source_norm='{}'";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      FIELD(TagModificationMapperParams, source_norm, VARCHAR),
      FIELD(TagModificationMapperParams, action, VARCHAR),
      FIELD(TagModificationMapperParams, target_norm, VARCHAR),
      FIELD(TagModificationMapperParams, display_name, VARCHAR)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> TagModificationMapperParams;
  friend struct FieldReflectable<TagModificationMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace inkstone
