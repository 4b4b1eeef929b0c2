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

namespace inkstone {
// CREATE TABLE AdminSetting (key VARCHAR PRIMARY KEY, value VARCHAR NOT NULL);
struct SettingMapperParams {
  std::unique_ptr<std::string> key;
  std::unique_ptr<std::string> value;
};

class SettingMapper : public MapperInterface<SettingMapper, SettingMapperParams, std::string>,
                      public FieldReflectable<SettingMapper> {
 private:
  static constexpr uint32_t                                         _field_count = 2;
  static constexpr const char*                                      _table_name  = "AdminSetting";
  static constexpr const char*                                      _prime_key_clause = "key='{}'";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(SettingMapperParams, key, VARCHAR), FIELD(SettingMapperParams, value, VARCHAR)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> SettingMapperParams;
  friend struct FieldReflectable<SettingMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace inkstone
