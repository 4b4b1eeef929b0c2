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

#include "storage/mapper/settings/setting_mapper.hpp"

#include <stdexcept>

namespace inkstone {
auto SettingMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> SettingMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for AdminSetting");
  }
  auto key   = std::get_if<std::unique_ptr<std::string>>(&data[0]);
  auto value = std::get_if<std::unique_ptr<std::string>>(&data[1]);
  if (key == nullptr || value == nullptr || !*key || !*value) {
    throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
  }
  return {std::move(*key), std::move(*value)};
}
};  // namespace inkstone
