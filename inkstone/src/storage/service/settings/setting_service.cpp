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

#include "storage/service/settings/setting_service.hpp"

#include <format>
#include <memory>
#include <utility>

#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace inkstone {
auto SettingService::ToParams(const AdminSetting& source) -> SettingMapperParams {
  return {std::make_unique<std::string>(source.key_),
          std::make_unique<std::string>(source.value_)};
}

auto SettingService::FromParams(SettingMapperParams&& param) -> AdminSetting {
  return {std::move(*param.key), std::move(*param.value)};
}

auto SettingService::GetValue(const std::string& key) -> std::optional<std::string> {
  auto rows = GetByPredicate(std::format("key={}", duckorm::quote(key)));
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front().value_);
}

auto SettingService::GetAllSettings() -> std::vector<AdminSetting> {
  return GetByPredicate("true ORDER BY key");
}
};  // namespace inkstone
