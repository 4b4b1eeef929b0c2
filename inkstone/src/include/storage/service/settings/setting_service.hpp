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

#include <duckdb.h>

#include <optional>
#include <string>
#include <vector>

#include "library/admin_setting.hpp"
#include "storage/mapper/settings/setting_mapper.hpp"
#include "storage/service/service_interface.hpp"

namespace inkstone {
class SettingService : public ServiceInterface<SettingService, AdminSetting, SettingMapperParams,
                                               SettingMapper, std::string> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const AdminSetting& source) -> SettingMapperParams;
  static auto FromParams(SettingMapperParams&& param) -> AdminSetting;

  auto        GetValue(const std::string& key) -> std::optional<std::string>;
  auto        GetAllSettings() -> std::vector<AdminSetting>;
};
};  // namespace inkstone
