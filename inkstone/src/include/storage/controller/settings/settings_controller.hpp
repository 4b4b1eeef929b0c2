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

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "library/admin_setting.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/service/settings/setting_service.hpp"

namespace inkstone {
class SettingsController {
 private:
  ConnectionGuard _guard;
  SettingService  _service;
  std::mutex      _mtx;

 public:
  explicit SettingsController(ConnectionGuard&& guard);

  auto Get(const std::string& key) -> std::optional<std::string>;
  void Set(const std::string& key, const std::string& value);
  auto GetAll() -> std::vector<AdminSetting>;
};
};  // namespace inkstone
