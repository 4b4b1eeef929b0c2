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

#include "storage/controller/settings/settings_controller.hpp"

namespace inkstone {
SettingsController::SettingsController(ConnectionGuard&& guard)
    : _guard(std::move(guard)), _service(_guard._conn) {}

auto SettingsController::Get(const std::string& key) -> std::optional<std::string> {
  std::lock_guard<std::mutex> lock(_mtx);
  return _service.GetValue(key);
}

void SettingsController::Set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(_mtx);
  _service.Upsert(AdminSetting{key, value});
}

auto SettingsController::GetAll() -> std::vector<AdminSetting> {
  std::lock_guard<std::mutex> lock(_mtx);
  return _service.GetAllSettings();
}
};  // namespace inkstone
