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

#include "scanner/thumbnail_encoder.hpp"
#include "storage/controller/settings/settings_controller.hpp"

namespace inkstone {
/**
 * @brief Admin settings consumed by archive inspection, read at the start of every scan and
 *        every on-demand cover request
 *
 */
struct ScanSettings {
  ThumbnailSettings thumbnail_;
  bool              compute_file_hash_ = false;

  /**
   * @brief Read from the AdminSetting table. An unparsable value is logged and replaced by its
   *        default.
   */
  static auto Load(SettingsController& settings) -> ScanSettings;

  /**
   * @throws std::invalid_argument for a non-positive size or a quality outside 1..100
   */
  static void SaveThumbnailSettings(SettingsController& settings, const ThumbnailSettings& thumb);
};
};  // namespace inkstone
