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

#include <filesystem>

#include "storage/controller/comic/comic_controller.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/controller/scan_job/scan_job_controller.hpp"
#include "storage/controller/series/series_controller.hpp"
#include "storage/controller/settings/settings_controller.hpp"
#include "storage/controller/tag/tag_modification_controller.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Owns the database and one long-lived connection per controller
 *
 */
class StorageService {
 private:
  DBController              _db_ctrl;
  ComicController           _comic_ctrl;
  SeriesController          _series_ctrl;
  ScanJobController         _job_ctrl;
  TagModificationController _tag_ctrl;
  SettingsController        _settings_ctrl;

 public:
  explicit StorageService(const file_path_t& db_path);

  auto GetDBController() -> DBController&;
  auto GetComicController() -> ComicController&;
  auto GetSeriesController() -> SeriesController&;
  auto GetScanJobController() -> ScanJobController&;
  auto GetTagModificationController() -> TagModificationController&;
  auto GetSettingsController() -> SettingsController&;
};
};  // namespace inkstone
