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

#include "storage/storage_service.hpp"

namespace inkstone {
StorageService::StorageService(const file_path_t& db_path)
    : _db_ctrl(db_path),
      _comic_ctrl(_db_ctrl.GetConnectionGuard()),
      _series_ctrl(_db_ctrl.GetConnectionGuard()),
      _job_ctrl(_db_ctrl.GetConnectionGuard()),
      _tag_ctrl(_db_ctrl.GetConnectionGuard()),
      _settings_ctrl(_db_ctrl.GetConnectionGuard()) {}

auto StorageService::GetDBController() -> DBController& { return _db_ctrl; }

auto StorageService::GetComicController() -> ComicController& { return _comic_ctrl; }

auto StorageService::GetSeriesController() -> SeriesController& { return _series_ctrl; }

auto StorageService::GetScanJobController() -> ScanJobController& { return _job_ctrl; }

auto StorageService::GetTagModificationController() -> TagModificationController& {
  return _tag_ctrl;
}

auto StorageService::GetSettingsController() -> SettingsController& { return _settings_ctrl; }
};  // namespace inkstone
