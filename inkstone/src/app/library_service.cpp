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

#include "app/library_service.hpp"

#include <format>
#include <iostream>

#include "utils/string/convert.hpp"

namespace inkstone {
LibraryService::LibraryService(LibraryConfig config) : config_(std::move(config)) {
  storage_  = std::make_shared<StorageService>(config_.db_path_);
  cache_    = std::make_shared<MetadataCache>(storage_->GetSeriesController(),
                                           storage_->GetComicController(),
                                           storage_->GetTagModificationController());
  search_   = std::make_shared<SearchIndex>(storage_->GetDBController().GetConnectionGuard());
  taxonomy_ = std::make_shared<TagTaxonomy>(*cache_, storage_->GetTagModificationController());
  nsfw_     = std::make_shared<NsfwClassifier>(storage_->GetSeriesController(),
                                           storage_->GetSettingsController());
  reports_  = std::make_shared<ReportService>(storage_);
  covers_   = std::make_shared<CoverService>(storage_, config_.ThumbnailDir(),
                                           config_.cover_timeout_);
  scans_    = std::make_shared<ScanService>(storage_, cache_, search_, nsfw_, config_);

  scans_->RecoverInterrupted();
  std::cout << std::format("[INFO] LibraryService: Opened {} with {} root(s)\n",
                           conv::PathToBytes(config_.db_path_), config_.roots_.size());
}

auto LibraryService::RenameSeries(series_id_t id, const std::string& new_name) -> series_id_t {
  auto survivor = storage_->GetSeriesController().Rename(id, new_name);
  cache_->Invalidate();
  search_->MarkDirty();
  return survivor;
}

auto LibraryService::Search(const std::string& query, size_t limit) -> SearchResult {
  return search_->Search(query, limit);
}
};  // namespace inkstone
