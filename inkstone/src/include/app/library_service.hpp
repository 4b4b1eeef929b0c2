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

#include <memory>
#include <optional>
#include <string>

#include "app/cover_service.hpp"
#include "app/report_service.hpp"
#include "app/scan_service.hpp"
#include "config/library_config.hpp"
#include "nsfw/nsfw_classifier.hpp"
#include "search/search_index.hpp"
#include "storage/storage_service.hpp"
#include "tags/metadata_cache.hpp"
#include "tags/tag_taxonomy.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief One indexed library: the database, its derived caches and the services on top.
 *        Opening it fails jobs an earlier process left running.
 *
 */
class LibraryService {
 private:
  LibraryConfig                   config_;
  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<MetadataCache>  cache_;
  std::shared_ptr<SearchIndex>    search_;
  std::shared_ptr<TagTaxonomy>    taxonomy_;
  std::shared_ptr<NsfwClassifier> nsfw_;
  std::shared_ptr<ReportService>  reports_;
  std::shared_ptr<CoverService>   covers_;
  // Declared last so its background job stops before the services it uses go away
  std::shared_ptr<ScanService>    scans_;

 public:
  LibraryService() = delete;
  explicit LibraryService(LibraryConfig config);

  auto Config() const -> const LibraryConfig& { return config_; }

  auto GetStorage() -> StorageService& { return *storage_; }
  auto GetMetadataCache() -> MetadataCache& { return *cache_; }
  auto GetSearchIndex() -> SearchIndex& { return *search_; }
  auto GetTaxonomy() -> TagTaxonomy& { return *taxonomy_; }
  auto GetNsfwClassifier() -> NsfwClassifier& { return *nsfw_; }
  auto GetReportService() -> ReportService& { return *reports_; }
  auto GetCoverService() -> CoverService& { return *covers_; }
  auto GetScanService() -> ScanService& { return *scans_; }

  /**
   * @brief Rename a series, merging into an existing one on a name clash. Derived tag and search
   *        data are invalidated.
   */
  auto RenameSeries(series_id_t id, const std::string& new_name) -> series_id_t;

  auto Search(const std::string& query, size_t limit = SearchIndex::default_limit)
      -> SearchResult;
};
};  // namespace inkstone
