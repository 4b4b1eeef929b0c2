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
#include <utility>
#include <vector>

#include "library/series.hpp"
#include "library/series_metadata.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/service/series/series_service.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Fields the sync engine knows about a series besides its sidecar
 */
struct SeriesPlacement {
  std::string                category_;
  std::optional<std::string> subcategory_;
  std::optional<comic_id_t>  cover_comic_id_;
};

class SeriesController {
 private:
  ConnectionGuard _guard;
  SeriesService   _service;
  std::mutex      _mtx;

  auto            FindIdByName(const std::string& name) -> std::optional<series_id_t>;

 public:
  explicit SeriesController(ConnectionGuard&& guard);

  /**
   * @brief Insert the series, or update it with coalesce semantics: only fields present in the
   *        metadata (or placement) overwrite stored values. An existing cover is kept.
   *
   * @param name unique series name
   * @param metadata sidecar metadata, nullptr when none applies
   * @param placement
   * @return series_id_t
   */
  auto CreateOrUpdate(const std::string& name, const SeriesMetadata* metadata,
                      const SeriesPlacement& placement) -> series_id_t;

  auto GetAll() -> std::vector<Series>;
  auto GetById(series_id_t id) -> std::optional<Series>;
  auto GetByName(const std::string& name) -> std::optional<Series>;

  /**
   * @brief Rename a series. When another series already owns the new name the two are merged:
   *        comics move to the existing series and the renamed one is deleted.
   *
   * @return series_id_t id of the series that carries the new name afterwards
   */
  auto Rename(series_id_t id, const std::string& new_name) -> series_id_t;

  /**
   * @brief Batched is_nsfw write, one transaction
   */
  void SetNsfwFlags(const std::vector<std::pair<series_id_t, bool>>& flags);
  void SetOverride(series_id_t id, std::optional<bool> override_value);
};
};  // namespace inkstone
