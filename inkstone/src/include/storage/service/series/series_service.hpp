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

#include <string>
#include <vector>

#include "library/series.hpp"
#include "storage/mapper/series/series_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace inkstone {
class SeriesService : public ServiceInterface<SeriesService, Series, SeriesMapperParams,
                                              SeriesMapper, series_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Series& source) -> SeriesMapperParams;
  static auto FromParams(SeriesMapperParams&& param) -> Series;

  auto        GetSeriesById(const series_id_t id) -> std::vector<Series>;
  auto        GetSeriesByName(const std::string& name) -> std::vector<Series>;
  auto        GetAllSeries() -> std::vector<Series>;
};
};  // namespace inkstone
