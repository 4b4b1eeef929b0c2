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

#include <vector>

#include "library/scan_job.hpp"
#include "storage/mapper/scan_job/scan_job_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace inkstone {
class ScanJobService : public ServiceInterface<ScanJobService, ScanJob, ScanJobMapperParams,
                                               ScanJobMapper, job_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto FromParams(ScanJobMapperParams&& param) -> ScanJob;

  auto        GetJobById(const job_id_t id) -> std::vector<ScanJob>;
  auto        GetRunningJobs() -> std::vector<ScanJob>;
  auto        GetRecentJobs(size_t limit) -> std::vector<ScanJob>;
};
};  // namespace inkstone
