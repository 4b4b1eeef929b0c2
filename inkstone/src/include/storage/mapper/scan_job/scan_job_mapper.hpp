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

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace inkstone {
// Rows are created with INSERT ... RETURNING so the timestamps take their column defaults. Progress
// writes name their columns explicitly to leave cancel_requested alone, the mapper only reads.
struct ScanJobMapperParams {
  int64_t                      id;
  std::unique_ptr<std::string> scan_type;
  std::unique_ptr<std::string> status;
  std::unique_ptr<std::string> phase;
  std::unique_ptr<std::string> started_at;
  std::unique_ptr<std::string> completed_at;
  int64_t                      total_comics;
  int64_t                      processed_comics;
  int64_t                      new_comics;
  int64_t                      changed_comics;
  int64_t                      deleted_comics;
  int64_t                      processed_pages;
  int64_t                      page_errors;
  int64_t                      processed_thumbnails;
  int64_t                      thumbnail_errors;
  int64_t                      thumb_bytes_written;
  int64_t                      thumb_bytes_saved;
  std::unique_ptr<std::string> current_file;
  std::unique_ptr<std::string> errors;
  std::unique_ptr<std::string> failure;
  bool                         cancel_requested;
};

class ScanJobMapper : public MapperInterface<ScanJobMapper, ScanJobMapperParams, job_id_t>,
                      public FieldReflectable<ScanJobMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 21;
  static constexpr const char*                                      _table_name       = "ScanJob";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(ScanJobMapperParams, id, INT64),
      FIELD(ScanJobMapperParams, scan_type, VARCHAR),
      FIELD(ScanJobMapperParams, status, VARCHAR),
      FIELD(ScanJobMapperParams, phase, VARCHAR),
      FIELD(ScanJobMapperParams, started_at, TIMESTAMP),
      FIELD(ScanJobMapperParams, completed_at, TIMESTAMP),
      FIELD(ScanJobMapperParams, total_comics, INT64),
      FIELD(ScanJobMapperParams, processed_comics, INT64),
      FIELD(ScanJobMapperParams, new_comics, INT64),
      FIELD(ScanJobMapperParams, changed_comics, INT64),
      FIELD(ScanJobMapperParams, deleted_comics, INT64),
      FIELD(ScanJobMapperParams, processed_pages, INT64),
      FIELD(ScanJobMapperParams, page_errors, INT64),
      FIELD(ScanJobMapperParams, processed_thumbnails, INT64),
      FIELD(ScanJobMapperParams, thumbnail_errors, INT64),
      FIELD(ScanJobMapperParams, thumb_bytes_written, INT64),
      FIELD(ScanJobMapperParams, thumb_bytes_saved, INT64),
      FIELD(ScanJobMapperParams, current_file, VARCHAR),
      FIELD(ScanJobMapperParams, errors, JSON),
      FIELD(ScanJobMapperParams, failure, VARCHAR),
      FIELD(ScanJobMapperParams, cancel_requested, BOOLEAN)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> ScanJobMapperParams;
  friend struct FieldReflectable<ScanJobMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace inkstone
