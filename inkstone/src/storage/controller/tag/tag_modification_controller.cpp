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

#include "storage/controller/tag/tag_modification_controller.hpp"

#include <format>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace inkstone {
TagModificationController::TagModificationController(ConnectionGuard&& guard)
    : _guard(std::move(guard)), _service(_guard._conn) {}

void TagModificationController::Put(const TagModification& modification) {
  std::lock_guard<std::mutex> lock(_mtx);
  _service.Upsert(modification);
}

auto TagModificationController::Remove(const tag_norm_t& source) -> bool {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(_guard._conn, "DELETE FROM TagModification WHERE source_norm=?;");
  stmt.BindVarchar(1, source);
  stmt.Execute();
  return stmt.GetInt64(0, 0).value_or(0) > 0;
}

auto TagModificationController::GetAll() -> std::vector<TagModification> {
  std::lock_guard<std::mutex> lock(_mtx);
  return _service.GetAllModifications();
}
};  // namespace inkstone
