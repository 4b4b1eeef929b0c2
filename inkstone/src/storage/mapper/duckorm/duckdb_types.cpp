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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <stdexcept>

namespace duckorm {
void PreparedStatement::DestroyResult() {
  if (_has_result) {
    duckdb_destroy_result(&_result);
    _has_result = false;
  }
}

void PreparedStatement::RecycleResources() {
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
    _stmt = nullptr;
  }
  DestroyResult();
}

PreparedStatement::PreparedStatement(duckdb_connection& con) : _stmt(nullptr), _con(con) {
  std::memset(&_result, 0, sizeof(_result));
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : _stmt(nullptr), _con(con) {
  std::memset(&_result, 0, sizeof(_result));
  GetStmtGuard(prepare_query);
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

auto PreparedStatement::GetStmtGuard(const std::string& prepare_query)
    -> duckdb_prepared_statement& {
  RecycleResources();
  if (duckdb_prepare(_con, prepare_query.c_str(), &_stmt) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(_stmt);
    std::string msg = "PreparedStatement failed to prepare";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw std::runtime_error(msg);
  }
  _prepared = true;
  return _stmt;
}

void PreparedStatement::BindVarchar(idx_t idx, const std::string& value) {
  duckdb_bind_varchar_length(_stmt, idx, value.data(), value.size());
}

void PreparedStatement::BindVarchar(idx_t idx, const std::string* value) {
  if (value == nullptr) {
    duckdb_bind_null(_stmt, idx);
    return;
  }
  BindVarchar(idx, *value);
}

void PreparedStatement::BindOptionalVarchar(idx_t idx, const std::optional<std::string>& value) {
  BindVarchar(idx, value ? &*value : nullptr);
}

void PreparedStatement::BindInt32(idx_t idx, int32_t value) {
  duckdb_bind_int32(_stmt, idx, value);
}

void PreparedStatement::BindInt64(idx_t idx, int64_t value) {
  duckdb_bind_int64(_stmt, idx, value);
}

void PreparedStatement::BindOptionalInt64(idx_t idx, const std::optional<int64_t>& value) {
  if (value) {
    duckdb_bind_int64(_stmt, idx, *value);
  } else {
    duckdb_bind_null(_stmt, idx);
  }
}

void PreparedStatement::BindDouble(idx_t idx, double value) {
  duckdb_bind_double(_stmt, idx, value);
}

void PreparedStatement::BindOptionalDouble(idx_t idx, const std::optional<double>& value) {
  if (value) {
    duckdb_bind_double(_stmt, idx, *value);
  } else {
    duckdb_bind_null(_stmt, idx);
  }
}

void PreparedStatement::BindBool(idx_t idx, bool value) { duckdb_bind_boolean(_stmt, idx, value); }

void PreparedStatement::BindOptionalBool(idx_t idx, const std::optional<bool>& value) {
  if (value) {
    duckdb_bind_boolean(_stmt, idx, *value);
  } else {
    duckdb_bind_null(_stmt, idx);
  }
}

void PreparedStatement::BindNull(idx_t idx) { duckdb_bind_null(_stmt, idx); }

void PreparedStatement::Execute() {
  if (!_prepared) {
    throw std::runtime_error("PreparedStatement executed before being prepared");
  }
  DestroyResult();
  duckdb_state state = duckdb_execute_prepared(_stmt, &_result);
  _has_result        = true;
  if (state != DuckDBSuccess) {
    const char* err = duckdb_result_error(&_result);
    std::string msg = err ? err : "unknown DuckDB error";
    DestroyResult();
    throw std::runtime_error(msg);
  }
}

auto PreparedStatement::RowCount() -> idx_t {
  return _has_result ? duckdb_row_count(&_result) : 0;
}

auto PreparedStatement::IsNull(idx_t col, idx_t row) -> bool {
  return duckdb_value_is_null(&_result, col, row);
}

auto PreparedStatement::GetString(idx_t col, idx_t row) -> std::optional<std::string> {
  if (IsNull(col, row)) return std::nullopt;
  char* raw = duckdb_value_varchar(&_result, col, row);
  if (raw == nullptr) return std::nullopt;
  std::string value(raw);
  duckdb_free(raw);
  return value;
}

auto PreparedStatement::GetInt64(idx_t col, idx_t row) -> std::optional<int64_t> {
  if (IsNull(col, row)) return std::nullopt;
  return duckdb_value_int64(&_result, col, row);
}

auto PreparedStatement::GetDouble(idx_t col, idx_t row) -> std::optional<double> {
  if (IsNull(col, row)) return std::nullopt;
  return duckdb_value_double(&_result, col, row);
}

auto PreparedStatement::GetBool(idx_t col, idx_t row) -> std::optional<bool> {
  if (IsNull(col, row)) return std::nullopt;
  return duckdb_value_boolean(&_result, col, row);
}
}  // namespace duckorm
