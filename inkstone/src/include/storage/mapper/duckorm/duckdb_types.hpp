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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace duckorm {
enum class DuckDBType : uint8_t {
  INT32,
  INT64,
  UINT32,
  UINT64,
  DOUBLE,
  VARCHAR,
  JSON,
  BOOLEAN,
  TIMESTAMP,
  // Nullable scalars, stored as std::optional<T> in the mapped struct
  OPT_INT64,
  OPT_DOUBLE,
  OPT_BOOLEAN,
};

class PreparedStatement {
 private:
  bool _has_result = false;
  void RecycleResources();
  void DestroyResult();

 public:
  duckdb_result             _result;
  duckdb_prepared_statement _stmt;
  duckdb_connection&        _con;

  bool                      _prepared = false;
  PreparedStatement(duckdb_connection& con);
  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  auto GetStmtGuard(const std::string& prepare_query) -> duckdb_prepared_statement&;

  void BindVarchar(idx_t idx, const std::string& value);
  // nullptr binds NULL
  void BindVarchar(idx_t idx, const std::string* value);
  void BindOptionalVarchar(idx_t idx, const std::optional<std::string>& value);
  void BindInt32(idx_t idx, int32_t value);
  void BindInt64(idx_t idx, int64_t value);
  void BindOptionalInt64(idx_t idx, const std::optional<int64_t>& value);
  void BindDouble(idx_t idx, double value);
  void BindOptionalDouble(idx_t idx, const std::optional<double>& value);
  void BindBool(idx_t idx, bool value);
  void BindOptionalBool(idx_t idx, const std::optional<bool>& value);
  void BindNull(idx_t idx);

  /**
   * @brief Execute with the current bindings. The previous result, if any, is released first so
   *        the same statement can be re-bound and re-executed in a loop.
   */
  void Execute();

  auto RowCount() -> idx_t;
  auto IsNull(idx_t col, idx_t row) -> bool;
  auto GetString(idx_t col, idx_t row) -> std::optional<std::string>;
  auto GetInt64(idx_t col, idx_t row) -> std::optional<int64_t>;
  auto GetDouble(idx_t col, idx_t row) -> std::optional<double>;
  auto GetBool(idx_t col, idx_t row) -> std::optional<bool>;
};

struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
};

#define FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field) }

using VarTypes = std::variant<int32_t, int64_t, uint32_t, uint64_t, double, bool,
                              std::unique_ptr<std::string>, std::optional<int64_t>,
                              std::optional<double>, std::optional<bool>>;
};  // namespace duckorm
