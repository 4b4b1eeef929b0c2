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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace duckorm {
namespace {
template <typename T>
auto FieldRef(const void* obj, const DuckFieldDesc& field) -> const T& {
  return *reinterpret_cast<const T*>(reinterpret_cast<const char*>(obj) + field.offset);
}

void BindField(PreparedStatement& stmt, idx_t idx, const void* obj, const DuckFieldDesc& field) {
  switch (field.type) {
    case DuckDBType::INT32:
      stmt.BindInt32(idx, FieldRef<int32_t>(obj, field));
      break;
    case DuckDBType::INT64:
      stmt.BindInt64(idx, FieldRef<int64_t>(obj, field));
      break;
    case DuckDBType::UINT32:
      duckdb_bind_uint32(stmt._stmt, idx, FieldRef<uint32_t>(obj, field));
      break;
    case DuckDBType::UINT64:
      duckdb_bind_uint64(stmt._stmt, idx, FieldRef<uint64_t>(obj, field));
      break;
    case DuckDBType::DOUBLE:
      stmt.BindDouble(idx, FieldRef<double>(obj, field));
      break;
    case DuckDBType::TIMESTAMP:
    case DuckDBType::JSON:
    case DuckDBType::VARCHAR:
      stmt.BindVarchar(idx, FieldRef<std::unique_ptr<std::string>>(obj, field).get());
      break;
    case DuckDBType::BOOLEAN:
      stmt.BindBool(idx, FieldRef<bool>(obj, field));
      break;
    case DuckDBType::OPT_INT64:
      stmt.BindOptionalInt64(idx, FieldRef<std::optional<int64_t>>(obj, field));
      break;
    case DuckDBType::OPT_DOUBLE:
      stmt.BindOptionalDouble(idx, FieldRef<std::optional<double>>(obj, field));
      break;
    case DuckDBType::OPT_BOOLEAN:
      stmt.BindOptionalBool(idx, FieldRef<std::optional<bool>>(obj, field));
      break;
    default:
      throw std::runtime_error("Unsupported DuckFieldType in BindField()");
  }
}

auto ReadField(PreparedStatement& stmt, idx_t col, idx_t row, DuckDBType type) -> VarTypes {
  switch (type) {
    case DuckDBType::INT32:
      return static_cast<int32_t>(stmt.GetInt64(col, row).value_or(0));
    case DuckDBType::INT64:
      return stmt.GetInt64(col, row).value_or(0);
    case DuckDBType::UINT32:
      return static_cast<uint32_t>(stmt.GetInt64(col, row).value_or(0));
    case DuckDBType::UINT64:
      return stmt.IsNull(col, row) ? uint64_t{0} : duckdb_value_uint64(&stmt._result, col, row);
    case DuckDBType::DOUBLE:
      return stmt.GetDouble(col, row).value_or(0.0);
    case DuckDBType::BOOLEAN:
      return stmt.GetBool(col, row).value_or(false);
    case DuckDBType::VARCHAR:
    case DuckDBType::JSON:
    case DuckDBType::TIMESTAMP: {
      auto value = stmt.GetString(col, row);
      return value ? std::make_unique<std::string>(std::move(*value))
                   : std::unique_ptr<std::string>{};
    }
    case DuckDBType::OPT_INT64:
      return stmt.GetInt64(col, row);
    case DuckDBType::OPT_DOUBLE:
      return stmt.GetDouble(col, row);
    case DuckDBType::OPT_BOOLEAN:
      return stmt.GetBool(col, row);
    default:
      throw std::runtime_error("Unsupported DuckFieldType in ReadField()");
  }
}

auto ReadRows(PreparedStatement& stmt, std::span<const DuckFieldDesc> sample_fields,
              size_t field_count) -> std::vector<std::vector<VarTypes>> {
  std::vector<std::vector<VarTypes>> results;
  if (duckdb_column_count(&stmt._result) != field_count) {
    throw std::runtime_error("Column count mismatch in select query");
  }
  idx_t row_count = stmt.RowCount();
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].reserve(field_count);
    for (size_t j = 0; j < field_count; ++j) {
      results[i].emplace_back(ReadField(stmt, j, i, sample_fields[j].type));
    }
  }
  return results;
}

auto InsertSql(const char* verb, const char* table, std::span<const DuckFieldDesc> fields,
               size_t field_count) -> std::string {
  std::ostringstream sql;
  sql << verb << " INTO " << table << " (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << fields[i].name;
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << "?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ");";
  return sql.str();
}

auto BindAndRun(duckdb_connection& conn, const std::string& sql, const void* obj,
                std::span<const DuckFieldDesc> fields, size_t field_count) -> duckdb_state {
  PreparedStatement stmt(conn, sql);
  for (size_t i = 0; i < field_count; ++i) {
    BindField(stmt, i + 1, obj, fields[i]);
  }
  stmt.Execute();
  return DuckDBSuccess;
}
}  // namespace

void execute(duckdb_connection& conn, const std::string& sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql.c_str(), &result) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result);
    std::string msg = err ? err : "unknown DuckDB error";
    duckdb_destroy_result(&result);
    throw std::runtime_error(msg);
  }
  duckdb_destroy_result(&result);
}

auto quote(std::string_view value) -> std::string {
  std::string quoted;
  quoted.reserve(value.size() + 2);
  quoted.push_back('\'');
  for (char c : value) {
    if (c == '\'') quoted.push_back('\'');
    quoted.push_back(c);
  }
  quoted.push_back('\'');
  return quoted;
}

duckdb_state insert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count) {
  return BindAndRun(conn, InsertSql("INSERT", table, fields, field_count), obj, fields,
                    field_count);
}

duckdb_state upsert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count) {
  return BindAndRun(conn, InsertSql("INSERT OR REPLACE", table, fields, field_count), obj, fields,
                    field_count);
}

duckdb_state update(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count,
                    const char* where_clause) {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < field_count; ++i) {
    sql << fields[i].name << " = ?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << " WHERE " << where_clause << ";";
  return BindAndRun(conn, sql.str(), obj, fields, field_count);
}

duckdb_state remove(duckdb_connection& conn, const char* table, const char* where_clause) {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";
  PreparedStatement delete_pre(conn, sql.str());
  delete_pre.Execute();
  return DuckDBSuccess;
}

std::vector<std::vector<VarTypes>> select(duckdb_connection& conn, const std::string table,
                                          std::span<const DuckFieldDesc> sample_fields,
                                          size_t field_count, const char* where_clause) {
  std::ostringstream sql;
  sql << "SELECT ";
  for (size_t i = 0; i < field_count; ++i) {
    sql << sample_fields[i].name;
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << " FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement select_pre(conn, sql.str());
  select_pre.Execute();
  return ReadRows(select_pre, sample_fields, field_count);
}

std::vector<std::vector<VarTypes>> select_by_query(duckdb_connection&             conn,
                                                   std::span<const DuckFieldDesc> sample_fields,
                                                   size_t field_count, const std::string& sql) {
  PreparedStatement select_pre(conn, sql);
  select_pre.Execute();
  return ReadRows(select_pre, sample_fields, field_count);
}
};  // namespace duckorm
