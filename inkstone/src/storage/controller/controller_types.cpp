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

#include "storage/controller/controller_types.hpp"

#include <format>
#include <iostream>
#include <stdexcept>

#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace inkstone {
ConnectionGuard::ConnectionGuard(duckdb_connection conn) : _conn(conn) {}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept : _conn(other._conn) {
  other._conn = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (_conn) duckdb_disconnect(&_conn);
}

Transaction::Transaction(duckdb_connection& conn) : _conn(conn) {
  duckorm::execute(_conn, "BEGIN TRANSACTION;");
}

Transaction::~Transaction() {
  if (_finished) return;
  duckdb_result result;
  if (duckdb_query(_conn, "ROLLBACK;", &result) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result);
    std::cerr << std::format("[WARN] Transaction: Rollback failed: {}\n", err ? err : "unknown");
  }
  duckdb_destroy_result(&result);
}

void Transaction::Commit() {
  if (_finished) {
    throw std::runtime_error("[ERROR] Transaction: Commit on a finished transaction");
  }
  _finished = true;
  duckorm::execute(_conn, "COMMIT;");
}

void Transaction::Rollback() {
  if (_finished) return;
  _finished = true;
  duckorm::execute(_conn, "ROLLBACK;");
}
};  // namespace inkstone
