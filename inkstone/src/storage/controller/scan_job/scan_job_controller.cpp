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

#include "storage/controller/scan_job/scan_job_controller.hpp"

#include <format>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace inkstone {
namespace {
auto BindCounters(duckorm::PreparedStatement& stmt, const ScanJob& job) -> idx_t {
  const auto& c   = job.counters_;
  idx_t       idx = 1;
  stmt.BindVarchar(idx++, std::string(ToString(job.phase_)));
  stmt.BindInt64(idx++, c.total_comics_);
  stmt.BindInt64(idx++, c.processed_comics_);
  stmt.BindInt64(idx++, c.new_comics_);
  stmt.BindInt64(idx++, c.changed_comics_);
  stmt.BindInt64(idx++, c.deleted_comics_);
  stmt.BindInt64(idx++, c.processed_pages_);
  stmt.BindInt64(idx++, c.page_errors_);
  stmt.BindInt64(idx++, c.processed_thumbnails_);
  stmt.BindInt64(idx++, c.thumbnail_errors_);
  stmt.BindInt64(idx++, c.thumb_bytes_written_);
  stmt.BindInt64(idx++, c.thumb_bytes_saved_);
  stmt.BindOptionalVarchar(idx++, job.current_file_);
  stmt.BindVarchar(idx++, nlohmann::json(job.errors_).dump());
  return idx;
}

constexpr const char* progress_columns =
    "phase=?, total_comics=?, processed_comics=?, new_comics=?, changed_comics=?, "
    "deleted_comics=?, processed_pages=?, page_errors=?, processed_thumbnails=?, "
    "thumbnail_errors=?, thumb_bytes_written=?, thumb_bytes_saved=?, current_file=?, errors=?";
}  // namespace

ScanJobController::ScanJobController(ConnectionGuard&& guard)
    : _guard(std::move(guard)), _service(_guard._conn) {}

auto ScanJobController::TryStartJob(ScanType type) -> std::optional<ScanJob> {
  std::lock_guard<std::mutex> lock(_mtx);
  Transaction                 tx(_guard._conn);
  {
    duckorm::PreparedStatement check(_guard._conn,
                                     "SELECT COUNT(*) FROM ScanJob WHERE status='running';");
    check.Execute();
    if (check.GetInt64(0, 0).value_or(0) > 0) {
      tx.Rollback();
      return std::nullopt;
    }
  }
  duckorm::PreparedStatement insert(
      _guard._conn,
      "INSERT INTO ScanJob (scan_type, status, phase) VALUES (?, 'running', 'sync') RETURNING id;");
  insert.BindVarchar(1, std::string(ToString(type)));
  insert.Execute();
  auto id = insert.GetInt64(0, 0);
  if (!id) {
    throw std::runtime_error("[ERROR] ScanJobController: Scan job insert returned no id");
  }
  tx.Commit();

  auto created = _service.GetJobById(*id);
  if (created.empty()) {
    throw std::runtime_error(
        std::format("[ERROR] ScanJobController: Scan job {} vanished after insert", *id));
  }
  return std::move(created.front());
}

void ScanJobController::UpdateProgress(const ScanJob& job) {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(_guard._conn,
                                   std::format("UPDATE ScanJob SET {} WHERE id=?;", progress_columns));
  idx_t                       idx = BindCounters(stmt, job);
  stmt.BindInt64(idx, job.id_);
  stmt.Execute();
}

void ScanJobController::Finish(const ScanJob& job, ScanStatus status) {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(
      _guard._conn,
      std::format("UPDATE ScanJob SET {}, status=?, failure=?, completed_at=current_timestamp "
                   "WHERE id=?;",
                   progress_columns));
  idx_t idx = BindCounters(stmt, job);
  stmt.BindVarchar(idx++, std::string(ToString(status)));
  stmt.BindOptionalVarchar(idx++, job.failure_);
  stmt.BindInt64(idx, job.id_);
  stmt.Execute();
}

auto ScanJobController::RequestCancel() -> bool {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(
      _guard._conn, "UPDATE ScanJob SET cancel_requested=true WHERE status='running';");
  stmt.Execute();
  return stmt.GetInt64(0, 0).value_or(0) > 0;
}

auto ScanJobController::IsCancelRequested(job_id_t id) -> bool {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(_guard._conn,
                                   "SELECT cancel_requested FROM ScanJob WHERE id=?;");
  stmt.BindInt64(1, id);
  stmt.Execute();
  if (stmt.RowCount() == 0) return false;
  return stmt.GetBool(0, 0).value_or(false);
}

auto ScanJobController::GetJob(job_id_t id) -> std::optional<ScanJob> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        result = _service.GetJobById(id);
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto ScanJobController::GetRunning() -> std::optional<ScanJob> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        result = _service.GetRunningJobs();
  if (result.empty()) return std::nullopt;
  return std::move(result.back());
}

auto ScanJobController::GetLatest() -> std::optional<ScanJob> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        result = _service.GetRecentJobs(1);
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto ScanJobController::MarkInterrupted() -> int64_t {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(
      _guard._conn,
      "UPDATE ScanJob SET status='failed', phase='done', failure='interrupted', "
       "completed_at=current_timestamp WHERE status='running';");
  stmt.Execute();
  int64_t marked = stmt.GetInt64(0, 0).value_or(0);
  if (marked > 0) {
    std::cout << std::format("[WARN] ScanJobController: Marked {} interrupted scan job(s) as failed\n",
                             marked);
  }
  return marked;
}
};  // namespace inkstone
