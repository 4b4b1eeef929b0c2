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

#include "storage/controller/comic/comic_controller.hpp"

#include <algorithm>
#include <format>
#include <sstream>
#include <string>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace inkstone {
namespace {
constexpr size_t delete_chunk_size = 500;

auto QuotedList(std::vector<comic_id_t>::const_iterator begin,
                std::vector<comic_id_t>::const_iterator end) -> std::string {
  std::ostringstream list;
  for (auto it = begin; it != end; ++it) {
    if (it != begin) list << ", ";
    list << duckorm::quote(*it);
  }
  return list.str();
}
}  // namespace

ComicController::ComicController(ConnectionGuard&& guard)
    : _guard(std::move(guard)), _service(_guard._conn) {}

auto ComicController::CountWhere(const char* predicate) -> int64_t {
  duckorm::PreparedStatement stmt(_guard._conn,
                                  std::format("SELECT COUNT(*) FROM Comic WHERE {};", predicate));
  stmt.Execute();
  return stmt.GetInt64(0, 0).value_or(0);
}

auto ComicController::GetSnapshot() -> std::unordered_map<comic_id_t, ComicFingerprint> {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(_guard._conn, "SELECT id, mtime, size_bytes FROM Comic;");
  stmt.Execute();
  std::unordered_map<comic_id_t, ComicFingerprint> snapshot;
  idx_t                                            rows = stmt.RowCount();
  snapshot.reserve(rows);
  for (idx_t i = 0; i < rows; ++i) {
    auto id = stmt.GetString(0, i);
    if (!id) continue;
    snapshot.emplace(std::move(*id), ComicFingerprint{stmt.GetInt64(1, i).value_or(0),
                                                      stmt.GetInt64(2, i).value_or(0)});
  }
  return snapshot;
}

void ComicController::UpsertComics(const std::vector<Comic>& comics, size_t batch_size) {
  std::lock_guard<std::mutex> lock(_mtx);
  batch_size = std::max<size_t>(batch_size, 1);
  for (size_t start = 0; start < comics.size(); start += batch_size) {
    size_t      end = std::min(start + batch_size, comics.size());
    Transaction tx(_guard._conn);
    for (size_t i = start; i < end; ++i) {
      _service.Upsert(comics[i]);
    }
    tx.Commit();
  }
}

auto ComicController::DeleteByIds(const std::vector<comic_id_t>& ids) -> size_t {
  if (ids.empty()) return 0;
  std::lock_guard<std::mutex> lock(_mtx);
  Transaction                 tx(_guard._conn);
  for (size_t start = 0; start < ids.size(); start += delete_chunk_size) {
    size_t      end  = std::min(start + delete_chunk_size, ids.size());
    std::string list = QuotedList(ids.begin() + start, ids.begin() + end);
    duckorm::execute(_guard._conn,
                     std::format("DELETE FROM ReadingProgress WHERE comic_id IN ({0});"
                                 "DELETE FROM Bookmark WHERE comic_id IN ({0});"
                                 "UPDATE Series SET cover_comic_id=NULL WHERE cover_comic_id IN "
                                 "({0});",
                                 list));
    _service.RemoveByClause(std::format("id IN ({})", list));
  }
  tx.Commit();
  return ids.size();
}

auto ComicController::FetchPending(size_t limit) -> std::vector<Comic> {
  std::lock_guard<std::mutex> lock(_mtx);
  return _service.GetUnprocessed(limit);
}

auto ComicController::CountPending() -> int64_t {
  std::lock_guard<std::mutex> lock(_mtx);
  return CountWhere("processed=false");
}

auto ComicController::CountAll() -> int64_t {
  std::lock_guard<std::mutex> lock(_mtx);
  return CountWhere("true");
}

void ComicController::ApplyProcessingResults(const std::vector<ComicProcessingUpdate>& updates) {
  if (updates.empty()) return;
  std::lock_guard<std::mutex> lock(_mtx);
  Transaction                 tx(_guard._conn);
  duckorm::PreparedStatement  stmt(
      _guard._conn,
      "UPDATE Comic SET pages=?, processed=true, has_thumbnail=?, thumbnail_ext=?, "
       "file_hash=COALESCE(?, file_hash) WHERE id=?;");
  for (const auto& update : updates) {
    stmt.BindInt64(1, update.pages_);
    stmt.BindBool(2, update.has_thumbnail_);
    stmt.BindOptionalVarchar(3, update.thumbnail_ext_);
    stmt.BindOptionalVarchar(4, update.file_hash_);
    stmt.BindVarchar(5, update.id_);
    stmt.Execute();
  }
  tx.Commit();
}

auto ComicController::ResetStaleProcessed() -> int64_t {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(
      _guard._conn,
      "UPDATE Comic SET processed=false WHERE processed=true AND (pages IS NULL OR pages=0);");
  stmt.Execute();
  return stmt.GetInt64(0, 0).value_or(0);
}

auto ComicController::GetById(const comic_id_t& id) -> std::optional<Comic> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        result = _service.GetComicById(id);
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto ComicController::GetBySeries(series_id_t series_id) -> std::vector<Comic> {
  std::lock_guard<std::mutex> lock(_mtx);
  return _service.GetComicsBySeries(series_id);
}

auto ComicController::GetAll() -> std::vector<Comic> {
  std::lock_guard<std::mutex> lock(_mtx);
  return _service.GetByPredicate("true ORDER BY series, volume, chapter, filename");
}

auto ComicController::GetLeadingComics(size_t per_series)
    -> std::unordered_map<series_id_t, std::vector<comic_id_t>> {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(
      _guard._conn,
      std::format("SELECT series_id, id FROM (SELECT series_id, id, ROW_NUMBER() OVER (PARTITION "
                   "BY series_id ORDER BY CASE WHEN volume IS NULL OR volume = 0 THEN 999999 ELSE "
                   "volume END, COALESCE(chapter, 0), filename) AS rn FROM Comic WHERE series_id "
                   "IS NOT NULL) WHERE rn <= {} ORDER BY series_id, rn;",
                   per_series));
  stmt.Execute();
  std::unordered_map<series_id_t, std::vector<comic_id_t>> leading;
  idx_t                                                    rows = stmt.RowCount();
  for (idx_t i = 0; i < rows; ++i) {
    auto series_id = stmt.GetInt64(0, i);
    auto id        = stmt.GetString(1, i);
    if (!series_id || !id) continue;
    leading[*series_id].push_back(std::move(*id));
  }
  return leading;
}

void ComicController::SetThumbnail(const comic_id_t& id, const std::string& ext) {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(_guard._conn,
                                   "UPDATE Comic SET has_thumbnail=true, thumbnail_ext=? WHERE id=?;");
  stmt.BindVarchar(1, ext);
  stmt.BindVarchar(2, id);
  stmt.Execute();
}

auto ComicController::GetDuplicateGroups() -> std::vector<std::vector<Comic>> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        comics = _service.GetByPredicate(
      "file_hash IN (SELECT file_hash FROM Comic WHERE file_hash IS NOT NULL GROUP BY file_hash "
                             "HAVING COUNT(*) > 1) ORDER BY file_hash, path");
  std::vector<std::vector<Comic>> groups;
  for (auto& comic : comics) {
    if (groups.empty() || groups.back().front().file_hash_ != comic.file_hash_) {
      groups.emplace_back();
    }
    groups.back().push_back(std::move(comic));
  }
  return groups;
}

void ComicController::WipeLibrary() {
  std::lock_guard<std::mutex> lock(_mtx);
  Transaction                 tx(_guard._conn);
  duckorm::execute(_guard._conn,
                   "DELETE FROM ReadingProgress; DELETE FROM Bookmark; DELETE FROM Comic; "
                   "DELETE FROM Series;");
  tx.Commit();
}
};  // namespace inkstone
