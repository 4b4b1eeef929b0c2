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

#include "storage/controller/series/series_controller.hpp"

#include <format>
#include <iostream>
#include <stdexcept>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace inkstone {
namespace {
auto OptTagsJson(const std::optional<std::vector<std::string>>& tags)
    -> std::optional<std::string> {
  if (!tags) return std::nullopt;
  return TagsToJson(*tags);
}

// Binds the sidecar columns in the order used by both statements below, starting at first_idx
auto BindMetadata(duckorm::PreparedStatement& stmt, idx_t first_idx, const SeriesMetadata& meta)
    -> idx_t {
  idx_t idx = first_idx;
  stmt.BindOptionalVarchar(idx++, meta.title_);
  stmt.BindOptionalVarchar(idx++, meta.title_english_);
  stmt.BindOptionalVarchar(idx++, meta.title_japanese_);
  stmt.BindOptionalVarchar(idx++, meta.synonyms_);
  stmt.BindOptionalVarchar(idx++, meta.authors_);
  stmt.BindOptionalVarchar(idx++, meta.synopsis_);
  stmt.BindOptionalVarchar(idx++, OptTagsJson(meta.genres_));
  stmt.BindOptionalVarchar(idx++, OptTagsJson(meta.tags_));
  stmt.BindOptionalVarchar(idx++, OptTagsJson(meta.demographics_));
  stmt.BindOptionalVarchar(idx++, meta.status_);
  stmt.BindOptionalInt64(idx++, meta.total_volumes_);
  stmt.BindOptionalInt64(idx++, meta.total_chapters_);
  stmt.BindOptionalInt64(idx++, meta.release_year_);
  stmt.BindOptionalInt64(idx++, meta.mal_id_);
  stmt.BindOptionalInt64(idx++, meta.anilist_id_);
  stmt.BindOptionalBool(idx++, meta.is_adult_);
  return idx;
}

auto BindPlacement(duckorm::PreparedStatement& stmt, idx_t idx, const SeriesPlacement& placement)
    -> idx_t {
  stmt.BindOptionalVarchar(idx++, placement.cover_comic_id_);
  stmt.BindVarchar(idx++, placement.category_);
  stmt.BindOptionalVarchar(idx++, placement.subcategory_);
  return idx;
}

constexpr const char* update_query =
    "UPDATE Series SET title=COALESCE(?, title), title_english=COALESCE(?, title_english), "
    "title_japanese=COALESCE(?, title_japanese), synonyms=COALESCE(?, synonyms), "
    "authors=COALESCE(?, authors), synopsis=COALESCE(?, synopsis), genres=COALESCE(?, genres), "
    "tags=COALESCE(?, tags), demographics=COALESCE(?, demographics), status=COALESCE(?, status), "
    "total_volumes=COALESCE(?, total_volumes), total_chapters=COALESCE(?, total_chapters), "
    "release_year=COALESCE(?, release_year), mal_id=COALESCE(?, mal_id), "
    "anilist_id=COALESCE(?, anilist_id), is_adult=COALESCE(?, is_adult), "
    "cover_comic_id=COALESCE(cover_comic_id, ?), category=COALESCE(?, category), "
    "subcategory=COALESCE(?, subcategory) WHERE id=?;";

constexpr const char* insert_query =
    "INSERT INTO Series (title, title_english, title_japanese, synonyms, authors, synopsis, "
    "genres, tags, demographics, status, total_volumes, total_chapters, release_year, mal_id, "
    "anilist_id, is_adult, cover_comic_id, category, subcategory, name) VALUES (?, ?, ?, ?, ?, ?, "
    "COALESCE(?, '[]'), COALESCE(?, '[]'), COALESCE(?, '[]'), ?, ?, ?, ?, ?, ?, COALESCE(?, "
    "false), ?, ?, ?, ?) RETURNING id;";
}  // namespace

SeriesController::SeriesController(ConnectionGuard&& guard)
    : _guard(std::move(guard)), _service(_guard._conn) {}

auto SeriesController::FindIdByName(const std::string& name) -> std::optional<series_id_t> {
  duckorm::PreparedStatement stmt(_guard._conn, "SELECT id FROM Series WHERE name=?;");
  stmt.BindVarchar(1, name);
  stmt.Execute();
  if (stmt.RowCount() == 0) return std::nullopt;
  return stmt.GetInt64(0, 0);
}

auto SeriesController::CreateOrUpdate(const std::string& name, const SeriesMetadata* metadata,
                                      const SeriesPlacement& placement) -> series_id_t {
  std::lock_guard<std::mutex> lock(_mtx);
  const SeriesMetadata        empty_meta{};
  const SeriesMetadata&       meta     = metadata ? *metadata : empty_meta;

  auto                        existing = FindIdByName(name);
  if (existing) {
    duckorm::PreparedStatement stmt(_guard._conn, update_query);
    idx_t                      idx = BindMetadata(stmt, 1, meta);
    idx                            = BindPlacement(stmt, idx, placement);
    stmt.BindInt64(idx, *existing);
    stmt.Execute();
    return *existing;
  }

  duckorm::PreparedStatement stmt(_guard._conn, insert_query);
  idx_t                      idx = BindMetadata(stmt, 1, meta);
  idx                            = BindPlacement(stmt, idx, placement);
  stmt.BindVarchar(idx, name);
  stmt.Execute();
  auto id = stmt.GetInt64(0, 0);
  if (!id) {
    throw std::runtime_error(
        std::format("[ERROR] SeriesController: Insert of series '{}' returned no id", name));
  }
  return *id;
}

auto SeriesController::GetAll() -> std::vector<Series> {
  std::lock_guard<std::mutex> lock(_mtx);
  return _service.GetAllSeries();
}

auto SeriesController::GetById(series_id_t id) -> std::optional<Series> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        result = _service.GetSeriesById(id);
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto SeriesController::GetByName(const std::string& name) -> std::optional<Series> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        result = _service.GetSeriesByName(name);
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto SeriesController::Rename(series_id_t id, const std::string& new_name) -> series_id_t {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_service.GetSeriesById(id).empty()) {
    throw std::invalid_argument(
        std::format("[ERROR] SeriesController: Series {} does not exist", id));
  }
  auto        collision = FindIdByName(new_name);
  series_id_t survivor  = collision.value_or(id);
  if (survivor == id && collision) return id;

  Transaction                tx(_guard._conn);
  duckorm::PreparedStatement repoint(_guard._conn,
                                     "UPDATE Comic SET series_id=?, series=? WHERE series_id=?;");
  repoint.BindInt64(1, survivor);
  repoint.BindVarchar(2, new_name);
  repoint.BindInt64(3, id);
  repoint.Execute();

  if (collision) {
    _service.RemoveById(id);
    std::cout << std::format("[INFO] SeriesController: Merged series {} into {} ('{}')\n", id,
                             survivor, new_name);
  } else {
    duckorm::PreparedStatement rename(_guard._conn, "UPDATE Series SET name=? WHERE id=?;");
    rename.BindVarchar(1, new_name);
    rename.BindInt64(2, id);
    rename.Execute();
  }
  tx.Commit();
  return survivor;
}

void SeriesController::SetNsfwFlags(const std::vector<std::pair<series_id_t, bool>>& flags) {
  if (flags.empty()) return;
  std::lock_guard<std::mutex> lock(_mtx);
  Transaction                 tx(_guard._conn);
  duckorm::PreparedStatement  stmt(_guard._conn, "UPDATE Series SET is_nsfw=? WHERE id=?;");
  for (const auto& [id, is_nsfw] : flags) {
    stmt.BindBool(1, is_nsfw);
    stmt.BindInt64(2, id);
    stmt.Execute();
  }
  tx.Commit();
}

void SeriesController::SetOverride(series_id_t id, std::optional<bool> override_value) {
  std::lock_guard<std::mutex> lock(_mtx);
  duckorm::PreparedStatement  stmt(_guard._conn, "UPDATE Series SET nsfw_override=? WHERE id=?;");
  stmt.BindOptionalBool(1, override_value);
  stmt.BindInt64(2, id);
  stmt.Execute();
}
};  // namespace inkstone
