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

#include <filesystem>

#include "storage/controller/controller_types.hpp"
#include "type/type.hpp"

namespace inkstone {
class DBController {
 private:
  duckdb_database              _db = nullptr;

  file_path_t                  _db_path;

  // Every statement is idempotent so the schema can be applied to an existing file
  constexpr static const char* init_table_query =
      "CREATE SEQUENCE IF NOT EXISTS series_id_seq START 1;"
      "CREATE SEQUENCE IF NOT EXISTS scan_job_id_seq START 1;"
      "CREATE TABLE IF NOT EXISTS Comic (id VARCHAR PRIMARY KEY, path VARCHAR NOT NULL, "
      "filename VARCHAR, series VARCHAR, series_id BIGINT, category VARCHAR, subcategory VARCHAR, "
      "size_bytes BIGINT, size_str VARCHAR, mtime BIGINT, pages BIGINT, processed BOOLEAN "
      "DEFAULT false, has_thumbnail BOOLEAN DEFAULT false, thumbnail_ext VARCHAR, file_hash "
      "VARCHAR, volume DOUBLE, chapter DOUBLE);"
      "CREATE TABLE IF NOT EXISTS Series (id BIGINT PRIMARY KEY DEFAULT nextval('series_id_seq'), "
      "name VARCHAR NOT NULL UNIQUE, title VARCHAR, title_english VARCHAR, title_japanese "
      "VARCHAR, synonyms VARCHAR, authors VARCHAR, synopsis VARCHAR, genres VARCHAR, tags "
      "VARCHAR, demographics VARCHAR, status VARCHAR, total_volumes BIGINT, total_chapters "
      "BIGINT, release_year BIGINT, mal_id BIGINT, anilist_id BIGINT, cover_comic_id VARCHAR, "
      "category VARCHAR, subcategory VARCHAR, is_adult BOOLEAN DEFAULT false, is_nsfw BOOLEAN "
      "DEFAULT false, nsfw_override BOOLEAN);"
      "CREATE TABLE IF NOT EXISTS ScanJob (id BIGINT PRIMARY KEY DEFAULT "
      "nextval('scan_job_id_seq'), scan_type VARCHAR NOT NULL, status VARCHAR NOT NULL, phase "
      "VARCHAR NOT NULL, started_at TIMESTAMP DEFAULT current_timestamp, completed_at TIMESTAMP, "
      "total_comics BIGINT DEFAULT 0, processed_comics BIGINT DEFAULT 0, new_comics BIGINT "
      "DEFAULT 0, changed_comics BIGINT DEFAULT 0, deleted_comics BIGINT DEFAULT 0, "
      "processed_pages BIGINT DEFAULT 0, page_errors BIGINT DEFAULT 0, processed_thumbnails "
      "BIGINT DEFAULT 0, thumbnail_errors BIGINT DEFAULT 0, thumb_bytes_written BIGINT DEFAULT 0, "
      "thumb_bytes_saved BIGINT DEFAULT 0, current_file VARCHAR, errors VARCHAR, failure "
      "VARCHAR, cancel_requested BOOLEAN DEFAULT false);"
      "CREATE TABLE IF NOT EXISTS TagModification (source_norm VARCHAR PRIMARY KEY, action "
      "VARCHAR NOT NULL, target_norm VARCHAR, display_name VARCHAR);"
      "CREATE TABLE IF NOT EXISTS AdminSetting (key VARCHAR PRIMARY KEY, value VARCHAR NOT NULL);"
      "CREATE TABLE IF NOT EXISTS ReadingProgress (user_id BIGINT, comic_id VARCHAR, "
      "current_page BIGINT, completed BOOLEAN DEFAULT false);"
      "CREATE TABLE IF NOT EXISTS Bookmark (user_id BIGINT, comic_id VARCHAR, page_number BIGINT, "
      "note VARCHAR);"
      "INSERT OR IGNORE INTO AdminSetting VALUES ('thumb_width', '225'), ('thumb_height', '350'), "
      "('thumb_quality', '70'), ('thumb_format', 'webp'), ('compute_file_hash', 'false'), "
      "('nsfw_categories', '[]'), ('nsfw_subcategories', '[]');";

 public:
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
  auto GetDBPath() const -> const file_path_t& { return _db_path; }
};
};  // namespace inkstone
