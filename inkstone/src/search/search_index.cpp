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

#include "search/search_index.hpp"

#include <cctype>
#include <format>
#include <iostream>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
// Punctuation would be read as query syntax by some tokenizers
auto QueryWords(const std::string& query) -> std::string {
  std::string words;
  bool        pending_space = false;
  for (unsigned char c : query) {
    if (std::isalnum(c) || c >= 0x80) {
      if (pending_space && !words.empty()) words.push_back(' ');
      pending_space = false;
      words.push_back(static_cast<char>(c));
    } else {
      pending_space = true;
    }
  }
  return words;
}

auto EscapeLike(const std::string& text) -> std::string {
  std::string escaped;
  escaped.reserve(text.size() + 2);
  escaped.push_back('%');
  for (char c : text) {
    if (c == '%' || c == '_' || c == '\\') escaped.push_back('\\');
    escaped.push_back(c);
  }
  escaped.push_back('%');
  return escaped;
}
}  // namespace

SearchIndex::SearchIndex(ConnectionGuard&& guard)
    : _guard(std::move(guard)), _service(_guard._conn) {}

void SearchIndex::MarkDirty() { dirty_.store(true); }

auto SearchIndex::Rebuild() -> bool {
  std::lock_guard<std::mutex> lock(_mtx);
  return RebuildLocked();
}

auto SearchIndex::RebuildLocked() -> bool {
  // Cleared first: a write racing with the rebuild marks it dirty again
  dirty_.store(false);
  if (fts_missing_) return false;
  if (!fts_loaded_) {
    try {
      duckorm::execute(_guard._conn, "LOAD fts;");
      fts_loaded_ = true;
    } catch (const std::exception& e) {
      std::cerr << std::format(
          "[WARN] SearchIndex: fts extension not available, using substring search: {}\n",
          e.what());
      fts_missing_ = true;
      return false;
    }
  }
  try {
    duckorm::execute(_guard._conn,
                     "PRAGMA create_fts_index('Series', 'id', 'name', 'title', 'title_english', "
                     "'synonyms', 'authors', 'synopsis', overwrite=1);");
    fts_available_ = true;
  } catch (const std::exception& e) {
    std::cerr << std::format("[WARN] SearchIndex: Full-text index rebuild failed: {}\n",
                             e.what());
    fts_available_ = false;
  }
  return fts_available_;
}

auto SearchIndex::FullTextIds(const std::string& words, size_t limit)
    -> std::vector<series_id_t> {
  duckorm::PreparedStatement stmt(
      _guard._conn,
      "SELECT id FROM (SELECT id, name, fts_main_Series.match_bm25(id, ?) AS score FROM Series) "
      "WHERE score IS NOT NULL ORDER BY score DESC, name LIMIT ?;");
  stmt.BindVarchar(1, words);
  stmt.BindInt64(2, static_cast<int64_t>(limit));
  stmt.Execute();
  std::vector<series_id_t> ids;
  for (idx_t row = 0; row < stmt.RowCount(); ++row) {
    if (auto id = stmt.GetInt64(0, row)) ids.push_back(*id);
  }
  return ids;
}

auto SearchIndex::SubstringIds(const std::string& query, size_t limit)
    -> std::vector<series_id_t> {
  duckorm::PreparedStatement stmt(
      _guard._conn,
      "SELECT id FROM Series WHERE name ILIKE $1 ESCAPE '\\' OR title ILIKE $1 ESCAPE '\\' OR "
      "title_english ILIKE $1 ESCAPE '\\' OR synopsis ILIKE $1 ESCAPE '\\' OR authors ILIKE $1 "
      "ESCAPE '\\' ORDER BY name LIMIT $2;");
  stmt.BindVarchar(1, EscapeLike(query));
  stmt.BindInt64(2, static_cast<int64_t>(limit));
  stmt.Execute();
  std::vector<series_id_t> ids;
  for (idx_t row = 0; row < stmt.RowCount(); ++row) {
    if (auto id = stmt.GetInt64(0, row)) ids.push_back(*id);
  }
  return ids;
}

auto SearchIndex::LoadInOrder(const std::vector<series_id_t>& ids) -> std::vector<Series> {
  std::vector<Series> series;
  series.reserve(ids.size());
  for (auto id : ids) {
    auto rows = _service.GetSeriesById(id);
    if (!rows.empty()) series.push_back(std::move(rows.front()));
  }
  return series;
}

auto SearchIndex::Search(const std::string& query, size_t limit) -> SearchResult {
  SearchResult result;
  auto         words = QueryWords(query);
  if (words.empty() || limit == 0) return result;

  std::lock_guard<std::mutex> lock(_mtx);
  if (dirty_.load()) RebuildLocked();

  if (fts_available_) {
    try {
      result.series_ = LoadInOrder(FullTextIds(words, limit));
      result.full_text_ = !result.series_.empty();
    } catch (const std::exception& e) {
      std::cerr << std::format("[WARN] SearchIndex: Full-text query failed: {}\n", e.what());
      fts_available_ = false;
    }
  }
  if (result.series_.empty()) {
    result.series_ = LoadInOrder(SubstringIds(conv::Trim(query), limit));
  }
  return result;
}
};  // namespace inkstone
