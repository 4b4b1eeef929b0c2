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

#include "scanner/sync_engine.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <system_error>

#include "type/hash_type.hpp"
#include "type/supported_file_type.hpp"
#include "utils/string/convert.hpp"
#include "utils/string/filename_parser.hpp"

namespace inkstone {
namespace {
auto MtimeNanos(const std::filesystem::file_time_type& time) -> int64_t {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}
}  // namespace

SyncEngine::SyncEngine(ComicController& comics, SeriesController& series, SyncOptions options,
                       LibraryChangedCallback on_changed)
    : comics_(comics),
      series_(series),
      options_(std::move(options)),
      on_changed_(std::move(on_changed)) {
  if (options_.upsert_batch_size_ == 0) options_.upsert_batch_size_ = 500;
  if (options_.progress_interval_ == 0) options_.progress_interval_ = 50;
}

auto SyncEngine::NormalizePath(const file_path_t& path) -> file_path_t {
  auto normal = std::filesystem::absolute(path).lexically_normal();
  // "/lib/" and "/lib" must hash the same
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

auto SyncEngine::ComicIdFor(const file_path_t& normalized_path) -> comic_id_t {
  return Hash128::Compute(conv::PathToBytes(normalized_path)).ToString();
}

auto SyncEngine::Run(ScanLog& log, const SyncProgressCallback& progress) -> SyncStats {
  if (options_.roots_.empty()) {
    throw ScanConfigError("[ERROR] SyncEngine: No library roots configured");
  }
  std::vector<file_path_t> roots;
  for (const auto& raw_root : options_.roots_) {
    auto            root = NormalizePath(raw_root);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
      throw ScanConfigError(std::format("[ERROR] SyncEngine: Library root {} is not accessible{}",
                                        conv::PathToBytes(root),
                                        ec ? ": " + ec.message() : std::string{}));
    }
    roots.push_back(std::move(root));
  }

  auto      snapshot = comics_.GetSnapshot();
  WalkState state;
  state.snapshot_ = &snapshot;

  for (const auto& root : roots) {
    SidecarResolver sidecars(root, options_.sidecar_name_,
                             [&log](const file_path_t& file, const std::string& message) {
                               log.Add(conv::PathToBytes(file), message);
                             });
    WalkDir(root, root, {}, sidecars, state, log, progress);
    if (state.cancelled_) break;
  }

  if (state.cancelled_) {
    // Nothing from a partial walk is written, the next scan sees the same diff
    std::cout << std::format("[INFO] SyncEngine: Walk cancelled after {} files\n",
                             state.stats_.total_files_);
    state.stats_.cancelled_      = true;
    state.stats_.new_comics_     = 0;
    state.stats_.changed_comics_ = 0;
    return state.stats_;
  }

  std::unordered_map<std::string, series_id_t> series_ids;
  for (const auto& name : state.series_order_) {
    const auto& pending = state.series_.at(name);
    series_ids[name]    = series_.CreateOrUpdate(name, pending.metadata_.get(), pending.placement_);
  }
  state.stats_.series_written_ = static_cast<int64_t>(series_ids.size());

  for (auto& comic : state.upserts_) {
    auto it = series_ids.find(comic.series_);
    if (it != series_ids.end()) comic.series_id_ = it->second;
  }
  comics_.UpsertComics(state.upserts_, options_.upsert_batch_size_);

  std::vector<comic_id_t> missing;
  for (const auto& [id, fingerprint] : snapshot) {
    if (!state.seen_.contains(id)) missing.push_back(id);
  }
  std::sort(missing.begin(), missing.end());
  if (!missing.empty()) {
    state.stats_.deleted_comics_ = static_cast<int64_t>(comics_.DeleteByIds(missing));
  }

  std::cout << std::format(
      "[INFO] SyncEngine: {} files, {} new, {} changed, {} deleted, {} series written\n",
      state.stats_.total_files_, state.stats_.new_comics_, state.stats_.changed_comics_,
      state.stats_.deleted_comics_, state.stats_.series_written_);

  if (state.stats_.HasChanges() && on_changed_) on_changed_();
  return state.stats_;
}

void SyncEngine::WalkDir(const file_path_t& root, const file_path_t& dir,
                         const std::vector<std::string>& rel_parts, SidecarResolver& sidecars,
                         WalkState& state, ScanLog& log, const SyncProgressCallback& progress) {
  std::vector<file_path_t> files;
  std::vector<file_path_t> subdirs;

  std::error_code          ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    if (dir == root) {
      throw ScanConfigError(std::format("[ERROR] SyncEngine: Cannot read library root {}: {}",
                                        conv::PathToBytes(dir), ec.message()));
    }
    std::cerr << std::format("[WARN] SyncEngine: Skipping directory {}: {}\n",
                             conv::PathToBytes(dir), ec.message());
    log.Add(conv::PathToBytes(dir), std::format("Cannot read directory: {}", ec.message()));
    return;
  }

  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const auto&     entry = *it;
    std::error_code entry_ec;
    // Symlinked directories are not followed, they can form cycles
    if (entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec)) {
      subdirs.push_back(entry.path());
    } else if (entry.is_regular_file(entry_ec) && is_comic_archive(entry.path())) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    log.Add(conv::PathToBytes(dir), std::format("Directory listing aborted: {}", ec.message()));
  }

  auto by_name = [](const file_path_t& lhs, const file_path_t& rhs) {
    return lhs.filename().native() < rhs.filename().native();
  };
  std::sort(files.begin(), files.end(), by_name);
  std::sort(subdirs.begin(), subdirs.end(), by_name);

  for (const auto& file : files) {
    VisitFile(file, rel_parts, sidecars, dir, state, log);
    if (progress && state.stats_.total_files_ % static_cast<int64_t>(options_.progress_interval_) == 0) {
      SyncProgress report{state.stats_.total_files_, state.stats_.new_comics_,
                          state.stats_.changed_comics_, conv::PathToBytes(file.filename())};
      if (progress(report)) {
        state.cancelled_ = true;
        return;
      }
    }
  }

  for (const auto& subdir : subdirs) {
    auto child_parts = rel_parts;
    child_parts.push_back(conv::PathToBytes(subdir.filename()));
    WalkDir(root, subdir, child_parts, sidecars, state, log, progress);
    if (state.cancelled_) return;
  }
}

void SyncEngine::VisitFile(const file_path_t& file, const std::vector<std::string>& rel_parts,
                           SidecarResolver& sidecars, const file_path_t& dir, WalkState& state,
                           ScanLog& log) {
  auto            path     = NormalizePath(file);
  auto            utf8_path = conv::PathToBytes(path);

  std::error_code ec;
  auto            size  = std::filesystem::file_size(path, ec);
  if (ec) {
    log.Add(utf8_path, std::format("Cannot stat file: {}", ec.message()));
    return;
  }
  auto mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    log.Add(utf8_path, std::format("Cannot stat file: {}", ec.message()));
    return;
  }

  ++state.stats_.total_files_;
  auto id = ComicIdFor(path);
  state.seen_.insert(id);

  ComicFingerprint fingerprint{MtimeNanos(mtime), static_cast<int64_t>(size)};
  auto             known  = state.snapshot_->find(id);
  bool             is_new = known == state.snapshot_->end();
  if (!is_new && known->second == fingerprint) return;
  if (is_new) {
    ++state.stats_.new_comics_;
  } else {
    ++state.stats_.changed_comics_;
  }

  auto filename = conv::PathToBytes(path.filename());
  auto metadata = sidecars.Resolve(dir);

  std::string series_name;
  if (metadata) {
    if (auto sidecar_name = metadata->SeriesName()) series_name = *sidecar_name;
  }
  if (series_name.empty() && rel_parts.size() >= 3) series_name = rel_parts[2];
  if (series_name.empty()) series_name = DeriveSeriesName(filename);
  if (series_name.empty()) series_name = conv::PathToBytes(path.stem());

  Comic comic;
  comic.id_          = id;
  comic.path_        = utf8_path;
  comic.filename_    = filename;
  comic.series_      = series_name;
  comic.category_    = rel_parts.empty() ? std::string("Uncategorized") : rel_parts[0];
  if (rel_parts.size() >= 2) comic.subcategory_ = rel_parts[1];
  comic.size_bytes_  = fingerprint.size_bytes_;
  comic.size_str_    = FormatFileSize(size);
  comic.mtime_       = fingerprint.mtime_;
  auto info          = ParseFilenameInfo(filename);
  comic.volume_      = info.volume_;
  comic.chapter_     = info.chapter_;

  if (!state.series_.contains(series_name)) {
    state.series_order_.push_back(series_name);
    state.series_.emplace(series_name,
                          PendingSeries{metadata, {comic.category_, comic.subcategory_, id}});
  }
  state.upserts_.push_back(std::move(comic));
}
};  // namespace inkstone
