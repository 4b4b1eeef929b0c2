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

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/library_test_fixation.hpp"
#include "storage/storage_service.hpp"
#include "utils/scan/scan_log.hpp"

namespace inkstone {
class SyncEngineTests : public LibraryTestBase {
 protected:
  std::unique_ptr<StorageService> storage_;
  int                             changed_calls_ = 0;

  void                            SetUp() override {
    LibraryTestBase::SetUp();
    storage_ = std::make_unique<StorageService>(db_path_);
  }

  void TearDown() override {
    storage_.reset();
    LibraryTestBase::TearDown();
  }

  auto MakeEngine(std::vector<file_path_t> roots = {}) -> SyncEngine {
    SyncOptions options;
    options.roots_             = roots.empty() ? std::vector<file_path_t>{library_root_} : roots;
    options.upsert_batch_size_ = 2;
    options.progress_interval_ = 1;
    return SyncEngine(storage_->GetComicController(), storage_->GetSeriesController(), options,
                      [this]() { ++changed_calls_; });
  }

  auto Sync() -> SyncStats {
    ScanLog log(50);
    return MakeEngine().Run(log);
  }

  auto ComicAt(const std::string& rel_path) -> std::optional<Comic> {
    auto id = SyncEngine::ComicIdFor(SyncEngine::NormalizePath(library_root_ / rel_path));
    return storage_->GetComicController().GetById(id);
  }

  void WriteLibrary() {
    WriteComic("Manga/Seinen/Berserk/Berserk v01.cbz", {"1.png", "2.png"});
    WriteComic("Manga/Seinen/Berserk/Berserk v02.cbz", {"1.png"});
    WriteComic("Comics/Saga c001.cbz", {"1.png"});
    WriteComic("loose.cbz", {"1.png"});
    WriteRawFile("Manga/Seinen/Berserk/notes.txt", "not a comic");
  }
};

TEST_F(SyncEngineTests, FirstSyncIndexesAndClassifies) {
  WriteLibrary();
  auto stats = Sync();
  EXPECT_EQ(stats.total_files_, 4);
  EXPECT_EQ(stats.new_comics_, 4);
  EXPECT_EQ(stats.changed_comics_, 0);
  EXPECT_EQ(stats.deleted_comics_, 0);
  EXPECT_EQ(stats.series_written_, 3);
  EXPECT_FALSE(stats.cancelled_);
  EXPECT_EQ(changed_calls_, 1);
  EXPECT_EQ(storage_->GetComicController().CountAll(), 4);

  auto berserk = ComicAt("Manga/Seinen/Berserk/Berserk v01.cbz");
  ASSERT_TRUE(berserk.has_value());
  EXPECT_EQ(berserk->category_, "Manga");
  EXPECT_EQ(berserk->subcategory_, "Seinen");
  EXPECT_EQ(berserk->series_, "Berserk");
  EXPECT_EQ(berserk->volume_, 1.0);
  EXPECT_FALSE(berserk->processed_);
  ASSERT_TRUE(berserk->series_id_.has_value());

  auto series = storage_->GetSeriesController().GetById(*berserk->series_id_);
  ASSERT_TRUE(series.has_value());
  EXPECT_EQ(series->name_, "Berserk");
  EXPECT_EQ(series->cover_comic_id_, berserk->id_);

  auto saga = ComicAt("Comics/Saga c001.cbz");
  ASSERT_TRUE(saga.has_value());
  EXPECT_EQ(saga->category_, "Comics");
  EXPECT_FALSE(saga->subcategory_.has_value());
  EXPECT_EQ(saga->series_, "Saga");
  EXPECT_EQ(saga->chapter_, 1.0);

  auto loose = ComicAt("loose.cbz");
  ASSERT_TRUE(loose.has_value());
  EXPECT_EQ(loose->category_, "Uncategorized");
  EXPECT_EQ(loose->series_, "loose");
}

TEST_F(SyncEngineTests, SecondSyncIsNoOp) {
  WriteLibrary();
  Sync();
  auto stats = Sync();
  EXPECT_EQ(stats.total_files_, 4);
  EXPECT_FALSE(stats.HasChanges());
  EXPECT_EQ(stats.series_written_, 0);
  EXPECT_EQ(changed_calls_, 1);
}

TEST_F(SyncEngineTests, RemovedFileIsTheOnlyDeletion) {
  WriteLibrary();
  Sync();
  std::filesystem::remove(library_root_ / "Comics/Saga c001.cbz");

  auto stats = Sync();
  EXPECT_EQ(stats.deleted_comics_, 1);
  EXPECT_EQ(stats.new_comics_, 0);
  EXPECT_EQ(storage_->GetComicController().CountAll(), 3);
  EXPECT_FALSE(ComicAt("Comics/Saga c001.cbz").has_value());
  EXPECT_TRUE(ComicAt("loose.cbz").has_value());
  EXPECT_EQ(changed_calls_, 2);
}

TEST_F(SyncEngineTests, ChangedFileIsRewrittenAsPending) {
  WriteLibrary();
  Sync();
  auto id = ComicAt("loose.cbz")->id_;
  storage_->GetComicController().ApplyProcessingResults({ComicProcessingUpdate{id, 1, false}});
  ASSERT_TRUE(ComicAt("loose.cbz")->processed_);

  WriteComic("loose.cbz", {"1.png", "2.png", "3.png"});
  auto stats = Sync();
  EXPECT_EQ(stats.changed_comics_, 1);
  EXPECT_EQ(stats.new_comics_, 0);
  auto loose = ComicAt("loose.cbz");
  ASSERT_TRUE(loose.has_value());
  EXPECT_EQ(loose->id_, id);
  EXPECT_FALSE(loose->processed_);
}

TEST_F(SyncEngineTests, SidecarAppliesToSubdirectories) {
  WriteSidecar("Manga/Shonen", {{"series", "Custom Name"},
                                {"tags", nlohmann::json::array({"Action", "Adventure"})},
                                {"synopsis", "Pirates"},
                                {"is_adult", false}});
  WriteComic("Manga/Shonen/Folder Name/Thing v01.cbz", {"1.png"});
  Sync();

  auto comic = ComicAt("Manga/Shonen/Folder Name/Thing v01.cbz");
  ASSERT_TRUE(comic.has_value());
  EXPECT_EQ(comic->series_, "Custom Name");
  auto series = storage_->GetSeriesController().GetByName("Custom Name");
  ASSERT_TRUE(series.has_value());
  EXPECT_EQ(series->tags_, (std::vector<std::string>{"Action", "Adventure"}));
  EXPECT_EQ(series->synopsis_, "Pirates");
  EXPECT_EQ(series->category_, "Manga");
  EXPECT_EQ(series->subcategory_, "Shonen");
}

TEST_F(SyncEngineTests, MalformedSidecarIsLoggedAndIgnored) {
  WriteRawFile("Manga/Seinen/Blame/series.json", "{ not json");
  WriteComic("Manga/Seinen/Blame/Blame v01.cbz", {"1.png"});

  ScanLog log(50);
  auto    stats = MakeEngine().Run(log);
  EXPECT_EQ(stats.new_comics_, 1);
  EXPECT_EQ(log.Size(), 1u);
  auto comic = ComicAt("Manga/Seinen/Blame/Blame v01.cbz");
  ASSERT_TRUE(comic.has_value());
  EXPECT_EQ(comic->series_, "Blame");
}

TEST_F(SyncEngineTests, MissingRootIsFatal) {
  WriteLibrary();
  ScanLog log(50);
  auto    engine = MakeEngine({library_root_, work_dir_ / "does-not-exist"});
  EXPECT_THROW(engine.Run(log), ScanConfigError);
  EXPECT_EQ(storage_->GetComicController().CountAll(), 0);

  SyncEngine no_roots(storage_->GetComicController(), storage_->GetSeriesController(),
                      SyncOptions{});
  EXPECT_THROW(no_roots.Run(log), ScanConfigError);
}

TEST_F(SyncEngineTests, CancelledWalkWritesNothing) {
  WriteLibrary();
  ScanLog log(50);
  int     calls  = 0;
  auto    engine = MakeEngine();
  auto    stats  = engine.Run(log, [&calls](const SyncProgress& progress) {
    ++calls;
    return progress.files_seen_ >= 2;
  });
  EXPECT_TRUE(stats.cancelled_);
  EXPECT_EQ(stats.new_comics_, 0);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(storage_->GetComicController().CountAll(), 0);
  EXPECT_TRUE(storage_->GetSeriesController().GetAll().empty());
  EXPECT_EQ(changed_calls_, 0);
}

TEST_F(SyncEngineTests, PathNormalization) {
  auto a = SyncEngine::NormalizePath(library_root_ / "Manga" / ".." / "loose.cbz");
  auto b = SyncEngine::NormalizePath(library_root_ / "loose.cbz");
  EXPECT_EQ(a, b);
  EXPECT_EQ(SyncEngine::ComicIdFor(a), SyncEngine::ComicIdFor(b));
  EXPECT_EQ(SyncEngine::NormalizePath(library_root_ / ""), SyncEngine::NormalizePath(library_root_));
}
};  // namespace inkstone
