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

#include "app/scan_service.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <string>

#include "app/library_service.hpp"
#include "common/library_test_fixation.hpp"
#include "scanner/sync_engine.hpp"

namespace inkstone {
class ScanServiceTests : public LibraryTestBase {
 protected:
  std::unique_ptr<LibraryService> library_;

  void                            SetUp() override {
    LibraryTestBase::SetUp();
    OpenLibrary();
  }

  void TearDown() override {
    library_.reset();
    LibraryTestBase::TearDown();
  }

  void OpenLibrary(std::optional<LibraryConfig> config = std::nullopt) {
    library_.reset();
    library_ = std::make_unique<LibraryService>(config ? *config : MakeConfig());
    // Every OpenCV build encodes JPEG, WebP is optional
    library_->GetStorage().GetSettingsController().Set("thumb_format", "jpg");
  }

  void WriteLibrary() {
    WriteComic("Manga/Seinen/Berserk/Berserk v01.cbz", {"1.png", "2.png"});
    WriteComic("Manga/Seinen/Berserk/Berserk v02.cbz", {"1.png"});
    WriteComic("Comics/Saga c001.cbz", {"1.png", "2.png", "3.png"});
  }

  auto ComicAt(const std::string& rel_path) -> std::optional<Comic> {
    auto id = SyncEngine::ComicIdFor(SyncEngine::NormalizePath(library_root_ / rel_path));
    return library_->GetStorage().GetComicController().GetById(id);
  }

  auto Scans() -> ScanService& { return library_->GetScanService(); }
};

TEST_F(ScanServiceTests, FullScanIndexesAndProcesses) {
  WriteLibrary();
  auto job = Scans().RunBlocking(ScanType::FULL);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::COMPLETED);
  EXPECT_EQ(job->phase_, ScanPhase::DONE);
  EXPECT_TRUE(job->completed_at_.has_value());
  EXPECT_FALSE(job->failure_.has_value());
  EXPECT_EQ(job->counters_.new_comics_, 3);
  EXPECT_EQ(job->counters_.processed_comics_, 3);
  EXPECT_EQ(job->counters_.processed_pages_, 3);
  EXPECT_EQ(job->counters_.processed_thumbnails_, 3);
  EXPECT_EQ(job->counters_.thumbnail_errors_, 0);

  auto& comics = library_->GetStorage().GetComicController();
  EXPECT_EQ(comics.CountAll(), 3);
  EXPECT_EQ(comics.CountPending(), 0);

  auto saga = ComicAt("Comics/Saga c001.cbz");
  ASSERT_TRUE(saga.has_value());
  EXPECT_TRUE(saga->processed_);
  EXPECT_EQ(saga->pages_, 3);
  EXPECT_TRUE(saga->has_thumbnail_);
  EXPECT_EQ(saga->thumbnail_ext_, "jpg");
  EXPECT_TRUE(std::filesystem::exists(cache_dir_ / "thumbnails" / (saga->id_ + ".jpg")));

  auto latest = Scans().GetLatest();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->id_, job->id_);
}

TEST_F(ScanServiceTests, RepeatedFullScanHasNothingToDo) {
  WriteLibrary();
  Scans().RunBlocking(ScanType::FULL);
  auto job = Scans().RunBlocking(ScanType::FULL);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::COMPLETED);
  EXPECT_EQ(job->counters_.new_comics_, 0);
  EXPECT_EQ(job->counters_.changed_comics_, 0);
  EXPECT_EQ(job->counters_.deleted_comics_, 0);
  EXPECT_EQ(job->counters_.total_comics_, 0);
  EXPECT_EQ(job->counters_.processed_comics_, 0);
}

TEST_F(ScanServiceTests, SyncOnlyLeavesComicsPending) {
  WriteLibrary();
  auto job = Scans().RunBlocking(ScanType::SYNC_ONLY);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::COMPLETED);
  EXPECT_EQ(job->counters_.new_comics_, 3);
  EXPECT_EQ(job->counters_.processed_comics_, 0);
  EXPECT_EQ(library_->GetStorage().GetComicController().CountPending(), 3);
  auto saga = ComicAt("Comics/Saga c001.cbz");
  ASSERT_TRUE(saga.has_value());
  EXPECT_FALSE(saga->processed_);
  EXPECT_FALSE(saga->has_thumbnail_);
}

TEST_F(ScanServiceTests, RunningJobRejectsSecondStart) {
  WriteLibrary();
  auto& jobs    = library_->GetStorage().GetScanJobController();
  auto  running = jobs.TryStartJob(ScanType::FULL);
  ASSERT_TRUE(running.has_value());

  EXPECT_FALSE(Scans().Start(ScanType::FULL).has_value());
  EXPECT_FALSE(Scans().RunBlocking(ScanType::SYNC_ONLY).has_value());
  EXPECT_EQ(library_->GetStorage().GetComicController().CountAll(), 0);

  auto latest = Scans().GetLatest();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->id_, running->id_);
  EXPECT_EQ(latest->status_, ScanStatus::RUNNING);
}

TEST_F(ScanServiceTests, CancelStopsTheBackgroundJob) {
  for (int i = 1; i <= 30; ++i) {
    WriteComic(std::format("Comics/Long Run c{:03}.cbz", i), {"1.png", "2.png"}, 1200, 1800);
  }
  auto config        = MakeConfig();
  config.batch_size_ = 1;
  OpenLibrary(config);

  auto id = Scans().Start(ScanType::FULL);
  ASSERT_TRUE(id.has_value());
  EXPECT_TRUE(Scans().RequestCancel());
  Scans().Wait();

  auto job = Scans().GetJob(*id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::CANCELLED);
  EXPECT_EQ(job->phase_, ScanPhase::DONE);
  EXPECT_TRUE(job->cancel_requested_);
  EXPECT_LT(job->counters_.processed_comics_, 30);
  EXPECT_FALSE(Scans().RequestCancel());
}

TEST_F(ScanServiceTests, CancelledLibraryResumesOnNextScan) {
  for (int i = 1; i <= 12; ++i) {
    WriteComic(std::format("Comics/Resume c{:03}.cbz", i), {"1.png"}, 1200, 1800);
  }
  auto config        = MakeConfig();
  config.batch_size_ = 1;
  OpenLibrary(config);

  auto id = Scans().Start(ScanType::FULL);
  ASSERT_TRUE(id.has_value());
  Scans().RequestCancel();
  Scans().Wait();

  auto job = Scans().RunBlocking(ScanType::FULL);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::COMPLETED);
  EXPECT_EQ(library_->GetStorage().GetComicController().CountAll(), 12);
  EXPECT_EQ(library_->GetStorage().GetComicController().CountPending(), 0);
}

TEST_F(ScanServiceTests, MissingRootFailsTheJob) {
  auto config   = MakeConfig();
  config.roots_ = {library_root_, work_dir_ / "not-there"};
  WriteLibrary();
  OpenLibrary(config);

  auto job = Scans().RunBlocking(ScanType::FULL);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::FAILED);
  EXPECT_EQ(job->phase_, ScanPhase::DONE);
  ASSERT_TRUE(job->failure_.has_value());
  EXPECT_NE(job->failure_->find("not-there"), std::string::npos);
  EXPECT_EQ(library_->GetStorage().GetComicController().CountAll(), 0);

  // The failed job released the lock
  EXPECT_TRUE(Scans().RunBlocking(ScanType::SYNC_ONLY).has_value());
}

TEST_F(ScanServiceTests, RescanRebuildsFromScratch) {
  WriteLibrary();
  Scans().RunBlocking(ScanType::FULL);
  auto  berserk_before = ComicAt("Manga/Seinen/Berserk/Berserk v01.cbz");
  ASSERT_TRUE(berserk_before.has_value());
  auto& series = library_->GetStorage().GetSeriesController();
  ASSERT_TRUE(berserk_before->series_id_.has_value());
  library_->RenameSeries(*berserk_before->series_id_, "Berserk Deluxe");

  auto job = Scans().RunBlocking(ScanType::RESCAN);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::COMPLETED);
  EXPECT_EQ(job->counters_.new_comics_, 3);
  EXPECT_EQ(job->counters_.processed_comics_, 3);
  EXPECT_FALSE(series.GetByName("Berserk Deluxe").has_value());
  EXPECT_TRUE(series.GetByName("Berserk").has_value());

  auto berserk_after = ComicAt("Manga/Seinen/Berserk/Berserk v01.cbz");
  ASSERT_TRUE(berserk_after.has_value());
  EXPECT_EQ(berserk_after->id_, berserk_before->id_);
  EXPECT_TRUE(berserk_after->processed_);
}

TEST_F(ScanServiceTests, InterruptedJobIsFailedOnReopen) {
  job_id_t orphan_id = 0;
  {
    auto orphan = library_->GetStorage().GetScanJobController().TryStartJob(ScanType::FULL);
    ASSERT_TRUE(orphan.has_value());
    orphan_id = orphan->id_;
  }
  library_.reset();
  OpenLibrary();

  auto job = Scans().GetJob(orphan_id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status_, ScanStatus::FAILED);
  EXPECT_TRUE(job->failure_.has_value());
  EXPECT_TRUE(job->completed_at_.has_value());

  WriteLibrary();
  auto next = Scans().RunBlocking(ScanType::FULL);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->status_, ScanStatus::COMPLETED);
}
};  // namespace inkstone
