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

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/library_test_fixation.hpp"
#include "library/comic.hpp"
#include "library/series_metadata.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/storage_service.hpp"

namespace inkstone {
class LibraryStorageTests : public LibraryTestBase {
 protected:
  std::unique_ptr<StorageService> storage_;

  void                            SetUp() override {
    LibraryTestBase::SetUp();
    storage_ = std::make_unique<StorageService>(db_path_);
  }

  void TearDown() override {
    storage_.reset();
    LibraryTestBase::TearDown();
  }

  static auto MakeComic(const std::string& id, const std::string& series,
                        std::optional<series_id_t> series_id, std::optional<double> volume = {})
      -> Comic {
    Comic comic;
    comic.id_          = id;
    comic.path_        = "/library/" + id + ".cbz";
    comic.filename_    = id + ".cbz";
    comic.series_      = series;
    comic.series_id_   = series_id;
    comic.category_    = "Manga";
    comic.size_bytes_  = 1024;
    comic.size_str_    = "1.0 KB";
    comic.mtime_       = 1700000000000000000;
    comic.volume_      = volume;
    return comic;
  }

  auto CountRows(const std::string& sql) -> int64_t {
    auto                       guard = storage_->GetDBController().GetConnectionGuard();
    duckorm::PreparedStatement stmt(guard._conn, sql);
    stmt.Execute();
    return stmt.GetInt64(0, 0).value_or(-1);
  }

  auto AddSeries(const std::string& name) -> series_id_t {
    return storage_->GetSeriesController().CreateOrUpdate(
        name, nullptr, SeriesPlacement{"Manga", std::nullopt, std::nullopt});
  }
};

TEST_F(LibraryStorageTests, SettingsDefaultsSeeded) {
  auto& settings = storage_->GetSettingsController();
  EXPECT_EQ(settings.Get("thumb_width"), "225");
  EXPECT_EQ(settings.Get("thumb_height"), "350");
  EXPECT_EQ(settings.Get("thumb_quality"), "70");
  EXPECT_EQ(settings.Get("thumb_format"), "webp");
  EXPECT_EQ(settings.Get("nsfw_categories"), "[]");
  EXPECT_FALSE(settings.Get("missing").has_value());

  settings.Set("thumb_width", "300");
  EXPECT_EQ(settings.Get("thumb_width"), "300");
}

TEST_F(LibraryStorageTests, SnapshotReflectsUpserts) {
  auto& comics = storage_->GetComicController();
  comics.UpsertComics({MakeComic("a", "Alpha", std::nullopt), MakeComic("b", "Alpha", std::nullopt),
                       MakeComic("c", "Beta", std::nullopt)},
                      2);
  auto snapshot = comics.GetSnapshot();
  ASSERT_EQ(snapshot.size(), 3u);
  EXPECT_EQ(snapshot.at("a"), (ComicFingerprint{1700000000000000000, 1024}));

  auto changed        = MakeComic("a", "Alpha", std::nullopt);
  changed.size_bytes_ = 2048;
  comics.UpsertComics({changed}, 10);
  EXPECT_EQ(comics.GetSnapshot().at("a").size_bytes_, 2048);
  EXPECT_EQ(comics.CountAll(), 3);
  EXPECT_EQ(comics.CountPending(), 3);
}

TEST_F(LibraryStorageTests, DeleteRemovesDependents) {
  auto& comics = storage_->GetComicController();
  auto  series = storage_->GetSeriesController().CreateOrUpdate(
      "Alpha", nullptr, SeriesPlacement{"Manga", std::nullopt, std::string("a")});
  comics.UpsertComics({MakeComic("a", "Alpha", series), MakeComic("b", "Alpha", series)}, 10);
  {
    auto guard = storage_->GetDBController().GetConnectionGuard();
    duckorm::execute(guard._conn,
                     "INSERT INTO ReadingProgress VALUES (1, 'a', 3, false), (1, 'b', 1, false);"
                     "INSERT INTO Bookmark VALUES (1, 'a', 2, 'note');");
  }

  comics.DeleteByIds({"a"});
  EXPECT_FALSE(comics.GetById("a").has_value());
  EXPECT_TRUE(comics.GetById("b").has_value());
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM ReadingProgress WHERE comic_id='a';"), 0);
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM ReadingProgress WHERE comic_id='b';"), 1);
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM Bookmark;"), 0);
  auto stored = storage_->GetSeriesController().GetById(series);
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->cover_comic_id_.has_value());
}

TEST_F(LibraryStorageTests, SeriesUpdateCoalesces) {
  auto&          series = storage_->GetSeriesController();
  SeriesMetadata first;
  first.synopsis_ = "A long story";
  first.tags_     = std::vector<std::string>{"Action"};
  auto id = series.CreateOrUpdate("Alpha", &first, SeriesPlacement{"Manga", "Seinen", "c1"});

  SeriesMetadata second;
  second.title_ = "Alpha: The Title";
  EXPECT_EQ(series.CreateOrUpdate("Alpha", &second, SeriesPlacement{"Manga", std::nullopt, "c2"}),
            id);

  auto stored = series.GetById(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->synopsis_, "A long story");
  EXPECT_EQ(stored->title_, "Alpha: The Title");
  EXPECT_EQ(stored->tags_, (std::vector<std::string>{"Action"}));
  EXPECT_EQ(stored->cover_comic_id_, "c1");
  EXPECT_EQ(stored->subcategory_, "Seinen");
  EXPECT_EQ(stored->DisplayName(), "Alpha: The Title");
}

TEST_F(LibraryStorageTests, RenameOntoExistingMerges) {
  auto& comics = storage_->GetComicController();
  auto  alpha  = AddSeries("Alpha");
  auto  beta   = AddSeries("Beta");
  comics.UpsertComics({MakeComic("a", "Alpha", alpha), MakeComic("b", "Beta", beta)}, 10);

  EXPECT_EQ(storage_->GetSeriesController().Rename(alpha, "Beta"), beta);
  EXPECT_FALSE(storage_->GetSeriesController().GetById(alpha).has_value());
  auto moved = comics.GetById("a");
  ASSERT_TRUE(moved.has_value());
  EXPECT_EQ(moved->series_id_, beta);
  EXPECT_EQ(moved->series_, "Beta");
  EXPECT_EQ(comics.GetBySeries(beta).size(), 2u);
}

TEST_F(LibraryStorageTests, RenameToFreeName) {
  auto alpha = AddSeries("Alpha");
  EXPECT_EQ(storage_->GetSeriesController().Rename(alpha, "Gamma"), alpha);
  EXPECT_TRUE(storage_->GetSeriesController().GetByName("Gamma").has_value());
  EXPECT_FALSE(storage_->GetSeriesController().GetByName("Alpha").has_value());
  EXPECT_THROW(storage_->GetSeriesController().Rename(999, "Delta"), std::invalid_argument);
}

TEST_F(LibraryStorageTests, ProcessingResultsMarkProcessed) {
  auto& comics = storage_->GetComicController();
  comics.UpsertComics({MakeComic("a", "Alpha", std::nullopt), MakeComic("b", "Alpha", std::nullopt)},
                      10);
  ASSERT_EQ(comics.FetchPending(1).size(), 1u);

  comics.ApplyProcessingResults({ComicProcessingUpdate{"a", 12, true, "webp", "hash"},
                                 ComicProcessingUpdate{"b", 0, false, std::nullopt, std::nullopt}});
  EXPECT_EQ(comics.CountPending(), 0);
  auto a = comics.GetById("a");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->pages_, 12);
  EXPECT_TRUE(a->has_thumbnail_);
  EXPECT_EQ(a->thumbnail_ext_, "webp");

  // b has no page count and is retried
  EXPECT_EQ(comics.ResetStaleProcessed(), 1);
  auto pending = comics.FetchPending(10);
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].id_, "b");
}

TEST_F(LibraryStorageTests, LeadingComicsInReadingOrder) {
  auto& comics = storage_->GetComicController();
  auto  alpha  = AddSeries("Alpha");
  comics.UpsertComics({MakeComic("v3", "Alpha", alpha, 3.0), MakeComic("v1", "Alpha", alpha, 1.0),
                       MakeComic("v2", "Alpha", alpha, 2.0), MakeComic("v4", "Alpha", alpha, 4.0)},
                      10);
  auto leading = comics.GetLeadingComics(3);
  ASSERT_TRUE(leading.contains(alpha));
  EXPECT_EQ(leading.at(alpha), (std::vector<comic_id_t>{"v1", "v2", "v3"}));
}

TEST_F(LibraryStorageTests, ScanLockAllowsOneRunningJob) {
  auto& jobs  = storage_->GetScanJobController();
  auto  first = jobs.TryStartJob(ScanType::FULL);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->status_, ScanStatus::RUNNING);
  EXPECT_EQ(first->phase_, ScanPhase::SYNC);

  EXPECT_FALSE(jobs.TryStartJob(ScanType::SYNC_ONLY).has_value());
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM ScanJob;"), 1);

  EXPECT_TRUE(jobs.RequestCancel());
  EXPECT_TRUE(jobs.IsCancelRequested(first->id_));
  jobs.Finish(*first, ScanStatus::CANCELLED);
  EXPECT_FALSE(jobs.RequestCancel());

  auto second = jobs.TryStartJob(ScanType::RESCAN);
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(second->id_, first->id_);
  auto latest = jobs.GetLatest();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->id_, second->id_);
  EXPECT_EQ(latest->type_, ScanType::RESCAN);
}

TEST_F(LibraryStorageTests, ProgressAndInterruption) {
  auto& jobs = storage_->GetScanJobController();
  auto  job  = jobs.TryStartJob(ScanType::FULL);
  ASSERT_TRUE(job.has_value());
  job->phase_                      = ScanPhase::PROCESSING;
  job->counters_.processed_comics_ = 7;
  job->current_file_               = "/library/a.cbz";
  job->errors_                     = {"a.cbz: broken"};
  jobs.UpdateProgress(*job);

  auto stored = jobs.GetJob(job->id_);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->phase_, ScanPhase::PROCESSING);
  EXPECT_EQ(stored->counters_.processed_comics_, 7);
  EXPECT_EQ(stored->errors_, (std::vector<std::string>{"a.cbz: broken"}));
  EXPECT_EQ(stored->status_, ScanStatus::RUNNING);

  EXPECT_EQ(jobs.MarkInterrupted(), 1);
  auto failed = jobs.GetJob(job->id_);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status_, ScanStatus::FAILED);
  EXPECT_EQ(failed->failure_, "interrupted");
  EXPECT_FALSE(jobs.GetRunning().has_value());
}

TEST_F(LibraryStorageTests, TagModificationsReplacePerSource) {
  auto& mods = storage_->GetTagModificationController();
  mods.Put({"gore", Blacklist{}});
  mods.Put({"sci fi", Merge{"science fiction"}});
  mods.Put({"gore", Whitelist{"Gore"}});
  auto all = mods.GetAll();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_TRUE(mods.Remove("gore"));
  EXPECT_FALSE(mods.Remove("gore"));
  ASSERT_EQ(mods.GetAll().size(), 1u);
  EXPECT_EQ(mods.GetAll()[0].action_, TagAction(Merge{"science fiction"}));
}
};  // namespace inkstone
