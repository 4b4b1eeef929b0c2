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

#include "app/library_service.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "common/library_test_fixation.hpp"

namespace inkstone {
class LibraryServiceTests : public LibraryTestBase {
 protected:
  std::unique_ptr<LibraryService> library_;

  void                            SetUp() override {
    LibraryTestBase::SetUp();
    WriteComic("Manga/Seinen/Berserk/Berserk v01.cbz", {"1.png"});
    WriteComic("Manga/Seinen/Vinland Saga/Vinland Saga v01.cbz", {"1.png"});
    WriteSidecar("Manga/Seinen/Vinland Saga",
                 {{"title", "Vinland Saga"},
                  {"synopsis", "A young warrior seeks revenge in Viking-age Europe."},
                  {"genres", nlohmann::json::array({"Action", "Historical"})}});
    library_ = std::make_unique<LibraryService>(MakeConfig());
    library_->GetScanService().RunBlocking(ScanType::SYNC_ONLY);
  }

  void TearDown() override {
    library_.reset();
    LibraryTestBase::TearDown();
  }
};

TEST_F(LibraryServiceTests, SearchFindsSyncedSeries) {
  auto result = library_->Search("viking");
  ASSERT_EQ(result.series_.size(), 1u);
  EXPECT_EQ(result.series_[0].name_, "Vinland Saga");

  EXPECT_TRUE(library_->Search("   ").series_.empty());
}

TEST_F(LibraryServiceTests, RenameRefreshesTagsAndSearch) {
  auto& taxonomy = library_->GetTaxonomy();
  EXPECT_EQ(taxonomy.QueryByTags({"action"}).matching_count_, 1);
  auto builds = library_->GetMetadataCache().BuildCount();

  auto series = library_->GetStorage().GetSeriesController().GetByName("Berserk");
  ASSERT_TRUE(series.has_value());
  auto survivor = library_->RenameSeries(series->id_, "Berserk of Gluttony");
  EXPECT_EQ(survivor, series->id_);
  EXPECT_FALSE(library_->GetMetadataCache().IsBuilt());

  auto result = library_->Search("gluttony");
  ASSERT_EQ(result.series_.size(), 1u);
  EXPECT_EQ(result.series_[0].id_, series->id_);

  EXPECT_EQ(taxonomy.QueryByTags({"action"}).matching_count_, 1);
  EXPECT_EQ(library_->GetMetadataCache().BuildCount(), builds + 1);
}

TEST_F(LibraryServiceTests, ReopenKeepsTheLibrary) {
  library_.reset();
  library_ = std::make_unique<LibraryService>(MakeConfig());
  EXPECT_EQ(library_->GetStorage().GetComicController().CountAll(), 2);
  auto latest = library_->GetScanService().GetLatest();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->status_, ScanStatus::COMPLETED);
}
};  // namespace inkstone
