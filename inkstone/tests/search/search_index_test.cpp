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

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/library_test_fixation.hpp"
#include "library/series_metadata.hpp"
#include "storage/storage_service.hpp"

namespace inkstone {
class SearchIndexTests : public LibraryTestBase {
 protected:
  std::unique_ptr<StorageService> storage_;
  std::unique_ptr<SearchIndex>    index_;

  void                            SetUp() override {
    LibraryTestBase::SetUp();
    storage_ = std::make_unique<StorageService>(db_path_);
    index_   = std::make_unique<SearchIndex>(storage_->GetDBController().GetConnectionGuard());
  }

  void TearDown() override {
    index_.reset();
    storage_.reset();
    LibraryTestBase::TearDown();
  }

  void AddSeries(const std::string& name, std::optional<std::string> synopsis = std::nullopt) {
    SeriesMetadata meta;
    meta.synopsis_ = std::move(synopsis);
    storage_->GetSeriesController().CreateOrUpdate(
        name, &meta, SeriesPlacement{"Manga", std::nullopt, std::nullopt});
    index_->MarkDirty();
  }

  static auto Names(const SearchResult& result) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& series : result.series_) names.push_back(series.name_);
    return names;
  }
};

TEST_F(SearchIndexTests, SubstringFallbackFindsPartialWords) {
  AddSeries("Berserk", "A mercenary swordsman");
  AddSeries("Vinland Saga");
  auto result = index_->Search("erser");
  EXPECT_EQ(Names(result), (std::vector<std::string>{"Berserk"}));
  EXPECT_FALSE(result.full_text_);
}

TEST_F(SearchIndexTests, WholeWordsMatchNameAndSynopsis) {
  AddSeries("Berserk", "A mercenary swordsman");
  AddSeries("Vagabond", "The life of a wandering swordsman");
  AddSeries("Yotsuba");
  auto result = index_->Search("swordsman");
  auto names  = Names(result);
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"Berserk", "Vagabond"}));
}

TEST_F(SearchIndexTests, PercentIsLiteral) {
  AddSeries("Level 100% Love");
  AddSeries("Level 1000 Days");
  auto result = index_->Search("100%");
  EXPECT_EQ(Names(result), (std::vector<std::string>{"Level 100% Love"}));
}

TEST_F(SearchIndexTests, DirtyIndexIsRebuiltOnSearch) {
  AddSeries("Berserk");
  EXPECT_TRUE(index_->Search("Vagabond").series_.empty());
  EXPECT_FALSE(index_->IsDirty());

  AddSeries("Vagabond");
  EXPECT_TRUE(index_->IsDirty());
  EXPECT_EQ(Names(index_->Search("Vagabond")), (std::vector<std::string>{"Vagabond"}));
  EXPECT_FALSE(index_->IsDirty());
}

TEST_F(SearchIndexTests, BlankQueryReturnsNothing) {
  AddSeries("Berserk");
  EXPECT_TRUE(index_->Search("").series_.empty());
  EXPECT_TRUE(index_->Search("  !? ").series_.empty());
  EXPECT_TRUE(index_->Search("Berserk", 0).series_.empty());
}
};  // namespace inkstone
