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

#include "tags/tag_taxonomy.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "common/library_test_fixation.hpp"
#include "library/series_metadata.hpp"
#include "storage/storage_service.hpp"
#include "tags/metadata_cache.hpp"

namespace inkstone {
class TagTaxonomyTests : public LibraryTestBase {
 protected:
  std::unique_ptr<StorageService> storage_;
  std::unique_ptr<MetadataCache>  cache_;
  std::unique_ptr<TagTaxonomy>    taxonomy_;

  void                            SetUp() override {
    LibraryTestBase::SetUp();
    storage_  = std::make_unique<StorageService>(db_path_);
    cache_    = std::make_unique<MetadataCache>(storage_->GetSeriesController(),
                                                storage_->GetComicController(),
                                                storage_->GetTagModificationController());
    taxonomy_ = std::make_unique<TagTaxonomy>(*cache_, storage_->GetTagModificationController());

    AddSeries("Alpha", {"Romance", "Comedy"});
    AddSeries("Beta", {"romance", "Drama"});
    AddSeries("Gamma", {"Action"});
  }

  void TearDown() override {
    taxonomy_.reset();
    cache_.reset();
    storage_.reset();
    LibraryTestBase::TearDown();
  }

  void AddSeries(const std::string& name, std::vector<std::string> tags) {
    SeriesMetadata meta;
    meta.tags_ = std::move(tags);
    storage_->GetSeriesController().CreateOrUpdate(name, &meta,
                                                   SeriesPlacement{"Manga", std::nullopt, std::nullopt});
    cache_->Invalidate();
  }
};

TEST_F(TagTaxonomyTests, RomanceFacet) {
  auto result = taxonomy_->QueryByTags({"Romance"});
  EXPECT_EQ(result.matching_count_, 2);
  ASSERT_EQ(result.series_.size(), 2u);
  EXPECT_EQ(result.series_[0].name_, "Alpha");
  EXPECT_EQ(result.series_[1].name_, "Beta");

  ASSERT_EQ(result.related_tags_.size(), 2u);
  EXPECT_EQ(result.related_tags_[0].name_, "Comedy");
  EXPECT_EQ(result.related_tags_[0].count_, 1);
  EXPECT_EQ(result.related_tags_[1].name_, "Drama");
  ASSERT_EQ(result.related_tags_[0].series_names_.size(), 1u);
  EXPECT_EQ(result.related_tags_[0].series_names_[0], "Alpha");
}

TEST_F(TagTaxonomyTests, EmptySelectionMatchesEverything) {
  auto result = taxonomy_->QueryByTags({});
  EXPECT_EQ(result.matching_count_, 3);
  ASSERT_FALSE(result.related_tags_.empty());
  EXPECT_EQ(result.related_tags_[0].norm_, "romance");
  EXPECT_EQ(result.related_tags_[0].count_, 2);

  auto blank = taxonomy_->QueryByTags({"  ", "!!"});
  EXPECT_EQ(blank.matching_count_, 3);
}

TEST_F(TagTaxonomyTests, BlacklistRemovesTagEverywhere) {
  taxonomy_->QueryByTags({});
  auto builds_before = cache_->BuildCount();
  taxonomy_->Blacklist("Drama");
  EXPECT_FALSE(cache_->IsBuilt());

  auto facet = taxonomy_->QueryByTags({"Romance"});
  EXPECT_EQ(cache_->BuildCount(), builds_before + 1);
  ASSERT_EQ(facet.related_tags_.size(), 1u);
  EXPECT_EQ(facet.related_tags_[0].norm_, "comedy");

  auto blocked = taxonomy_->QueryByTags({"drama"});
  EXPECT_EQ(blocked.matching_count_, 0);
  EXPECT_TRUE(blocked.series_.empty());

  for (const auto& entry : taxonomy_->ListVocabulary()) {
    EXPECT_NE(entry.norm_, "drama");
  }
}

TEST_F(TagTaxonomyTests, WhitelistPinsDisplay) {
  auto stored = taxonomy_->Whitelist("romance", "  ROMANCE  ");
  ASSERT_TRUE(std::holds_alternative<Whitelist>(stored.action_));
  EXPECT_EQ(std::get<Whitelist>(stored.action_).display_, "ROMANCE");

  auto vocabulary = taxonomy_->ListVocabulary();
  auto it = std::find_if(vocabulary.begin(), vocabulary.end(),
                         [](const VocabularyEntry& e) { return e.norm_ == "romance"; });
  ASSERT_NE(it, vocabulary.end());
  EXPECT_EQ(it->display_, "ROMANCE");
  EXPECT_EQ(it->series_count_, 2);
}

TEST_F(TagTaxonomyTests, WhitelistOntoExistingTagBecomesMerge) {
  auto stored = taxonomy_->Whitelist("Drama", "Action");
  ASSERT_TRUE(std::holds_alternative<Merge>(stored.action_));
  EXPECT_EQ(std::get<Merge>(stored.action_).target_, "action");

  auto result = taxonomy_->QueryByTags({"Action"});
  EXPECT_EQ(result.matching_count_, 2);
  auto drama = taxonomy_->QueryByTags({"drama"});
  EXPECT_EQ(drama.matching_count_, 2);
}

TEST_F(TagTaxonomyTests, WhitelistOntoMergedAwayTagFollowsTheMerge) {
  taxonomy_->Merge("Comedy", "Drama");
  auto stored = taxonomy_->Whitelist("Action", "comedies");
  ASSERT_TRUE(std::holds_alternative<Merge>(stored.action_));
  EXPECT_EQ(std::get<Merge>(stored.action_).target_, "drama");

  auto result = taxonomy_->QueryByTags({"Drama"});
  EXPECT_EQ(result.matching_count_, 3);
  EXPECT_EQ(taxonomy_->ListModifications().size(), 2u);
}

TEST_F(TagTaxonomyTests, MergeRejectsSameNorm) {
  EXPECT_THROW(taxonomy_->Merge("Romance", "romances"), std::invalid_argument);
  EXPECT_THROW(taxonomy_->Merge("", "Romance"), std::invalid_argument);
  EXPECT_THROW(taxonomy_->Blacklist("   "), std::invalid_argument);
  EXPECT_TRUE(taxonomy_->ListModifications().empty());
}

TEST_F(TagTaxonomyTests, MergeAndRemove) {
  taxonomy_->Merge("Comedy", "Drama");
  auto merged = taxonomy_->QueryByTags({"drama"});
  EXPECT_EQ(merged.matching_count_, 2);
  ASSERT_EQ(taxonomy_->ListModifications().size(), 1u);

  EXPECT_TRUE(taxonomy_->RemoveModification("comedy"));
  EXPECT_FALSE(taxonomy_->RemoveModification("comedy"));
  auto restored = taxonomy_->QueryByTags({"drama"});
  EXPECT_EQ(restored.matching_count_, 1);
}

TEST_F(TagTaxonomyTests, ReplacingModificationKeepsOneRow) {
  taxonomy_->Blacklist("comedy");
  taxonomy_->Merge("comedy", "romance");
  auto mods = taxonomy_->ListModifications();
  ASSERT_EQ(mods.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Merge>(mods[0].action_));
}
};  // namespace inkstone
