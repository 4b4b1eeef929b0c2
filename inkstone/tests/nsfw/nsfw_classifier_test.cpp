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

#include "nsfw/nsfw_classifier.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/library_test_fixation.hpp"
#include "library/series_metadata.hpp"
#include "storage/storage_service.hpp"

namespace inkstone {
namespace {
auto MakeSeries(std::string category, std::optional<std::string> subcategory,
                std::vector<std::string> tags = {}) -> Series {
  Series series;
  series.name_        = "Sample";
  series.category_    = std::move(category);
  series.subcategory_ = std::move(subcategory);
  series.tags_        = std::move(tags);
  return series;
}
}  // namespace

TEST(NsfwClassifyTest, CategorySubstringRule) {
  NsfwRules rules;
  rules.categories_ = {"hentai"};
  EXPECT_TRUE(NsfwClassifier::Classify(MakeSeries("Hentai", "Doujinshi"), rules));
  EXPECT_TRUE(NsfwClassifier::Classify(MakeSeries("Old Hentai Stash", std::nullopt), rules));
  EXPECT_FALSE(NsfwClassifier::Classify(MakeSeries("Manga", "Doujinshi"), rules));
}

TEST(NsfwClassifyTest, SubcategoryMustMatchWhole) {
  NsfwRules rules;
  rules.subcategories_ = {"doujinshi"};
  EXPECT_TRUE(NsfwClassifier::Classify(MakeSeries("Manga", "Doujinshi"), rules));
  EXPECT_FALSE(NsfwClassifier::Classify(MakeSeries("Manga", "Doujinshi Extras"), rules));
}

TEST(NsfwClassifyTest, OverrideAndAdultFlagComeFirst) {
  NsfwRules rules;
  rules.categories_ = {"hentai"};
  auto pinned       = MakeSeries("Hentai", std::nullopt);
  pinned.nsfw_override_ = false;
  EXPECT_FALSE(NsfwClassifier::Classify(pinned, rules));

  auto adult      = MakeSeries("Manga", std::nullopt);
  adult.is_adult_ = true;
  EXPECT_TRUE(NsfwClassifier::Classify(adult, rules));
  adult.nsfw_override_ = false;
  EXPECT_FALSE(NsfwClassifier::Classify(adult, rules));
}

TEST(NsfwClassifyTest, DefaultTagPatterns) {
  auto rules = NsfwRules::Defaults();
  EXPECT_TRUE(NsfwClassifier::Classify(MakeSeries("Manga", std::nullopt, {"Ecchi"}), rules));
  EXPECT_TRUE(NsfwClassifier::Classify(MakeSeries("Manga", std::nullopt, {"Big Breasts"}), rules));
  EXPECT_TRUE(NsfwClassifier::Classify(MakeSeries("Manga", std::nullopt, {"MILF"}), rules));
  EXPECT_FALSE(
      NsfwClassifier::Classify(MakeSeries("Manga", std::nullopt, {"Romance", "Sports"}), rules));
  EXPECT_EQ(DefaultNsfwTagPatterns().size(), 52u);
}

TEST(NsfwRulesTest, ParseRuleList) {
  const std::vector<std::string> fallback = {"x"};
  EXPECT_EQ(ParseRuleList(std::nullopt, fallback), fallback);
  EXPECT_TRUE(ParseRuleList("[]", fallback).empty());
  EXPECT_EQ(ParseRuleList(" Hentai , ,Adult ", fallback),
            (std::vector<std::string>{"hentai", "adult"}));
  EXPECT_EQ(ParseRuleList(" , ", fallback), fallback);
  EXPECT_EQ(ParseRuleList(R"([" Yuri ", 3])", fallback), (std::vector<std::string>{"yuri", "3"}));
}

TEST(NsfwRulesTest, MalformedPatternRejected) {
  NsfwRules rules;
  rules.tag_patterns_ = {"ok*", "[broken"};
  EXPECT_THROW(rules.Validate(), NsfwRuleError);
  EXPECT_NO_THROW(NsfwRules::Defaults().Validate());
}

class NsfwClassifierTests : public LibraryTestBase {
 protected:
  std::unique_ptr<StorageService> storage_;
  std::unique_ptr<NsfwClassifier> classifier_;

  void                            SetUp() override {
    LibraryTestBase::SetUp();
    storage_    = std::make_unique<StorageService>(db_path_);
    classifier_ = std::make_unique<NsfwClassifier>(storage_->GetSeriesController(),
                                                   storage_->GetSettingsController());
  }

  void TearDown() override {
    classifier_.reset();
    storage_.reset();
    LibraryTestBase::TearDown();
  }

  auto AddSeries(const std::string& name, const std::string& category,
                 std::optional<std::string> subcategory, std::vector<std::string> tags = {})
      -> series_id_t {
    SeriesMetadata meta;
    meta.tags_ = std::move(tags);
    return storage_->GetSeriesController().CreateOrUpdate(
        name, &meta, SeriesPlacement{category, std::move(subcategory), std::nullopt});
  }

  auto IsNsfw(series_id_t id) -> bool {
    auto series = storage_->GetSeriesController().GetById(id);
    return series && series->is_nsfw_;
  }
};

TEST_F(NsfwClassifierTests, RecomputeIsIdempotent) {
  auto tagged = AddSeries("Tagged", "Manga", std::nullopt, {"Ecchi"});
  auto clean  = AddSeries("Clean", "Manga", std::nullopt, {"Sports"});

  auto first  = classifier_->RecomputeAll();
  EXPECT_EQ(first.total_, 2);
  EXPECT_EQ(first.flagged_, 1);
  EXPECT_EQ(first.changed_, 1);
  EXPECT_TRUE(IsNsfw(tagged));
  EXPECT_FALSE(IsNsfw(clean));

  auto second = classifier_->RecomputeAll();
  EXPECT_EQ(second.flagged_, 1);
  EXPECT_EQ(second.changed_, 0);
}

TEST_F(NsfwClassifierTests, SavedCategoryRuleApplies) {
  auto id = AddSeries("Doujin", "Hentai", "Doujinshi");
  classifier_->RecomputeAll();
  EXPECT_FALSE(IsNsfw(id));

  NsfwRules rules   = NsfwRules::Defaults();
  rules.categories_ = {"  HENTAI "};
  auto stats        = classifier_->SaveRules(rules);
  EXPECT_EQ(stats.flagged_, 1);
  EXPECT_TRUE(IsNsfw(id));

  auto loaded = classifier_->LoadRules();
  EXPECT_EQ(loaded.categories_, (std::vector<std::string>{"hentai"}));
}

TEST_F(NsfwClassifierTests, InvalidRulesLeaveStoredRules) {
  NsfwRules rules;
  rules.categories_   = {"adult"};
  rules.tag_patterns_ = {"[oops"};
  EXPECT_THROW(classifier_->SaveRules(rules), NsfwRuleError);
  auto loaded = classifier_->LoadRules();
  EXPECT_TRUE(loaded.categories_.empty());
  EXPECT_EQ(loaded.tag_patterns_, DefaultNsfwTagPatterns());
}

TEST_F(NsfwClassifierTests, OverrideWinsUntilReleased) {
  auto id = AddSeries("Tagged", "Manga", std::nullopt, {"Ecchi"});
  classifier_->RecomputeAll();
  ASSERT_TRUE(IsNsfw(id));

  EXPECT_FALSE(classifier_->SetOverride(id, false));
  EXPECT_FALSE(IsNsfw(id));
  classifier_->RecomputeAll();
  EXPECT_FALSE(IsNsfw(id));

  EXPECT_TRUE(classifier_->SetOverride(id, std::nullopt));
  EXPECT_TRUE(IsNsfw(id));
}

TEST_F(NsfwClassifierTests, UnknownSeriesRejected) {
  EXPECT_THROW(classifier_->Recompute(4242), std::invalid_argument);
  EXPECT_THROW(classifier_->SetOverride(4242, true), std::invalid_argument);
}
};  // namespace inkstone
