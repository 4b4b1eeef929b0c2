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

#include <algorithm>
#include <string>
#include <vector>

#include "library/series.hpp"
#include "tags/metadata_cache.hpp"
#include "tags/tag_graph.hpp"
#include "tags/tag_normalizer.hpp"
#include "tags/tag_resolver.hpp"

namespace inkstone {
namespace {
auto MakeSeries(series_id_t id, const std::string& name, std::vector<std::string> tags,
                std::optional<std::string> synopsis = std::nullopt) -> Series {
  Series series;
  series.id_       = id;
  series.name_     = name;
  series.tags_     = std::move(tags);
  series.synopsis_ = std::move(synopsis);
  return series;
}

auto Contains(const std::vector<tag_norm_t>& norms, const tag_norm_t& norm) -> bool {
  return std::find(norms.begin(), norms.end(), norm) != norms.end();
}
}  // namespace

TEST(TagResolverTest, FollowsMergeChains) {
  TagResolver resolver({{"scifi", Merge{"sci fi"}}, {"sci fi", Merge{"science fiction"}}});
  EXPECT_EQ(resolver.Resolve("scifi"), "science fiction");
  EXPECT_EQ(resolver.Resolve("sci fi"), "science fiction");
  EXPECT_EQ(resolver.Resolve("science fiction"), "science fiction");
  EXPECT_EQ(resolver.Resolve("romance"), "romance");
}

TEST(TagResolverTest, CycleSettlesOnSmallestNorm) {
  TagResolver resolver({{"b", Merge{"a"}}, {"a", Merge{"b"}}});
  EXPECT_EQ(resolver.Resolve("a"), "a");
  EXPECT_EQ(resolver.Resolve("b"), "a");

  TagResolver longer({{"zeta", Merge{"eta"}}, {"eta", Merge{"theta"}}, {"theta", Merge{"zeta"}}});
  EXPECT_EQ(longer.Resolve("zeta"), "eta");
  EXPECT_EQ(longer.Resolve("theta"), "eta");
}

TEST(TagResolverTest, BlacklistHidesSourceAndMergedTags) {
  TagResolver resolver({{"gore", Blacklist{}}, {"guro", Merge{"gore"}}, {"self", Merge{"self"}}});
  EXPECT_FALSE(resolver.Resolve("gore").has_value());
  EXPECT_FALSE(resolver.Resolve("guro").has_value());
  EXPECT_TRUE(resolver.IsBlacklisted("guro"));
  EXPECT_EQ(resolver.Resolve("self"), "self");
  EXPECT_FALSE(resolver.Resolve("").has_value());
}

TEST(TagResolverTest, WhitelistProvidesDisplay) {
  TagResolver resolver({{"sci fi", Whitelist{"Sci-Fi"}}});
  EXPECT_EQ(resolver.DisplayOverride("sci fi"), "Sci-Fi");
  EXPECT_FALSE(resolver.DisplayOverride("romance").has_value());
  EXPECT_EQ(resolver.Resolve("sci fi"), "sci fi");
}

TEST(TagGraphTest, ContainmentOnWholeWords) {
  auto containment =
      ComputeContainment({"fantasy", "isekai fantasy", "dark fantasy romance", "romance", "fan"});
  ASSERT_TRUE(containment.contains("isekai fantasy"));
  EXPECT_EQ(containment.at("isekai fantasy"), (std::vector<tag_norm_t>{"fantasy"}));
  EXPECT_EQ(containment.at("dark fantasy romance"),
            (std::vector<tag_norm_t>{"fantasy", "romance"}));
  EXPECT_FALSE(containment.contains("fantasy"));
}

TEST(TagGraphTest, FreeTextMatchesPluralLastWord) {
  auto index  = BuildFirstWordIndex({"video game", "romance", "ai", "magic school"});
  auto tokens = FoldTokens("A boy who loves Video Games finds Romance at magic schools.");
  auto hits   = MatchFreeText(tokens, index);
  EXPECT_TRUE(Contains(hits, "video game"));
  EXPECT_TRUE(Contains(hits, "romance"));
  EXPECT_TRUE(Contains(hits, "magic school"));
  // Too short to be indexed
  EXPECT_FALSE(index.contains("ai"));
}

TEST(TagGraphTest, FreeTextRespectsWordBoundaries) {
  auto index = BuildFirstWordIndex({"art", "war"});
  auto hits  = MatchFreeText(FoldTokens("Startup warfare"), index);
  EXPECT_TRUE(hits.empty());
}

TEST(TagSnapshotTest, ExpandsTextMatchesAndParents) {
  std::vector<Series> series = {
      MakeSeries(1, "Alpha", {"Isekai Fantasy", "fantasy"}),
      MakeSeries(2, "Beta", {"romance"}, "He plays video games all day."),
      MakeSeries(3, "Gamma", {"Video Games", "Romance"}),
  };
  auto snapshot = TagSnapshot::Build(series, {}, {{1, {"c1", "c2"}}});

  EXPECT_EQ(snapshot.vocabulary_.size(), 4u);
  EXPECT_EQ(snapshot.vocabulary_.at("romance"), "Romance");
  EXPECT_EQ(snapshot.vocabulary_.at("video game"), "Video Games");
  EXPECT_EQ(snapshot.series_counts_.at("romance"), 2);
  EXPECT_EQ(snapshot.series_counts_.at("video game"), 2);
  EXPECT_EQ(snapshot.series_counts_.at("fantasy"), 1);

  ASSERT_EQ(snapshot.series_.size(), 3u);
  EXPECT_EQ(snapshot.series_[0].leading_comics_, (std::vector<comic_id_t>{"c1", "c2"}));
  EXPECT_TRUE(Contains(snapshot.series_[1].expanded_, "video game"));
  EXPECT_TRUE(std::is_sorted(snapshot.series_[0].expanded_.begin(),
                             snapshot.series_[0].expanded_.end()));
}

TEST(TagSnapshotTest, ParentAddedOneLevel) {
  std::vector<Series> series = {
      MakeSeries(1, "Alpha", {"Isekai Fantasy"}),
      MakeSeries(2, "Beta", {"Fantasy"}),
  };
  auto snapshot = TagSnapshot::Build(series, {}, {});
  EXPECT_TRUE(Contains(snapshot.series_[0].expanded_, "fantasy"));
  EXPECT_EQ(snapshot.series_counts_.at("fantasy"), 2);
  EXPECT_EQ(snapshot.series_counts_.at("isekai fantasy"), 1);
}

TEST(TagSnapshotTest, ModificationsShapeVocabulary) {
  std::vector<Series> series = {
      MakeSeries(1, "Alpha", {"Sci Fi", "Gore"}),
      MakeSeries(2, "Beta", {"Science Fiction"}),
  };
  auto snapshot = TagSnapshot::Build(
      series,
      {{"sci fi", Merge{"science fiction"}},
       {"gore", Blacklist{}},
       {"science fiction", Whitelist{"SF"}}},
      {});
  EXPECT_FALSE(snapshot.vocabulary_.contains("gore"));
  EXPECT_FALSE(snapshot.vocabulary_.contains("sci fi"));
  EXPECT_EQ(snapshot.vocabulary_.at("science fiction"), "SF");
  EXPECT_EQ(snapshot.series_counts_.at("science fiction"), 2);
}
};  // namespace inkstone
