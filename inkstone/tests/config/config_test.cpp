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

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "common/library_test_fixation.hpp"
#include "config/library_config.hpp"
#include "config/scan_settings.hpp"
#include "storage/storage_service.hpp"

namespace inkstone {
TEST(LibraryConfigTest, FromJsonAppliesDefaults) {
  auto config = LibraryConfig::FromJson(nlohmann::json{
      {"db_path", "/srv/comics/library.db"}, {"roots", nlohmann::json::array({"/srv/comics/a"})}});
  EXPECT_EQ(config.db_path_, std::filesystem::path("/srv/comics/library.db"));
  ASSERT_EQ(config.roots_.size(), 1u);
  EXPECT_EQ(config.cache_dir_, std::filesystem::path("/srv/comics/cache"));
  EXPECT_EQ(config.ThumbnailDir(), std::filesystem::path("/srv/comics/cache/thumbnails"));
  EXPECT_EQ(config.worker_count_, 4u);
  EXPECT_EQ(config.batch_size_, 100u);
  EXPECT_EQ(config.sidecar_name_, "series.json");
  EXPECT_EQ(config.cover_timeout_, std::chrono::milliseconds(10000));
}

TEST(LibraryConfigTest, RejectsIncompleteOrWrongTypes) {
  auto roots = nlohmann::json::array({"/a"});
  EXPECT_THROW(LibraryConfig::FromJson(nlohmann::json{{"roots", roots}}), std::runtime_error);
  EXPECT_THROW(LibraryConfig::FromJson(nlohmann::json{{"db_path", "/a.db"}}), std::runtime_error);
  EXPECT_THROW(LibraryConfig::FromJson(
                   nlohmann::json{{"db_path", "/a.db"}, {"roots", roots}, {"worker_count", "x"}}),
               std::runtime_error);
  EXPECT_THROW(LibraryConfig::FromJson(
                   nlohmann::json{{"db_path", "/a.db"}, {"roots", roots}, {"batch_size", 0}}),
               std::runtime_error);
  EXPECT_THROW(LibraryConfig::FromJson(nlohmann::json::array()), std::runtime_error);
}

class ConfigFileTests : public LibraryTestBase {};

TEST_F(ConfigFileTests, SaveThenLoad) {
  auto config           = MakeConfig();
  config.cover_timeout_ = std::chrono::milliseconds(250);
  config.max_errors_    = 12;
  auto path             = work_dir_ / "conf" / "library.json";
  config.Save(path);

  auto loaded = LibraryConfig::Load(path);
  EXPECT_EQ(loaded.db_path_, config.db_path_);
  EXPECT_EQ(loaded.roots_, config.roots_);
  EXPECT_EQ(loaded.cache_dir_, config.cache_dir_);
  EXPECT_EQ(loaded.worker_count_, 2u);
  EXPECT_EQ(loaded.batch_size_, 3u);
  EXPECT_EQ(loaded.cover_timeout_, std::chrono::milliseconds(250));
  EXPECT_EQ(loaded.max_errors_, 12u);

  EXPECT_THROW(LibraryConfig::Load(work_dir_ / "missing.json"), std::runtime_error);
}

TEST_F(ConfigFileTests, ScanSettingsFromAdminTable) {
  StorageService storage(db_path_);
  auto&          settings = storage.GetSettingsController();

  auto           defaults = ScanSettings::Load(settings);
  EXPECT_EQ(defaults.thumbnail_.width_, 225);
  EXPECT_EQ(defaults.thumbnail_.height_, 350);
  EXPECT_EQ(defaults.thumbnail_.quality_, 70);
  EXPECT_EQ(defaults.thumbnail_.format_, ThumbnailFormat::WEBP);
  EXPECT_FALSE(defaults.compute_file_hash_);

  settings.Set("thumb_width", "abc");
  settings.Set("thumb_quality", "150");
  settings.Set("thumb_format", "tiff");
  settings.Set("compute_file_hash", " Yes ");
  auto lenient = ScanSettings::Load(settings);
  EXPECT_EQ(lenient.thumbnail_.width_, 225);
  EXPECT_EQ(lenient.thumbnail_.quality_, 100);
  EXPECT_EQ(lenient.thumbnail_.format_, ThumbnailFormat::WEBP);
  EXPECT_TRUE(lenient.compute_file_hash_);

  ThumbnailSettings thumb{300, 400, 85, ThumbnailFormat::JPEG};
  ScanSettings::SaveThumbnailSettings(settings, thumb);
  auto saved = ScanSettings::Load(settings);
  EXPECT_EQ(saved.thumbnail_.width_, 300);
  EXPECT_EQ(saved.thumbnail_.format_, ThumbnailFormat::JPEG);
  EXPECT_EQ(settings.Get("thumb_format"), "jpg");

  EXPECT_THROW(ScanSettings::SaveThumbnailSettings(settings, {0, 400, 85, ThumbnailFormat::PNG}),
               std::invalid_argument);
  EXPECT_THROW(ScanSettings::SaveThumbnailSettings(settings, {300, 400, 0, ThumbnailFormat::PNG}),
               std::invalid_argument);
}
};  // namespace inkstone
