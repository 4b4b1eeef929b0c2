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

#include <filesystem>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <vector>

#include "common/library_test_fixation.hpp"
#include "scanner/thumbnail_encoder.hpp"
#include "scanner/thumbnail_store.hpp"

namespace inkstone {
TEST(ThumbnailEncoderTest, FitWithinKeepsAspectAndNeverUpscales) {
  EXPECT_EQ(ThumbnailEncoder::FitWithin({100, 120}, 225, 350), cv::Size(100, 120));
  EXPECT_EQ(ThumbnailEncoder::FitWithin({900, 1400}, 225, 350), cv::Size(225, 350));
  EXPECT_EQ(ThumbnailEncoder::FitWithin({2000, 1200}, 225, 350), cv::Size(225, 135));
  EXPECT_EQ(ThumbnailEncoder::FitWithin({300, 450}, 225, 350), cv::Size(225, 338));
}

TEST(ThumbnailEncoderTest, FormatNames) {
  EXPECT_EQ(ThumbnailFormatFromString(" JPEG "), ThumbnailFormat::JPEG);
  EXPECT_EQ(ThumbnailFormatFromString("best"), ThumbnailFormat::BEST);
  EXPECT_EQ(ToString(ThumbnailFormat::JPEG), "jpg");
  EXPECT_THROW(ThumbnailFormatFromString("gif"), std::invalid_argument);
}

TEST(ThumbnailEncoderTest, TransparentPixelsBecomeWhite) {
  cv::Mat rgba(4, 4, CV_8UC4, cv::Scalar(0, 0, 0, 0));
  cv::Mat bgr = ThumbnailEncoder::NormalizeColor(rgba);
  ASSERT_EQ(bgr.type(), CV_8UC3);
  EXPECT_EQ(bgr.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 255, 255));

  cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(10));
  EXPECT_EQ(ThumbnailEncoder::NormalizeColor(gray).channels(), 3);
}

TEST(ThumbnailEncoderTest, EncodesPngAndRejectsGarbage) {
  ThumbnailSettings settings;
  settings.format_ = ThumbnailFormat::PNG;
  ThumbnailEncoder encoder(settings);
  auto             page  = MakePage(450, 700);
  auto             thumb = encoder.Encode(std::vector<uint8_t>(page.begin(), page.end()));
  EXPECT_EQ(thumb.ext_, "png");
  cv::Mat decoded = cv::imdecode(thumb.bytes_, cv::IMREAD_UNCHANGED);
  EXPECT_EQ(decoded.cols, 225);
  EXPECT_EQ(decoded.rows, 350);

  EXPECT_THROW(encoder.Encode({1, 2, 3, 4}), std::runtime_error);
}

class ThumbnailStoreTests : public LibraryTestBase {};

TEST_F(ThumbnailStoreTests, FirstWriterWins) {
  ThumbnailStore   store(cache_dir_ / "thumbnails");
  EncodedThumbnail first{{1, 2, 3}, "jpg", 0};
  EncodedThumbnail second{{4, 5, 6, 7}, "png", 0};

  EXPECT_FALSE(store.Find("c1").has_value());
  EXPECT_TRUE(store.Install("c1", first, false));
  EXPECT_FALSE(store.Install("c1", second, false));

  auto found = store.Find("c1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, store.PathFor("c1", "jpg"));
  EXPECT_EQ(std::filesystem::file_size(*found), 3u);

  // Only installed files remain, no temp leftovers
  size_t files = 0;
  for (const auto& entry : std::filesystem::directory_iterator(store.Dir())) {
    (void)entry;
    ++files;
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(ThumbnailStoreTests, ReplaceDropsOtherFormats) {
  ThumbnailStore store(cache_dir_ / "thumbnails");
  store.Install("c1", EncodedThumbnail{{1, 2, 3}, "jpg", 0}, false);
  EXPECT_TRUE(store.Install("c1", EncodedThumbnail{{9, 9}, "png", 0}, true));
  EXPECT_FALSE(std::filesystem::exists(store.PathFor("c1", "jpg")));
  auto found = store.Find("c1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->extension(), ".png");
}
};  // namespace inkstone
