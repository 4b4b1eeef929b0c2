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

#pragma once

#include <cstdint>
#include <opencv2/core.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace inkstone {
enum class ThumbnailFormat : uint8_t {
  WEBP = 0,  // DEFAULT
  JPEG,
  PNG,
  BEST  // encode WEBP and JPEG, keep the smaller
};

/**
 * @brief Parse the thumb_format admin setting
 *
 * @throws std::invalid_argument for an unknown format name
 */
auto ThumbnailFormatFromString(std::string_view text) -> ThumbnailFormat;
auto ToString(ThumbnailFormat format) -> std::string_view;

struct ThumbnailSettings {
  int             width_   = 225;
  int             height_  = 350;
  int             quality_ = 70;
  ThumbnailFormat format_  = ThumbnailFormat::WEBP;
};

struct EncodedThumbnail {
  std::vector<uchar> bytes_;
  // "webp", "jpg" or "png"
  std::string        ext_;
  // Size difference to the discarded candidate in BEST mode, 0 otherwise
  int64_t            bytes_saved_ = 0;
};

class ThumbnailEncoder {
 public:
  explicit ThumbnailEncoder(const ThumbnailSettings& settings);

  /**
   * @brief Decode a page image, shrink it into the configured box and encode it
   *
   * @param image_bytes encoded page as stored in the archive
   * @return EncodedThumbnail
   * @throws std::runtime_error when OpenCV cannot decode or encode the image
   */
  auto Encode(const std::vector<uint8_t>& image_bytes) const -> EncodedThumbnail;

  // Largest size inside the box with the source aspect ratio, never larger than the source
  static auto FitWithin(const cv::Size& source, int max_width, int max_height) -> cv::Size;

  /**
   * @brief 8-bit 3-channel BGR: alpha is composited on white, grey expanded, deeper formats
   *        scaled down
   */
  static auto NormalizeColor(const cv::Mat& decoded) -> cv::Mat;

 private:
  auto              EncodeAs(const cv::Mat& image, ThumbnailFormat format) const
      -> std::vector<uchar>;

  ThumbnailSettings settings_;
};
};  // namespace inkstone
