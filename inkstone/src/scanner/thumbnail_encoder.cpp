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

#include "scanner/thumbnail_encoder.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
auto ToDepth8(const cv::Mat& image) -> cv::Mat {
  if (image.depth() == CV_8U) return image;
  cv::Mat u8;
  switch (image.depth()) {
    case CV_16U:
      image.convertTo(u8, CV_MAKETYPE(CV_8U, image.channels()), 1.0 / 257.0);
      break;
    case CV_32F:
    case CV_64F:
      image.convertTo(u8, CV_MAKETYPE(CV_8U, image.channels()), 255.0);
      break;
    default:
      image.convertTo(u8, CV_MAKETYPE(CV_8U, image.channels()));
      break;
  }
  return u8;
}

// Blend colour over a white background using the 8-bit alpha plane
auto CompositeOnWhite(const cv::Mat& bgr, const cv::Mat& alpha) -> cv::Mat {
  cv::Mat bgr_f, alpha_f;
  bgr.convertTo(bgr_f, CV_32FC3, 1.0 / 255.0);
  alpha.convertTo(alpha_f, CV_32FC1, 1.0 / 255.0);
  cv::Mat alpha3;
  cv::merge(std::vector<cv::Mat>{alpha_f, alpha_f, alpha_f}, alpha3);
  // white * (1 - alpha) is just (1 - alpha)
  cv::Mat background = cv::Scalar::all(1.0) - alpha3;
  cv::Mat blended    = bgr_f.mul(alpha3) + background;
  cv::Mat out;
  blended.convertTo(out, CV_8UC3, 255.0);
  return out;
}
}  // namespace

auto ThumbnailFormatFromString(std::string_view text) -> ThumbnailFormat {
  std::string lowered = conv::ToLowerAscii(conv::Trim(text));
  if (lowered == "webp") return ThumbnailFormat::WEBP;
  if (lowered == "jpeg" || lowered == "jpg") return ThumbnailFormat::JPEG;
  if (lowered == "png") return ThumbnailFormat::PNG;
  if (lowered == "best") return ThumbnailFormat::BEST;
  throw std::invalid_argument(std::format("Unknown thumbnail format '{}'", text));
}

auto ToString(ThumbnailFormat format) -> std::string_view {
  switch (format) {
    case ThumbnailFormat::WEBP:
      return "webp";
    case ThumbnailFormat::JPEG:
      return "jpg";
    case ThumbnailFormat::PNG:
      return "png";
    case ThumbnailFormat::BEST:
      return "best";
  }
  return "webp";
}

ThumbnailEncoder::ThumbnailEncoder(const ThumbnailSettings& settings) : settings_(settings) {
  settings_.width_   = std::max(1, settings_.width_);
  settings_.height_  = std::max(1, settings_.height_);
  settings_.quality_ = std::clamp(settings_.quality_, 1, 100);
}

auto ThumbnailEncoder::FitWithin(const cv::Size& source, int max_width, int max_height)
    -> cv::Size {
  if (source.width <= 0 || source.height <= 0) return source;
  if (source.width <= max_width && source.height <= max_height) return source;
  const double scale = std::min(static_cast<double>(max_width) / source.width,
                                static_cast<double>(max_height) / source.height);
  const int    dst_w = std::max(1, static_cast<int>(std::lround(source.width * scale)));
  const int    dst_h = std::max(1, static_cast<int>(std::lround(source.height * scale)));
  return {std::min(dst_w, max_width), std::min(dst_h, max_height)};
}

auto ThumbnailEncoder::NormalizeColor(const cv::Mat& decoded) -> cv::Mat {
  cv::Mat image = ToDepth8(decoded);
  switch (image.channels()) {
    case 1: {
      cv::Mat bgr;
      cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
      return bgr;
    }
    case 2: {
      std::vector<cv::Mat> planes;
      cv::split(image, planes);
      cv::Mat bgr;
      cv::cvtColor(planes[0], bgr, cv::COLOR_GRAY2BGR);
      return CompositeOnWhite(bgr, planes[1]);
    }
    case 3:
      return image;
    case 4: {
      std::vector<cv::Mat> planes;
      cv::split(image, planes);
      cv::Mat bgr;
      cv::merge(std::vector<cv::Mat>{planes[0], planes[1], planes[2]}, bgr);
      return CompositeOnWhite(bgr, planes[3]);
    }
    default:
      throw std::runtime_error(
          std::format("[ERROR] ThumbnailEncoder: Unsupported channel count {}", image.channels()));
  }
}

auto ThumbnailEncoder::EncodeAs(const cv::Mat& image, ThumbnailFormat format) const
    -> std::vector<uchar> {
  std::vector<uchar> out;
  std::vector<int>   params;
  const char*        ext = ".webp";
  switch (format) {
    case ThumbnailFormat::JPEG:
      ext    = ".jpg";
      params = {cv::IMWRITE_JPEG_QUALITY, settings_.quality_, cv::IMWRITE_JPEG_OPTIMIZE, 1};
      break;
    case ThumbnailFormat::PNG:
      ext    = ".png";
      params = {cv::IMWRITE_PNG_COMPRESSION, 9};
      break;
    default:
      params = {cv::IMWRITE_WEBP_QUALITY, settings_.quality_};
      break;
  }
  if (!cv::imencode(ext, image, out, params) || out.empty()) {
    throw std::runtime_error(std::format("[ERROR] ThumbnailEncoder: Failed to encode {}", ext));
  }
  return out;
}

auto ThumbnailEncoder::Encode(const std::vector<uint8_t>& image_bytes) const -> EncodedThumbnail {
  if (image_bytes.empty()) {
    throw std::runtime_error("[ERROR] ThumbnailEncoder: Empty image data");
  }
  cv::Mat raw(1, static_cast<int>(image_bytes.size()), CV_8UC1,
              const_cast<uint8_t*>(image_bytes.data()));
  cv::Mat decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  if (decoded.empty()) {
    throw std::runtime_error("[ERROR] ThumbnailEncoder: Unable to decode the cover image");
  }

  cv::Mat  image  = NormalizeColor(decoded);
  cv::Size target = FitWithin(image.size(), settings_.width_, settings_.height_);
  if (target != image.size()) {
    cv::Mat resized;
    cv::resize(image, resized, target, 0.0, 0.0, cv::INTER_AREA);
    image = resized;
  }

  EncodedThumbnail result;
  if (settings_.format_ != ThumbnailFormat::BEST) {
    result.bytes_ = EncodeAs(image, settings_.format_);
    result.ext_   = std::string(ToString(settings_.format_));
    return result;
  }

  auto webp = EncodeAs(image, ThumbnailFormat::WEBP);
  auto jpeg = EncodeAs(image, ThumbnailFormat::JPEG);
  if (webp.size() <= jpeg.size()) {
    result.bytes_saved_ = static_cast<int64_t>(jpeg.size() - webp.size());
    result.bytes_       = std::move(webp);
    result.ext_         = "webp";
  } else {
    result.bytes_saved_ = static_cast<int64_t>(webp.size() - jpeg.size());
    result.bytes_       = std::move(jpeg);
    result.ext_         = "jpg";
  }
  return result;
}
};  // namespace inkstone
