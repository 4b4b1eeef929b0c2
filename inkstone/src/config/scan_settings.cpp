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

#include "config/scan_settings.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
void ReadInt(SettingsController& settings, const char* key, int& target) {
  auto value = settings.Get(key);
  if (!value) return;
  auto text   = conv::Trim(*value);
  int  parsed = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc{} || ptr != text.data() + text.size() || parsed <= 0) {
    std::cerr << std::format("[WARN] ScanSettings: Ignoring {}='{}', using {}\n", key, *value,
                             target);
    return;
  }
  target = parsed;
}
}  // namespace

auto ScanSettings::Load(SettingsController& settings) -> ScanSettings {
  ScanSettings result;
  ReadInt(settings, "thumb_width", result.thumbnail_.width_);
  ReadInt(settings, "thumb_height", result.thumbnail_.height_);
  ReadInt(settings, "thumb_quality", result.thumbnail_.quality_);
  if (result.thumbnail_.quality_ > 100) result.thumbnail_.quality_ = 100;

  if (auto format = settings.Get("thumb_format")) {
    try {
      result.thumbnail_.format_ = ThumbnailFormatFromString(conv::Trim(*format));
    } catch (const std::invalid_argument& e) {
      std::cerr << std::format("[WARN] ScanSettings: {}, using webp\n", e.what());
    }
  }
  if (auto hash = settings.Get("compute_file_hash")) {
    auto flag                 = conv::ToLowerAscii(conv::Trim(*hash));
    result.compute_file_hash_ = flag == "true" || flag == "1" || flag == "yes" || flag == "on";
  }
  return result;
}

void ScanSettings::SaveThumbnailSettings(SettingsController&      settings,
                                         const ThumbnailSettings& thumb) {
  if (thumb.width_ <= 0 || thumb.height_ <= 0) {
    throw std::invalid_argument(std::format(
        "[ERROR] ScanSettings: Thumbnail size {}x{} is invalid", thumb.width_, thumb.height_));
  }
  if (thumb.quality_ < 1 || thumb.quality_ > 100) {
    throw std::invalid_argument(
        std::format("[ERROR] ScanSettings: Thumbnail quality {} is outside 1..100", thumb.quality_));
  }
  settings.Set("thumb_width", std::to_string(thumb.width_));
  settings.Set("thumb_height", std::to_string(thumb.height_));
  settings.Set("thumb_quality", std::to_string(thumb.quality_));
  settings.Set("thumb_format", std::string(ToString(thumb.format_)));
}
};  // namespace inkstone
