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

#include "utils/string/filename_parser.hpp"

#include <array>
#include <format>
#include <regex>
#include <string>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
const std::regex volume_pattern(R"(\bv(?:ol)?\.?\s*(\d+(?:\.\d+)?))", std::regex::icase);
const std::regex chapter_pattern(R"(\b(?:c|ch|chapter|unit)\.?\s*(\d+(?:\.\d+)?))",
                                 std::regex::icase);
const std::regex trailing_number_pattern(R"(\s(\d+(?:\.\d+)?)$)");
const std::regex series_suffix_pattern(R"(\s*\b(v|c|vol|chapter|ch)\s*\.?\s*\d+.*$)",
                                       std::regex::icase);

auto StripExtension(std::string_view filename) -> std::string {
  auto dot = filename.find_last_of('.');
  if (dot == std::string_view::npos || dot == 0) {
    return std::string(filename);
  }
  return std::string(filename.substr(0, dot));
}
}  // namespace

auto ParseFilenameInfo(std::string_view filename) -> FilenameInfo {
  FilenameInfo info;
  std::string  name = StripExtension(filename);
  std::smatch  match;

  if (std::regex_search(name, match, volume_pattern)) {
    info.volume_ = std::stod(match[1].str());
  }
  if (std::regex_search(name, match, chapter_pattern)) {
    info.chapter_ = std::stod(match[1].str());
  }
  if (!info.volume_ && !info.chapter_ && std::regex_search(name, match, trailing_number_pattern)) {
    info.chapter_ = std::stod(match[1].str());
  }
  return info;
}

auto DeriveSeriesName(std::string_view filename) -> std::string {
  std::string name     = StripExtension(filename);
  std::string stripped = conv::Trim(std::regex_replace(name, series_suffix_pattern, ""));
  // "v01.cbz" would otherwise leave an empty series name
  return stripped.empty() ? conv::Trim(name) : stripped;
}

auto FormatFileSize(uint64_t size_bytes) -> std::string {
  static constexpr std::array<const char*, 4> units = {"B", "KB", "MB", "GB"};
  double                                      size  = static_cast<double>(size_bytes);
  for (const char* unit : units) {
    if (size < 1024.0) {
      return std::format("{:.1f} {}", size, unit);
    }
    size /= 1024.0;
  }
  return std::format("{:.1f} TB", size);
}
};  // namespace inkstone
