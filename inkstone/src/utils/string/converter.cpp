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

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <utf8.h>

#include "utils/string/convert.hpp"

namespace conv {
auto PathToBytes(const std::filesystem::path& path) -> std::string {
  std::filesystem::path preferred = path;
  preferred.make_preferred();
  auto u8 = preferred.u8string();
  return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
}

auto BytesToPath(const std::string& str) -> std::filesystem::path {
  std::u8string u8(reinterpret_cast<const char8_t*>(str.data()), str.size());
  return std::filesystem::path(u8);
}

auto ToValidUtf8(std::string_view str) -> std::string {
  if (utf8::is_valid(str.begin(), str.end())) {
    return std::string(str);
  }
  std::string repaired;
  utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(repaired));
  return repaired;
}

auto ToLowerAscii(std::string_view str) -> std::string {
  std::string lowered(str);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

auto Trim(std::string_view str) -> std::string {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin    = std::find_if_not(str.begin(), str.end(), is_space);
  auto end      = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
  if (begin >= end) return {};
  return std::string(begin, end);
}
};  // namespace conv
