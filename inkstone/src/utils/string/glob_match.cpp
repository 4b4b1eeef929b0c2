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

#include "utils/string/glob_match.hpp"

#include <fnmatch.h>

#include <cstddef>
#include <string>

namespace inkstone {
auto GlobMatch(std::string_view pattern, std::string_view text) -> bool {
  const std::string pattern_str(pattern);
  const std::string text_str(text);
  return ::fnmatch(pattern_str.c_str(), text_str.c_str(), FNM_CASEFOLD) == 0;
}

auto IsValidGlob(std::string_view pattern) -> bool {
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] != '[') continue;
    size_t j = i + 1;
    if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) ++j;
    // A ']' right after the opening bracket is a member, not the end
    if (j < pattern.size() && pattern[j] == ']') ++j;
    while (j < pattern.size() && pattern[j] != ']') ++j;
    if (j >= pattern.size()) return false;
    i = j;
  }
  return true;
}
};  // namespace inkstone
