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

#include "utils/string/natural_sort.hpp"

#include <algorithm>
#include <cctype>

namespace inkstone {
namespace {
auto IsDigit(char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

auto LowerChar(char c) -> char {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

/**
 * @brief Compare two digit runs by numeric value without converting them, so arbitrarily long
 *        runs cannot overflow. Returns <0, 0 or >0.
 */
auto CompareDigitRuns(std::string_view a, std::string_view b) -> int {
  auto strip = [](std::string_view run) {
    size_t first = run.find_first_not_of('0');
    return first == std::string_view::npos ? std::string_view{} : run.substr(first);
  };
  auto sa = strip(a);
  auto sb = strip(b);
  if (sa.size() != sb.size()) {
    return sa.size() < sb.size() ? -1 : 1;
  }
  int cmp = sa.compare(sb);
  if (cmp != 0) return cmp;
  // Same value, fewer leading zeros first
  if (a.size() != b.size()) {
    return a.size() < b.size() ? -1 : 1;
  }
  return 0;
}
}  // namespace

auto NaturalLess(std::string_view lhs, std::string_view rhs) -> bool {
  size_t i = 0;
  size_t j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    if (IsDigit(lhs[i]) && IsDigit(rhs[j])) {
      size_t i_end = i;
      size_t j_end = j;
      while (i_end < lhs.size() && IsDigit(lhs[i_end])) ++i_end;
      while (j_end < rhs.size() && IsDigit(rhs[j_end])) ++j_end;
      int cmp = CompareDigitRuns(lhs.substr(i, i_end - i), rhs.substr(j, j_end - j));
      if (cmp != 0) return cmp < 0;
      i = i_end;
      j = j_end;
      continue;
    }
    char a = LowerChar(lhs[i]);
    char b = LowerChar(rhs[j]);
    if (a != b) return a < b;
    ++i;
    ++j;
  }
  if ((lhs.size() - i) != (rhs.size() - j)) {
    return (lhs.size() - i) < (rhs.size() - j);
  }
  // Equal under the natural key, fall back to the raw bytes to keep the order total
  return lhs < rhs;
}

void NaturalSort(std::vector<std::string>& names) {
  std::sort(names.begin(), names.end(),
            [](const std::string& a, const std::string& b) { return NaturalLess(a, b); });
}
};  // namespace inkstone
