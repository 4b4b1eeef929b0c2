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

#include "tags/tag_normalizer.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <nlohmann/json.hpp>
#include <unordered_set>
#include <utf8.h>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
constexpr int max_unwrap_depth = 8;

struct FoldRange {
  uint32_t    first_;
  uint32_t    last_;
  const char* ascii_;
};

// Latin-1 Supplement and Latin Extended-A letters, already lowercase
constexpr std::array<FoldRange, 52> latin_folds = {{
    {0x00C0, 0x00C5, "a"},  {0x00C6, 0x00C6, "ae"}, {0x00C7, 0x00C7, "c"},
    {0x00C8, 0x00CB, "e"},  {0x00CC, 0x00CF, "i"},  {0x00D0, 0x00D0, "d"},
    {0x00D1, 0x00D1, "n"},  {0x00D2, 0x00D6, "o"},  {0x00D8, 0x00D8, "o"},
    {0x00D9, 0x00DC, "u"},  {0x00DD, 0x00DD, "y"},  {0x00DE, 0x00DE, "th"},
    {0x00DF, 0x00DF, "ss"}, {0x00E0, 0x00E5, "a"},  {0x00E6, 0x00E6, "ae"},
    {0x00E7, 0x00E7, "c"},  {0x00E8, 0x00EB, "e"},  {0x00EC, 0x00EF, "i"},
    {0x00F0, 0x00F0, "d"},  {0x00F1, 0x00F1, "n"},  {0x00F2, 0x00F6, "o"},
    {0x00F8, 0x00F8, "o"},  {0x00F9, 0x00FC, "u"},  {0x00FD, 0x00FD, "y"},
    {0x00FE, 0x00FE, "th"}, {0x00FF, 0x00FF, "y"},  {0x0100, 0x0105, "a"},
    {0x0106, 0x010D, "c"},  {0x010E, 0x0111, "d"},  {0x0112, 0x011B, "e"},
    {0x011C, 0x0123, "g"},  {0x0124, 0x0127, "h"},  {0x0128, 0x0131, "i"},
    {0x0132, 0x0133, "ij"}, {0x0134, 0x0135, "j"},  {0x0136, 0x0138, "k"},
    {0x0139, 0x0142, "l"},  {0x0143, 0x014B, "n"},  {0x014C, 0x0151, "o"},
    {0x0152, 0x0153, "oe"}, {0x0154, 0x0159, "r"},  {0x015A, 0x0161, "s"},
    {0x0162, 0x0167, "t"},  {0x0168, 0x0173, "u"},  {0x0174, 0x0175, "w"},
    {0x0176, 0x0178, "y"},  {0x0179, 0x017E, "z"},  {0x017F, 0x017F, "s"},
    // Latin-1 punctuation and symbols, multiplication and division signs
    {0x00A0, 0x00BF, nullptr}, {0x00D7, 0x00D7, nullptr}, {0x00F7, 0x00F7, nullptr},
    {0xFFFD, 0xFFFD, nullptr},
}};

const std::unordered_set<std::string> singular_exceptions = {
    "series",  "species", "news",   "status",  "chaos",    "canvas", "atlas",
    "bias",    "lens",    "virus",  "genius",  "bonus",    "corpus", "campus",
    "analysis", "crisis", "oasis",  "tennis",  "genesis",  "thesis", "basis"};

auto IsSeparator(uint32_t cp) -> bool {
  return (cp >= 0x2000 && cp <= 0x206F) || (cp >= 0x3000 && cp <= 0x303F) ||
         (cp >= 0xFE00 && cp <= 0xFE0F);
}

auto IsCombiningMark(uint32_t cp) -> bool { return cp >= 0x0300 && cp <= 0x036F; }

auto LowerNonLatin(uint32_t cp) -> uint32_t {
  // Greek capitals (U+03A2 is unassigned)
  if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
  if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
  if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
  return cp;
}

auto EndsWith(const std::string& text, std::string_view suffix) -> bool {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto UnwrapJson(const nlohmann::json& value, int depth) -> std::string {
  if (depth > max_unwrap_depth) return {};
  if (value.is_string()) {
    auto text = value.get<std::string>();
    auto trimmed = conv::Trim(text);
    if (!trimmed.empty() && trimmed.front() == '[') {
      auto inner = nlohmann::json::parse(trimmed, nullptr, false);
      if (!inner.is_discarded()) return UnwrapJson(inner, depth + 1);
    }
    return text;
  }
  if (value.is_array()) {
    if (value.empty()) return {};
    return UnwrapJson(value.front(), depth + 1);
  }
  if (value.is_number() || value.is_boolean()) return value.dump();
  return {};
}
}  // namespace

auto UnwrapTagScalar(std::string_view raw) -> std::string {
  auto trimmed = conv::Trim(raw);
  if (trimmed.empty() || trimmed.front() != '[') return std::string(raw);
  auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
  if (parsed.is_discarded()) return std::string(raw);
  return UnwrapJson(parsed, 0);
}

auto FoldTokens(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  std::string              current;
  auto                     flush = [&]() {
    if (!current.empty()) tokens.push_back(std::move(current));
    current.clear();
  };

  std::string valid = conv::ToValidUtf8(text);
  auto        it    = valid.begin();
  while (it != valid.end()) {
    uint32_t cp = utf8::next(it, valid.end());
    if (cp < 0x80) {
      auto c = static_cast<unsigned char>(cp);
      if (std::isalnum(c)) {
        current.push_back(static_cast<char>(std::tolower(c)));
      } else {
        flush();
      }
      continue;
    }
    if (IsCombiningMark(cp)) continue;
    if (IsSeparator(cp)) {
      flush();
      continue;
    }
    bool folded = false;
    for (const auto& range : latin_folds) {
      if (cp >= range.first_ && cp <= range.last_) {
        if (range.ascii_ == nullptr) {
          flush();
        } else {
          current.append(range.ascii_);
        }
        folded = true;
        break;
      }
    }
    if (folded) continue;
    // Other scripts are kept as letters
    utf8::append(static_cast<char32_t>(LowerNonLatin(cp)), std::back_inserter(current));
  }
  flush();
  return tokens;
}

auto SingularizeToken(const std::string& token) -> std::string {
  if (token.size() <= 3 || singular_exceptions.contains(token)) return token;
  if (EndsWith(token, "ies")) return token.substr(0, token.size() - 3) + "y";
  if (EndsWith(token, "sses") || EndsWith(token, "xes") || EndsWith(token, "ches") ||
      EndsWith(token, "shes")) {
    return token.substr(0, token.size() - 2);
  }
  // "houses" -> "house", keeps the result stable under a second pass
  if (EndsWith(token, "ses")) return token.substr(0, token.size() - 1);
  if (token.back() == 's' && token[token.size() - 2] != 's') {
    return token.substr(0, token.size() - 1);
  }
  return token;
}

auto NormalizeTag(std::string_view raw) -> tag_norm_t {
  auto tokens = FoldTokens(UnwrapTagScalar(raw));
  while (tokens.size() > 1 && tokens.back() == "s") tokens.pop_back();
  if (tokens.empty()) return {};
  tokens.back() = SingularizeToken(tokens.back());

  tag_norm_t norm;
  for (const auto& token : tokens) {
    if (!norm.empty()) norm.push_back(' ');
    norm.append(token);
  }
  return norm;
}

auto SanitizeDisplay(std::string_view raw) -> std::string {
  auto        valid = conv::ToValidUtf8(UnwrapTagScalar(raw));
  std::string display;
  bool        pending_space = false;
  for (char c : valid) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !display.empty();
      continue;
    }
    if (pending_space) display.push_back(' ');
    pending_space = false;
    display.push_back(c);
  }
  return display;
}

auto SplitNorm(const tag_norm_t& norm) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  size_t                   start = 0;
  while (start <= norm.size()) {
    auto end = norm.find(' ', start);
    if (end == tag_norm_t::npos) end = norm.size();
    if (end > start) tokens.push_back(norm.substr(start, end - start));
    start = end + 1;
  }
  return tokens;
}
};  // namespace inkstone
