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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>

namespace fs = std::filesystem;

namespace inkstone {
static const std::unordered_set<std::string> archive_extensions    = {".cbz", ".cbr"};

static const std::unordered_set<std::string> page_image_extensions = {".jpg", ".jpeg", ".png",
                                                                      ".gif", ".bmp",  ".webp"};

inline auto lower_extension(std::string_view name) -> std::string {
  auto dot   = name.find_last_of('.');
  auto slash = name.find_last_of("/\\");
  if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
    return {};
  }
  std::string ext(name.substr(dot));
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

// Extension check only, the caller has already stat'ed the entry
inline bool is_comic_archive(const fs::path& path) {
  return archive_extensions.count(lower_extension(path.filename().string())) > 0;
}

/**
 * @brief Whether an archive entry counts as a page. Resource forks and dot-files are skipped.
 */
inline bool is_page_image(std::string_view entry_name) {
  if (entry_name.empty() || entry_name.back() == '/') return false;
  if (entry_name.starts_with("__MACOSX/") || entry_name.find("/__MACOSX/") != std::string_view::npos) {
    return false;
  }
  auto slash = entry_name.find_last_of("/\\");
  auto base  = slash == std::string_view::npos ? entry_name : entry_name.substr(slash + 1);
  if (base.empty() || base.front() == '.') return false;
  return page_image_extensions.count(lower_extension(base)) > 0;
}
};  // namespace inkstone
