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
#include <optional>
#include <string>
#include <string_view>

namespace inkstone {
struct FilenameInfo {
  std::optional<double> volume_;
  std::optional<double> chapter_;
};

/**
 * @brief Parse "v12", "vol. 3", "c45", "ch 7", "chapter 10.5", "unit 3" out of a file name.
 *        A trailing number is taken as the chapter when nothing else matched.
 *
 * @param filename file name with or without extension
 * @return FilenameInfo
 */
auto ParseFilenameInfo(std::string_view filename) -> FilenameInfo;

/**
 * @brief Series name guessed from a file name: extension dropped, then everything from the first
 *        volume/chapter token onwards.
 */
auto DeriveSeriesName(std::string_view filename) -> std::string;

auto FormatFileSize(uint64_t size_bytes) -> std::string;
};  // namespace inkstone
