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

#include <filesystem>
#include <string>
#include <string_view>

namespace conv {
/**
 * @brief UTF-8 bytes of a path in its native (preferred-separator) form
 */
auto PathToBytes(const std::filesystem::path& path) -> std::string;
auto BytesToPath(const std::string& str) -> std::filesystem::path;

/**
 * @brief Replace ill-formed UTF-8 sequences with U+FFFD. DuckDB rejects invalid VARCHARs.
 */
auto ToValidUtf8(std::string_view str) -> std::string;

auto ToLowerAscii(std::string_view str) -> std::string;
auto Trim(std::string_view str) -> std::string;
};  // namespace conv
