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

#include <string_view>

namespace inkstone {
/**
 * @brief Shell-style wildcard match through fnmatch(3), case-insensitive. A '[' without a
 *        closing ']' matches itself, use IsValidGlob() to reject such patterns up front.
 */
auto GlobMatch(std::string_view pattern, std::string_view text) -> bool;

auto IsValidGlob(std::string_view pattern) -> bool;
};  // namespace inkstone
