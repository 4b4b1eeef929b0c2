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

#include <string>
#include <string_view>
#include <variant>

#include "type/type.hpp"

namespace inkstone {
// Excluded from the vocabulary and from matching
struct Blacklist {
  bool operator==(const Blacklist&) const = default;
};

// Canonical display string for the source norm
struct Whitelist {
  std::string display_;
  bool        operator==(const Whitelist&) const = default;
};

// Redirects the source norm to another norm
struct Merge {
  tag_norm_t target_;
  bool       operator==(const Merge&) const = default;
};

using TagAction = std::variant<Blacklist, Whitelist, Merge>;

struct TagModification {
  tag_norm_t source_;
  TagAction  action_;
};

auto ActionName(const TagAction& action) -> std::string_view;
};  // namespace inkstone
