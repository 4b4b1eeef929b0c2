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

#include "tags/tag_modification.hpp"

#include <type_traits>

namespace inkstone {
auto ActionName(const TagAction& action) -> std::string_view {
  return std::visit(
      [](const auto& a) -> std::string_view {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, Blacklist>) {
          return "blacklist";
        } else if constexpr (std::is_same_v<T, Whitelist>) {
          return "whitelist";
        } else {
          return "merge";
        }
      },
      action);
}
};  // namespace inkstone
