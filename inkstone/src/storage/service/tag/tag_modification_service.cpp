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

#include "storage/service/tag/tag_modification_service.hpp"

#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace inkstone {
auto TagModificationService::ToParams(const TagModification& source)
    -> TagModificationMapperParams {
  TagModificationMapperParams params{std::make_unique<std::string>(source.source_),
                                     std::make_unique<std::string>(ActionName(source.action_)),
                                     nullptr, nullptr};
  if (const auto* merge = std::get_if<Merge>(&source.action_)) {
    params.target_norm = std::make_unique<std::string>(merge->target_);
  } else if (const auto* white = std::get_if<Whitelist>(&source.action_)) {
    params.display_name = std::make_unique<std::string>(white->display_);
  }
  return params;
}

auto TagModificationService::FromParams(TagModificationMapperParams&& param) -> TagModification {
  TagModification modification;
  modification.source_ = param.source_norm ? std::move(*param.source_norm) : std::string{};
  std::string action   = param.action ? *param.action : std::string{};
  if (action == "blacklist") {
    modification.action_ = Blacklist{};
  } else if (action == "whitelist") {
    modification.action_ =
        Whitelist{param.display_name ? std::move(*param.display_name) : modification.source_};
  } else if (action == "merge") {
    if (!param.target_norm || param.target_norm->empty()) {
      throw std::runtime_error(std::format(
          "[ERROR] TagModificationService: Merge of '{}' has no target", modification.source_));
    }
    modification.action_ = Merge{std::move(*param.target_norm)};
  } else {
    throw std::runtime_error(std::format(
        "[ERROR] TagModificationService: Unknown tag action '{}' for '{}'", action,
        modification.source_));
  }
  return modification;
}

auto TagModificationService::GetAllModifications() -> std::vector<TagModification> {
  return GetByPredicate("true ORDER BY source_norm");
}
};  // namespace inkstone
