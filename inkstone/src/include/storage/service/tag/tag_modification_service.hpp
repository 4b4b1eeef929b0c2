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

#include <duckdb.h>

#include <vector>

#include "storage/mapper/tag/tag_modification_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "tags/tag_modification.hpp"
#include "type/type.hpp"

namespace inkstone {
class TagModificationService
    : public ServiceInterface<TagModificationService, TagModification,
                              TagModificationMapperParams, TagModificationMapper, tag_norm_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const TagModification& source) -> TagModificationMapperParams;
  /**
   * @brief Rebuild the variant from the action column
   *
   * @throws std::runtime_error on an unknown action or a merge without a target
   */
  static auto FromParams(TagModificationMapperParams&& param) -> TagModification;

  auto        GetAllModifications() -> std::vector<TagModification>;
};
};  // namespace inkstone
