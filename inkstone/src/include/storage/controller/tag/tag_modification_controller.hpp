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

#include <mutex>
#include <vector>

#include "storage/controller/controller_types.hpp"
#include "storage/service/tag/tag_modification_service.hpp"
#include "tags/tag_modification.hpp"
#include "type/type.hpp"

namespace inkstone {
class TagModificationController {
 private:
  ConnectionGuard        _guard;
  TagModificationService _service;
  std::mutex             _mtx;

 public:
  explicit TagModificationController(ConnectionGuard&& guard);

  // One row per source norm, a new action replaces the previous one
  void Put(const TagModification& modification);
  auto Remove(const tag_norm_t& source) -> bool;
  auto GetAll() -> std::vector<TagModification>;
};
};  // namespace inkstone
