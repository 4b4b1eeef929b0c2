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

#include "storage/mapper/tag/tag_modification_mapper.hpp"

#include <stdexcept>

namespace inkstone {
auto TagModificationMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> TagModificationMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for TagModification");
  }
  using str_ptr = std::unique_ptr<std::string>;
  return {TakeField<str_ptr>(data, 0), TakeField<str_ptr>(data, 1), TakeField<str_ptr>(data, 2),
          TakeField<str_ptr>(data, 3)};
}
};  // namespace inkstone
