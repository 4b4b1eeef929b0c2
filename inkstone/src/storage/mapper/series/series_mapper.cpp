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

#include "storage/mapper/series/series_mapper.hpp"

#include <stdexcept>

namespace inkstone {
using str_ptr = std::unique_ptr<std::string>;
using opt_i64 = std::optional<int64_t>;

auto SeriesMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> SeriesMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Series");
  }
  return {TakeField<int64_t>(data, 0),
          TakeField<str_ptr>(data, 1),
          TakeField<str_ptr>(data, 2),
          TakeField<str_ptr>(data, 3),
          TakeField<str_ptr>(data, 4),
          TakeField<str_ptr>(data, 5),
          TakeField<str_ptr>(data, 6),
          TakeField<str_ptr>(data, 7),
          TakeField<str_ptr>(data, 8),
          TakeField<str_ptr>(data, 9),
          TakeField<str_ptr>(data, 10),
          TakeField<str_ptr>(data, 11),
          TakeField<opt_i64>(data, 12),
          TakeField<opt_i64>(data, 13),
          TakeField<opt_i64>(data, 14),
          TakeField<opt_i64>(data, 15),
          TakeField<opt_i64>(data, 16),
          TakeField<str_ptr>(data, 17),
          TakeField<str_ptr>(data, 18),
          TakeField<str_ptr>(data, 19),
          TakeField<bool>(data, 20),
          TakeField<bool>(data, 21),
          TakeField<std::optional<bool>>(data, 22)};
}
};  // namespace inkstone
