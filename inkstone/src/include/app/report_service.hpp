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
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "library/comic.hpp"
#include "storage/storage_service.hpp"

namespace inkstone {
struct DuplicateGroup {
  std::string        file_hash_;
  std::vector<Comic> comics_;
};

enum class GapKind : uint8_t { CHAPTER = 0, VOLUME };

struct GapReport {
  std::string          series_;
  GapKind              kind_ = GapKind::CHAPTER;
  std::vector<int64_t> gaps_;
};

auto ToString(GapKind kind) -> std::string_view;

class ReportService {
 private:
  std::shared_ptr<StorageService> storage_;

 public:
  ReportService() = delete;
  explicit ReportService(std::shared_ptr<StorageService> storage);

  /**
   * @brief Comics sharing a content hash. Only comics hashed during a scan with
   *        compute_file_hash enabled take part.
   */
  auto Duplicates() -> std::vector<DuplicateGroup>;

  /**
   * @brief Whole numbers missing between consecutive integral chapters (and volumes) of each
   *        series
   */
  auto Gaps() -> std::vector<GapReport>;

  /**
   * @brief Missing whole numbers between consecutive sorted values. Fractional neighbours never
   *        produce a gap.
   */
  static auto FindGaps(std::vector<double> values) -> std::vector<int64_t>;
};
};  // namespace inkstone
