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

#include "app/report_service.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace inkstone {
namespace {
auto IsWhole(double value) -> bool { return std::floor(value) == value; }
}  // namespace

auto ToString(GapKind kind) -> std::string_view {
  return kind == GapKind::VOLUME ? "volume" : "chapter";
}

ReportService::ReportService(std::shared_ptr<StorageService> storage)
    : storage_(std::move(storage)) {}

auto ReportService::FindGaps(std::vector<double> values) -> std::vector<int64_t> {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  std::vector<int64_t> gaps;
  for (size_t i = 0; i + 1 < values.size(); ++i) {
    double current = values[i];
    double next    = values[i + 1];
    if (next - current <= 1 || !IsWhole(current) || !IsWhole(next)) continue;
    for (auto missing = static_cast<int64_t>(current) + 1; missing < static_cast<int64_t>(next);
         ++missing) {
      gaps.push_back(missing);
    }
  }
  return gaps;
}

auto ReportService::Duplicates() -> std::vector<DuplicateGroup> {
  std::vector<DuplicateGroup> groups;
  for (auto& comics : storage_->GetComicController().GetDuplicateGroups()) {
    if (comics.empty() || !comics.front().file_hash_) continue;
    groups.push_back(DuplicateGroup{*comics.front().file_hash_, std::move(comics)});
  }
  return groups;
}

auto ReportService::Gaps() -> std::vector<GapReport> {
  struct Numbers {
    std::vector<double> chapters_;
    std::vector<double> volumes_;
  };
  std::map<std::string, Numbers> by_series;
  for (const auto& comic : storage_->GetComicController().GetAll()) {
    if (comic.series_.empty()) continue;
    auto& numbers = by_series[comic.series_];
    if (comic.chapter_) numbers.chapters_.push_back(*comic.chapter_);
    if (comic.volume_) numbers.volumes_.push_back(*comic.volume_);
  }

  std::vector<GapReport> reports;
  for (auto& [series, numbers] : by_series) {
    auto chapter_gaps = FindGaps(std::move(numbers.chapters_));
    if (!chapter_gaps.empty()) {
      reports.push_back(GapReport{series, GapKind::CHAPTER, std::move(chapter_gaps)});
    }
    auto volume_gaps = FindGaps(std::move(numbers.volumes_));
    if (!volume_gaps.empty()) {
      reports.push_back(GapReport{series, GapKind::VOLUME, std::move(volume_gaps)});
    }
  }
  return reports;
}
};  // namespace inkstone
