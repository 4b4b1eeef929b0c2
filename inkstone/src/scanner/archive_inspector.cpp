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

#include "scanner/archive_inspector.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <system_error>

#include "scanner/archive_reader.hpp"
#include "type/hash_type.hpp"
#include "type/supported_file_type.hpp"
#include "utils/string/convert.hpp"
#include "utils/string/natural_sort.hpp"

namespace inkstone {
auto ToString(InspectionError error) -> std::string_view {
  switch (error) {
    case InspectionError::NONE:
      return "none";
    case InspectionError::FILE_MISSING:
      return "file_missing";
    case InspectionError::OPEN_FAILED:
      return "open_failed";
    case InspectionError::NO_IMAGES:
      return "no_images";
    case InspectionError::COVER_FAILED:
      return "cover_failed";
    case InspectionError::HASH_FAILED:
      return "hash_failed";
    case InspectionError::INSTALL_FAILED:
      return "install_failed";
    case InspectionError::UNEXPECTED:
      return "unexpected";
  }
  return "unexpected";
}

ArchiveInspector::ArchiveInspector(const InspectorOptions& options)
    : options_(options), encoder_(options.thumbnail_) {}

auto ArchiveInspector::ListPages(const file_path_t& path) -> std::vector<std::string> {
  ArchiveReader            reader(path);
  std::vector<std::string> pages;
  for (auto& name : reader.ListEntries()) {
    if (is_page_image(name)) pages.push_back(std::move(name));
  }
  NaturalSort(pages);
  return pages;
}

auto ArchiveInspector::Inspect(const comic_id_t& id, const file_path_t& path) const
    -> InspectionResult {
  InspectionResult result;
  result.id_            = id;
  result.path_          = path;
  std::string utf8_path = conv::PathToBytes(path);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    result.AddError(InspectionError::FILE_MISSING,
                    std::format("Comic file not found: {}", utf8_path));
    return result;
  }

  try {
    ArchiveReader            reader(path);
    std::vector<std::string> pages;
    for (auto& name : reader.ListEntries()) {
      if (is_page_image(name)) pages.push_back(std::move(name));
    }
    result.pages_ = static_cast<int64_t>(pages.size());

    if (pages.empty()) {
      result.AddError(InspectionError::NO_IMAGES,
                      std::format("No page images in {}", utf8_path));
    } else {
      NaturalSort(pages);
      try {
        auto cover_bytes  = reader.ReadEntry(pages.front());
        result.thumbnail_ = encoder_.Encode(cover_bytes);
      } catch (const std::exception& e) {
        result.AddError(InspectionError::COVER_FAILED,
                        std::format("Thumbnail error: {} - {}", pages.front(), e.what()));
      }
    }
  } catch (const std::exception& e) {
    result.pages_ = 0;
    result.thumbnail_.reset();
    result.AddError(InspectionError::OPEN_FAILED,
                    std::format("Error processing {}: {}", utf8_path, e.what()));
    std::cerr << std::format("[ERROR] ArchiveInspector: {}\n", result.errors_.back());
    return result;
  }

  if (options_.compute_file_hash_) {
    try {
      result.file_hash_ = Hash128::ComputeFile(path).ToString();
    } catch (const std::exception& e) {
      result.AddError(InspectionError::HASH_FAILED,
                      std::format("Hash error: {} - {}", utf8_path, e.what()));
    }
  }
  return result;
}
};  // namespace inkstone
