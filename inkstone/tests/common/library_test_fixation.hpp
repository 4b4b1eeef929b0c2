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

#include <archive.h>
#include <archive_entry.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config/library_config.hpp"

namespace inkstone {
using ArchiveEntries = std::vector<std::pair<std::string, std::vector<uchar>>>;

inline auto MakePage(int width, int height, const std::string& ext = ".png",
                     const cv::Scalar& color = cv::Scalar(40, 120, 200)) -> std::vector<uchar> {
  cv::Mat            page(height, width, CV_8UC3, color);
  std::vector<uchar> encoded;
  if (!cv::imencode(ext, page, encoded)) {
    throw std::runtime_error("Cannot encode test page");
  }
  return encoded;
}

inline void WriteZip(const std::filesystem::path& path, const ArchiveEntries& entries) {
  std::filesystem::create_directories(path.parent_path());
  archive* writer = archive_write_new();
  archive_write_set_format_zip(writer);
  if (archive_write_open_filename(writer, path.string().c_str()) != ARCHIVE_OK) {
    archive_write_free(writer);
    throw std::runtime_error("Cannot create test archive " + path.string());
  }
  for (const auto& [name, data] : entries) {
    archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_write_header(writer, entry);
    archive_write_data(writer, data.data(), data.size());
    archive_entry_free(entry);
  }
  archive_write_close(writer);
  archive_write_free(writer);
}

class LibraryTestBase : public ::testing::Test {
 protected:
  std::filesystem::path work_dir_;
  std::filesystem::path library_root_;
  std::filesystem::path db_path_;
  std::filesystem::path cache_dir_;

  void                  SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    work_dir_        = std::filesystem::temp_directory_path() /
                std::format("inkstone_{}_{}_{}", info->test_suite_name(), info->name(),
                            static_cast<long>(::getpid()));
    std::filesystem::remove_all(work_dir_);
    library_root_ = work_dir_ / "library";
    db_path_      = work_dir_ / "library.db";
    cache_dir_    = work_dir_ / "cache";
    std::filesystem::create_directories(library_root_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(work_dir_, ec);
  }

  // Archive with one small PNG per page name
  auto WriteComic(const std::string& rel_path, const std::vector<std::string>& pages,
                  int width = 300, int height = 450) -> std::filesystem::path {
    ArchiveEntries entries;
    for (const auto& page : pages) {
      entries.emplace_back(page, MakePage(width, height));
    }
    auto path = library_root_ / rel_path;
    WriteZip(path, entries);
    return path;
  }

  void WriteSidecar(const std::string& rel_dir, const nlohmann::json& doc) {
    auto dir = library_root_ / rel_dir;
    std::filesystem::create_directories(dir);
    std::ofstream out(dir / "series.json");
    out << doc.dump(2);
  }

  void WriteRawFile(const std::string& rel_path, const std::string& content) {
    auto path = library_root_ / rel_path;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
  }

  auto MakeConfig() const -> LibraryConfig {
    LibraryConfig config;
    config.db_path_      = db_path_;
    config.roots_        = {library_root_};
    config.cache_dir_    = cache_dir_;
    config.worker_count_ = 2;
    config.batch_size_   = 3;
    return config;
  }
};
};  // namespace inkstone
