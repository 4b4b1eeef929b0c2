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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Sequential libarchive reader over one CBZ/CBR file. libarchive streams entries in
 *        storage order, reading a specific entry reopens the archive and skips up to it.
 *
 */
class ArchiveReader {
 public:
  // Entries larger than this are refused rather than buffered
  static constexpr int64_t max_entry_bytes = int64_t{256} << 20;

  /**
   * @brief Open the archive
   *
   * @throws std::runtime_error if libarchive cannot open or recognize the file
   */
  explicit ArchiveReader(const file_path_t& path);

  ArchiveReader(const ArchiveReader&)            = delete;
  ArchiveReader& operator=(const ArchiveReader&) = delete;

  /**
   * @brief Names of all regular-file entries in storage order
   */
  auto ListEntries() -> std::vector<std::string>;

  /**
   * @brief Whole content of the named entry
   *
   * @throws std::runtime_error if the entry is missing, too large or unreadable
   */
  auto ReadEntry(const std::string& name) -> std::vector<uint8_t>;

 private:
  struct ArchiveDeleter {
    void operator()(archive* handle) const { archive_read_free(handle); }
  };

  void                                     Reopen();
  auto                                     LastError() const -> std::string;

  file_path_t                              path_;
  std::unique_ptr<archive, ArchiveDeleter> handle_;
};
};  // namespace inkstone
