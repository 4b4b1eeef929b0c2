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

#include "scanner/archive_reader.hpp"

#include <archive_entry.h>

#include <format>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
constexpr size_t block_size = 10240;
}  // namespace

ArchiveReader::ArchiveReader(const file_path_t& path) : path_(path) { Reopen(); }

void ArchiveReader::Reopen() {
  handle_.reset(archive_read_new());
  if (!handle_) {
    throw std::runtime_error("[ERROR] ArchiveReader: archive_read_new failed");
  }
  archive_read_support_format_all(handle_.get());
  archive_read_support_filter_all(handle_.get());
  std::string utf8_path = conv::PathToBytes(path_);
  if (archive_read_open_filename(handle_.get(), utf8_path.c_str(), block_size) != ARCHIVE_OK) {
    std::string msg = LastError();
    handle_.reset();
    throw std::runtime_error(
        std::format("[ERROR] ArchiveReader: Cannot open {}: {}", utf8_path, msg));
  }
}

auto ArchiveReader::LastError() const -> std::string {
  if (!handle_) return "archive not open";
  const char* msg = archive_error_string(handle_.get());
  return msg ? msg : "unknown libarchive error";
}

auto ArchiveReader::ListEntries() -> std::vector<std::string> {
  if (!handle_) Reopen();
  std::vector<std::string> names;
  archive_entry*           entry = nullptr;
  int                      rc    = ARCHIVE_OK;
  while ((rc = archive_read_next_header(handle_.get(), &entry)) == ARCHIVE_OK ||
         rc == ARCHIVE_WARN) {
    const char* name = archive_entry_pathname_utf8(entry);
    if (name == nullptr) name = archive_entry_pathname(entry);
    if (name != nullptr && archive_entry_filetype(entry) == AE_IFREG) {
      names.emplace_back(name);
    }
    archive_read_data_skip(handle_.get());
  }
  if (rc != ARCHIVE_EOF) {
    throw std::runtime_error(std::format("[ERROR] ArchiveReader: Corrupt archive {}: {}",
                                         conv::PathToBytes(path_), LastError()));
  }
  // The stream is exhausted, the next read starts over
  handle_.reset();
  return names;
}

auto ArchiveReader::ReadEntry(const std::string& name) -> std::vector<uint8_t> {
  Reopen();
  archive_entry* entry = nullptr;
  int            rc    = ARCHIVE_OK;
  while ((rc = archive_read_next_header(handle_.get(), &entry)) == ARCHIVE_OK ||
         rc == ARCHIVE_WARN) {
    const char* entry_name = archive_entry_pathname_utf8(entry);
    if (entry_name == nullptr) entry_name = archive_entry_pathname(entry);
    if (entry_name == nullptr || name != entry_name) {
      archive_read_data_skip(handle_.get());
      continue;
    }
    if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > max_entry_bytes) {
      throw std::runtime_error(
          std::format("[ERROR] ArchiveReader: Entry {} exceeds the size limit", name));
    }

    std::vector<uint8_t> data;
    if (archive_entry_size_is_set(entry)) {
      data.reserve(static_cast<size_t>(archive_entry_size(entry)));
    }
    uint8_t buffer[64 * 1024];
    for (;;) {
      la_ssize_t got = archive_read_data(handle_.get(), buffer, sizeof(buffer));
      if (got == 0) break;
      if (got < 0) {
        throw std::runtime_error(
            std::format("[ERROR] ArchiveReader: Failed reading {}: {}", name, LastError()));
      }
      data.insert(data.end(), buffer, buffer + got);
      if (static_cast<int64_t>(data.size()) > max_entry_bytes) {
        throw std::runtime_error(
            std::format("[ERROR] ArchiveReader: Entry {} exceeds the size limit", name));
      }
    }
    return data;
  }
  throw std::runtime_error(std::format("[ERROR] ArchiveReader: Entry {} not found in {}", name,
                                       conv::PathToBytes(path_)));
}
};  // namespace inkstone
