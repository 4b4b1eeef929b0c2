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

#include "scanner/thumbnail_store.hpp"

#include <unistd.h>

#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
constexpr std::array<const char*, 3> known_exts = {"webp", "jpg", "png"};
}  // namespace

ThumbnailStore::ThumbnailStore(const file_path_t& dir) : dir_(dir) {
  std::filesystem::create_directories(dir_);
}

auto ThumbnailStore::PathFor(const comic_id_t& id, const std::string& ext) const -> file_path_t {
  return dir_ / (id + "." + ext);
}

auto ThumbnailStore::TempPathFor(const comic_id_t& id) const -> file_path_t {
  auto thread_tag = std::hash<std::thread::id>{}(std::this_thread::get_id());
  return dir_ / std::format("{}_{}_{}_tmp", id, static_cast<long>(::getpid()), thread_tag);
}

auto ThumbnailStore::Find(const comic_id_t& id) const -> std::optional<file_path_t> {
  std::error_code ec;
  for (const char* ext : known_exts) {
    auto candidate = PathFor(id, ext);
    if (std::filesystem::exists(candidate, ec)) return candidate;
  }
  return std::nullopt;
}

auto ThumbnailStore::Install(const comic_id_t& id, const EncodedThumbnail& thumbnail,
                             bool replace) const -> bool {
  auto temp_path = TempPathFor(id);
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error(std::format("[ERROR] ThumbnailStore: Cannot write {}",
                                           conv::PathToBytes(temp_path)));
    }
    out.write(reinterpret_cast<const char*>(thumbnail.bytes_.data()),
              static_cast<std::streamsize>(thumbnail.bytes_.size()));
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw std::runtime_error(std::format("[ERROR] ThumbnailStore: Short write to {}",
                                           conv::PathToBytes(temp_path)));
    }
  }

  std::error_code ec;
  if (!replace && Find(id)) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  auto final_path = PathFor(id, thumbnail.ext_);
  if (replace) {
    // A different format from an earlier scan would shadow the new file in Find()
    for (const char* ext : known_exts) {
      if (thumbnail.ext_ != ext) std::filesystem::remove(PathFor(id, ext), ec);
    }
  }
  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw std::runtime_error(std::format("[ERROR] ThumbnailStore: Cannot install {}: {}",
                                         conv::PathToBytes(final_path), ec.message()));
  }
  return true;
}
};  // namespace inkstone
