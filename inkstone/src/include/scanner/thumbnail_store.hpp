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

#include <optional>
#include <string>

#include "scanner/thumbnail_encoder.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Thumbnail files in the cache directory, named <comic id>.<ext>. Writes go to a
 *        per-thread temp file first and are renamed into place.
 *
 */
class ThumbnailStore {
 public:
  explicit ThumbnailStore(const file_path_t& dir);

  auto PathFor(const comic_id_t& id, const std::string& ext) const -> file_path_t;

  /**
   * @brief Installed thumbnail of the comic, whatever its format
   */
  auto Find(const comic_id_t& id) const -> std::optional<file_path_t>;

  /**
   * @brief Write the thumbnail.
   *
   * @param replace overwrite an existing thumbnail (rescans). Without it the first installed
   *        file wins and this call discards its own output.
   * @return true if this call's file is now the installed one
   * @throws std::runtime_error when the file cannot be written
   */
  auto Install(const comic_id_t& id, const EncodedThumbnail& thumbnail, bool replace) const
      -> bool;

  auto Dir() const -> const file_path_t& { return dir_; }

 private:
  auto        TempPathFor(const comic_id_t& id) const -> file_path_t;

  file_path_t dir_;
};
};  // namespace inkstone
