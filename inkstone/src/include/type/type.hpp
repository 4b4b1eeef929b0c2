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
#include <filesystem>
#include <string>

namespace inkstone {

// Filesystem paths, always absolute and normalized once they reach the storage layer
#define comic_path_t std::filesystem::path
#define file_path_t  std::filesystem::path

// Hex digest of the comic's absolute path (see Hash128)
#define comic_id_t   std::string

// Autoincrement keys
#define series_id_t  int64_t
#define job_id_t     int64_t

// Normalized tag string, the lookup key of the taxonomy
#define tag_norm_t   std::string
};  // namespace inkstone
