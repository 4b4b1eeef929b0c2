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

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "library/series_metadata.hpp"
#include "type/type.hpp"

namespace inkstone {
/**
 * @brief Finds the sidecar document governing a directory: its own, else the nearest ancestor's
 *        up to the library root. Sidecars are never merged. Results are memoized per directory.
 *
 */
class SidecarResolver {
 public:
  using ErrorSink = std::function<void(const file_path_t&, const std::string&)>;

  SidecarResolver(file_path_t root, std::string sidecar_name, ErrorSink on_error);

  auto Resolve(const file_path_t& dir) -> std::shared_ptr<const SeriesMetadata>;

 private:
  auto                                                             LoadOwn(const file_path_t& dir)
      -> std::shared_ptr<const SeriesMetadata>;

  file_path_t                                                      root_;
  std::string                                                      sidecar_name_;
  ErrorSink                                                        on_error_;
  std::unordered_map<std::string, std::shared_ptr<const SeriesMetadata>> resolved_;
};
};  // namespace inkstone
