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

#include "scanner/sidecar_resolver.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <system_error>

#include "utils/string/convert.hpp"

namespace inkstone {
SidecarResolver::SidecarResolver(file_path_t root, std::string sidecar_name, ErrorSink on_error)
    : root_(std::move(root)), sidecar_name_(std::move(sidecar_name)), on_error_(std::move(on_error)) {}

auto SidecarResolver::LoadOwn(const file_path_t& dir) -> std::shared_ptr<const SeriesMetadata> {
  auto            sidecar = dir / sidecar_name_;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sidecar, ec)) return nullptr;
  try {
    return std::make_shared<const SeriesMetadata>(SeriesMetadata::LoadFile(sidecar));
  } catch (const std::exception& e) {
    // A broken sidecar counts as absent, the ancestors still apply
    std::cerr << std::format("[WARN] SidecarResolver: Ignoring {}: {}\n",
                             conv::PathToBytes(sidecar), e.what());
    if (on_error_) on_error_(sidecar, std::format("Invalid sidecar: {}", e.what()));
    return nullptr;
  }
}

auto SidecarResolver::Resolve(const file_path_t& dir) -> std::shared_ptr<const SeriesMetadata> {
  auto key = conv::PathToBytes(dir);
  auto it  = resolved_.find(key);
  if (it != resolved_.end()) return it->second;

  auto metadata = LoadOwn(dir);
  if (!metadata && dir != root_ && dir.has_parent_path() && dir.parent_path() != dir) {
    auto rel = dir.lexically_relative(root_);
    // Never climb above the library root
    if (!rel.empty() && *rel.begin() != "..") metadata = Resolve(dir.parent_path());
  }
  resolved_.emplace(std::move(key), metadata);
  return metadata;
}
};  // namespace inkstone
