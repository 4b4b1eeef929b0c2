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

#include "config/library_config.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace inkstone {
namespace {
template <typename T>
void ReadKey(const nlohmann::json& doc, const char* key, T& target) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) return;
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(
        std::format("[ERROR] LibraryConfig: Key '{}' has the wrong type: {}", key, e.what()));
  }
}
}  // namespace

auto LibraryConfig::FromJson(const nlohmann::json& doc) -> LibraryConfig {
  if (!doc.is_object()) {
    throw std::runtime_error("[ERROR] LibraryConfig: Config must be a JSON object");
  }
  LibraryConfig config;

  std::string   db_path;
  ReadKey(doc, "db_path", db_path);
  if (db_path.empty()) {
    throw std::runtime_error("[ERROR] LibraryConfig: 'db_path' is required");
  }
  config.db_path_ = conv::BytesToPath(db_path);

  std::vector<std::string> roots;
  ReadKey(doc, "roots", roots);
  if (roots.empty()) {
    throw std::runtime_error("[ERROR] LibraryConfig: At least one library root is required");
  }
  for (const auto& root : roots) {
    config.roots_.push_back(conv::BytesToPath(root));
  }

  std::string cache_dir;
  ReadKey(doc, "cache_dir", cache_dir);
  config.cache_dir_ =
      cache_dir.empty() ? config.db_path_.parent_path() / "cache" : conv::BytesToPath(cache_dir);

  ReadKey(doc, "worker_count", config.worker_count_);
  ReadKey(doc, "batch_size", config.batch_size_);
  ReadKey(doc, "upsert_batch_size", config.upsert_batch_size_);
  ReadKey(doc, "progress_interval", config.progress_interval_);
  ReadKey(doc, "sidecar_name", config.sidecar_name_);
  ReadKey(doc, "max_errors", config.max_errors_);

  int64_t timeout_ms = config.cover_timeout_.count();
  ReadKey(doc, "cover_timeout_ms", timeout_ms);
  config.cover_timeout_ = std::chrono::milliseconds(timeout_ms);

  if (config.worker_count_ == 0 || config.batch_size_ == 0 || config.upsert_batch_size_ == 0 ||
      config.progress_interval_ == 0) {
    throw std::runtime_error("[ERROR] LibraryConfig: Pool and batch sizes must be positive");
  }
  return config;
}

auto LibraryConfig::ToJson() const -> nlohmann::json {
  nlohmann::json doc;
  doc["db_path"]           = conv::PathToBytes(db_path_);
  doc["roots"]             = nlohmann::json::array();
  for (const auto& root : roots_) {
    doc["roots"].push_back(conv::PathToBytes(root));
  }
  doc["cache_dir"]         = conv::PathToBytes(cache_dir_);
  doc["worker_count"]      = worker_count_;
  doc["batch_size"]        = batch_size_;
  doc["upsert_batch_size"] = upsert_batch_size_;
  doc["progress_interval"] = progress_interval_;
  doc["sidecar_name"]      = sidecar_name_;
  doc["cover_timeout_ms"]  = cover_timeout_.count();
  doc["max_errors"]        = max_errors_;
  return doc;
}

auto LibraryConfig::Load(const file_path_t& path) -> LibraryConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("[ERROR] LibraryConfig: Failed to open {} for reading",
                                         conv::PathToBytes(path)));
  }
  auto doc = nlohmann::json::parse(file, nullptr, false);
  if (doc.is_discarded()) {
    throw std::runtime_error(
        std::format("[ERROR] LibraryConfig: {} is not valid JSON", conv::PathToBytes(path)));
  }
  return FromJson(doc);
}

void LibraryConfig::Save(const file_path_t& path) const {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("[ERROR] LibraryConfig: Failed to open {} for writing",
                                         conv::PathToBytes(path)));
  }
  file << ToJson().dump(4);
}
};  // namespace inkstone
