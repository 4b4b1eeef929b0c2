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

#include <xxhash.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace inkstone {
class Hash128 {
 public:
  Hash128() : _h{0, 0} {}
  explicit Hash128(const XXH128_hash_t& h) : _h(h) {}

  Hash128(uint64_t low, uint64_t high) : _h{low, high} {}

  uint64_t    low64() const { return _h.low64; }
  uint64_t    high64() const { return _h.high64; }

  std::string ToString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << _h.high64;
    oss << std::setw(16) << _h.low64;
    return oss.str();
  }

  static Hash128 FromString(const std::string& str) {
    if (str.length() != 32) {
      throw std::invalid_argument("Hash128::FromString: Invalid string length");
    }
    uint64_t high = std::stoull(str.substr(0, 16), nullptr, 16);
    uint64_t low  = std::stoull(str.substr(16, 16), nullptr, 16);
    return Hash128(XXH128_hash_t{low, high});
  }

  bool operator==(const Hash128& other) const noexcept {
    return _h.low64 == other._h.low64 && _h.high64 == other._h.high64;
  }
  bool           operator!=(const Hash128& other) const noexcept { return !(*this == other); }

  static Hash128 Compute(const void* data, size_t length, uint64_t seed = 0) {
    XXH128_hash_t h = XXH3_128bits_withSeed(data, length, seed);
    return Hash128(h);
  }

  static Hash128 Compute(std::string_view text) { return Compute(text.data(), text.size()); }

  /**
   * @brief Stream a whole file through XXH3-128. Used for the optional content hash.
   *
   * @param path
   * @return Hash128
   */
  static Hash128 ComputeFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw std::runtime_error("Hash128::ComputeFile: Failed to open file");
    }
    std::unique_ptr<XXH3_state_t, decltype(&XXH3_freeState)> state(XXH3_createState(),
                                                                   &XXH3_freeState);
    if (!state || XXH3_128bits_reset(state.get()) == XXH_ERROR) {
      throw std::runtime_error("Hash128::ComputeFile: Failed to initialize hash state");
    }
    constexpr size_t chunk_size = 1 << 16;
    std::string      buffer(chunk_size, '\0');
    while (file) {
      file.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
      auto read = file.gcount();
      if (read > 0) {
        XXH3_128bits_update(state.get(), buffer.data(), static_cast<size_t>(read));
      }
    }
    if (file.bad()) {
      throw std::runtime_error("Hash128::ComputeFile: Read error");
    }
    return Hash128(XXH3_128bits_digest(state.get()));
  }

 private:
  XXH128_hash_t _h;
};
};  // namespace inkstone
