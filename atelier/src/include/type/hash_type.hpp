//  Copyright 2025 Yurun Zi
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

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

namespace atelier {
/**
 * @brief 128-bit xxHash3 digest, used as the identity of assets and batch jobs.
 */
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
  bool operator!=(const Hash128& other) const noexcept { return !(*this == other); }

  static Hash128 Compute(const void* data, size_t length, uint64_t seed = 0) {
    XXH128_hash_t h = XXH3_128bits_withSeed(data, length, seed);
    return Hash128(h);
  }

  /**
   * @brief Produce a fresh identifier. The digest covers a per-process random seed, the wall
   *        clock and a process-wide counter, so two calls never collide in practice.
   */
  static Hash128 Generate() {
    static const uint64_t        process_seed = std::random_device{}() ^
                                         (static_cast<uint64_t>(std::random_device{}()) << 32);
    static std::atomic<uint64_t> counter{0};

    struct {
      uint64_t tick;
      uint64_t count;
    } material{static_cast<uint64_t>(
                   std::chrono::system_clock::now().time_since_epoch().count()),
               counter.fetch_add(1, std::memory_order_relaxed)};
    return Compute(&material, sizeof(material), process_seed);
  }

 private:
  XXH128_hash_t _h;
};
};  // namespace atelier

namespace std {
template <>
struct hash<atelier::Hash128> {
  std::size_t operator()(const atelier::Hash128& h) const noexcept {
    auto h1 = std::hash<uint64_t>{}(h.low64());
    auto h2 = std::hash<uint64_t>{}(h.high64());
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};
}  // namespace std
