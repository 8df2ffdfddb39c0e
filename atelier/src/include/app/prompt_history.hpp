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

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "storage/store/record_store.hpp"

namespace atelier {
struct PromptEntry {
  std::string prompt_;
  std::string created_time_;
};

/**
 * @brief Recently used generation prompts, newest first, kept in their own RecordStore.
 *
 * A prompt repeated within kRepeatWindow of one of the last kRepeatScan entries is not stored
 * again. Only the newest kMaxEntries survive a write.
 */
class PromptHistory {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr size_t               kMaxEntries     = 50;
  static constexpr size_t               kMaxListed      = 100;
  static constexpr size_t               kMaxSuggestions = 10;
  static constexpr size_t               kRepeatScan     = 10;
  static constexpr std::chrono::seconds kRepeatWindow{300};

 private:
  std::shared_ptr<RecordStore> store_;
  Clock                        clock_;
  // Record is check-then-append
  std::mutex                   write_mtx_;

  auto                         Entries() const -> std::vector<nlohmann::json>;

 public:
  explicit PromptHistory(std::shared_ptr<RecordStore> store, Clock clock = nullptr);

  /**
   * @brief Store prompt. Returns false when it was empty or a recent repeat.
   */
  auto Record(const std::string& prompt) -> bool;

  /**
   * @brief Newest-first entries. Throws ValidationError unless 1 <= limit <= kMaxListed.
   */
  auto Recent(size_t limit = kMaxEntries) const -> std::vector<PromptEntry>;

  /**
   * @brief Distinct prompts containing query, case-insensitively. Prefix matches come before
   *        other matches, each group newest first, at most kMaxSuggestions in total.
   */
  auto Suggest(const std::string& query) const -> std::vector<PromptEntry>;

  void Clear();
};
};  // namespace atelier
