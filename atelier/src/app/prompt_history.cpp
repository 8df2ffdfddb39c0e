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

#include "app/prompt_history.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "type/errors.hpp"
#include "type/hash_type.hpp"
#include "utils/clock/time_provider.hpp"

namespace atelier {
namespace {
auto ToLower(std::string s) -> std::string {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

auto ToMillis(const std::chrono::system_clock::time_point& tp) -> int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto ToEntry(const nlohmann::json& record) -> PromptEntry {
  return {record.value("prompt", std::string()), record.value("created_at", std::string())};
}
}  // namespace

PromptHistory::PromptHistory(std::shared_ptr<RecordStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("PromptHistory: record store must not be null");
  }
  if (!clock_) {
    clock_ = &TimeProvider::Now;
  }
}

auto PromptHistory::Entries() const -> std::vector<nlohmann::json> {
  auto records = store_->All();
  std::reverse(records.begin(), records.end());
  return records;
}

auto PromptHistory::Record(const std::string& prompt) -> bool {
  if (prompt.empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(write_mtx_);
  const auto                  now     = clock_();
  const int64_t               now_ms  = ToMillis(now);
  const auto                  entries = Entries();
  const size_t                scan    = std::min(entries.size(), kRepeatScan);
  for (size_t i = 0; i < scan; ++i) {
    const auto& entry = entries[i];
    if (entry.value("prompt", std::string()) != prompt) continue;
    // Entries without a millisecond stamp cannot be aged and never suppress a write
    if (!entry.contains("created_ms") || !entry.at("created_ms").is_number_integer()) continue;
    const int64_t age_ms = now_ms - entry.at("created_ms").get<int64_t>();
    if (age_ms >= 0 &&
        age_ms < std::chrono::duration_cast<std::chrono::milliseconds>(kRepeatWindow).count()) {
      return false;
    }
  }

  store_->Append({{"id", Hash128::Generate().ToString()},
                  {"prompt", prompt},
                  {"created_at", TimeProvider::ToISO8601(now)},
                  {"created_ms", now_ms}});
  store_->RetainLatest(kMaxEntries);
  return true;
}

auto PromptHistory::Recent(size_t limit) const -> std::vector<PromptEntry> {
  if (limit == 0 || limit > kMaxListed) {
    throw ValidationError("prompt history limit must be between 1 and " +
                          std::to_string(kMaxListed));
  }
  std::vector<PromptEntry> result;
  for (const auto& record : Entries()) {
    if (result.size() == limit) break;
    result.push_back(ToEntry(record));
  }
  return result;
}

auto PromptHistory::Suggest(const std::string& query) const -> std::vector<PromptEntry> {
  if (query.empty()) {
    throw ValidationError("suggestion query must not be empty");
  }
  const std::string               needle = ToLower(query);
  std::vector<PromptEntry>        prefix_matches;
  std::vector<PromptEntry>        other_matches;
  std::unordered_set<std::string> seen;
  for (const auto& record : Entries()) {
    auto entry = ToEntry(record);
    if (!seen.insert(entry.prompt_).second) continue;
    const std::string haystack = ToLower(entry.prompt_);
    const auto        pos      = haystack.find(needle);
    if (pos == 0) {
      prefix_matches.push_back(std::move(entry));
    } else if (pos != std::string::npos) {
      other_matches.push_back(std::move(entry));
    }
  }
  prefix_matches.insert(prefix_matches.end(), std::make_move_iterator(other_matches.begin()),
                        std::make_move_iterator(other_matches.end()));
  if (prefix_matches.size() > kMaxSuggestions) {
    prefix_matches.resize(kMaxSuggestions);
  }
  return prefix_matches;
}

void PromptHistory::Clear() {
  std::lock_guard<std::mutex> lock(write_mtx_);
  store_->RetainLatest(0);
}
};  // namespace atelier
