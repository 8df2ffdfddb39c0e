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

#include "storage/store/memory_record_store.hpp"

#include <cstddef>
#include <utility>

namespace atelier {
MemoryRecordStore::MemoryRecordStore(std::vector<nlohmann::json> seed)
    : records_(std::move(seed)) {}

void MemoryRecordStore::Append(const nlohmann::json& record) {
  std::lock_guard<std::mutex> lock(mtx_);
  records_.push_back(record);
}

auto MemoryRecordStore::All() const -> std::vector<nlohmann::json> {
  std::lock_guard<std::mutex> lock(mtx_);
  return records_;
}

auto MemoryRecordStore::Update(const std::string& id, const Mutation& mutation) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  for (auto& record : records_) {
    if (record.value("id", std::string()) == id) {
      mutation(record);
      return true;
    }
  }
  return false;
}

auto MemoryRecordStore::Size() const -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return records_.size();
}

void MemoryRecordStore::RetainLatest(size_t count) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (records_.size() > count) {
    records_.erase(records_.begin(), records_.end() - static_cast<std::ptrdiff_t>(count));
  }
}
};  // namespace atelier
