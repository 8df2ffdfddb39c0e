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

#include <mutex>
#include <vector>

#include "storage/store/record_store.hpp"

namespace atelier {
class MemoryRecordStore : public RecordStore {
 private:
  mutable std::mutex          mtx_;
  std::vector<nlohmann::json> records_;

 public:
  MemoryRecordStore() = default;
  explicit MemoryRecordStore(std::vector<nlohmann::json> seed);

  void Append(const nlohmann::json& record) override;
  auto All() const -> std::vector<nlohmann::json> override;
  auto Update(const std::string& id, const Mutation& mutation) -> bool override;
  auto Size() const -> size_t override;
  void RetainLatest(size_t count) override;
};
};  // namespace atelier
