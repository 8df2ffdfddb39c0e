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

#include "storage/controller/db_controller.hpp"
#include "storage/store/record_store.hpp"

namespace atelier {
/**
 * @brief RecordStore persisted in the AssetRecord table. Each record is stored as a JSON
 *        document next to its id and a monotonically increasing seq column that preserves
 *        append order.
 */
class DuckDBRecordStore : public RecordStore {
 private:
  mutable std::mutex   mtx_;
  mutable DBController db_ctrl_;
  int64_t              next_seq_ = 0;

 public:
  explicit DuckDBRecordStore(const file_path_t& db_path);

  void Append(const nlohmann::json& record) override;
  auto All() const -> std::vector<nlohmann::json> override;
  auto Update(const std::string& id, const Mutation& mutation) -> bool override;
  auto Size() const -> size_t override;
  void RetainLatest(size_t count) override;
};
};  // namespace atelier
