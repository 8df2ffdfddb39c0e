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

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace atelier {
/**
 * @brief Append-only log of asset records keyed by their "id" field.
 *
 * Appends are atomic with respect to each other; All() returns records in append order.
 */
class RecordStore {
 public:
  using Mutation = std::function<void(nlohmann::json&)>;

  virtual ~RecordStore()                                                 = default;

  virtual void Append(const nlohmann::json& record)                      = 0;
  virtual auto All() const -> std::vector<nlohmann::json>                = 0;
  /**
   * @brief Apply mutation to the record with the given id and persist it. Returns false when
   *        no such record exists.
   */
  virtual auto Update(const std::string& id, const Mutation& mutation) -> bool = 0;
  virtual auto Size() const -> size_t                                    = 0;
  /**
   * @brief Drop every record except the count most recently appended. Zero clears the store.
   */
  virtual void RetainLatest(size_t count)                                = 0;
};
};  // namespace atelier
