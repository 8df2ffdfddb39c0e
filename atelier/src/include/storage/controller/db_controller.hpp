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

#include <duckdb.h>

#include <filesystem>
#include <string>

#include "controller_types.hpp"
#include "type/type.hpp"

namespace atelier {
class DBController {
 private:
  duckdb_database              _db = nullptr;

  file_path_t                  _db_path;

  constexpr static const char* init_table_query =
      "CREATE TABLE IF NOT EXISTS AssetRecord (seq BIGINT PRIMARY KEY, id TEXT, record JSON);";

 public:
  /**
   * @brief Open (or create) the database at db_path. An empty path opens an in-memory
   *        database that lives as long as this controller.
   */
  explicit DBController(const file_path_t& db_path);
  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;
  ~DBController();

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
};
};  // namespace atelier
