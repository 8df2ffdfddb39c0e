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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>

#include <stdexcept>
#include <string>

namespace atelier {
/**
 * @brief Construct a new DBController::DBController object
 *
 * @param db_path
 */
DBController::DBController(const file_path_t& db_path) : _db_path(db_path) { InitializeDB(); }

/**
 * @brief Destroy the DBController::DBController object
 *
 */
DBController::~DBController() {
  if (_db) duckdb_close(&_db);
}

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  ConnectionGuard guard{nullptr};

  if (duckdb_connect(_db, &guard._conn) != DuckDBSuccess) {
    throw std::runtime_error("DBController: DB cannot be connected");
  }

  return guard;
}

/**
 * @brief Open the database and create the record table when absent.
 *
 */
void DBController::InitializeDB() {
  const std::string path_str = _db_path.string();
  const char*       path     = path_str.empty() ? nullptr : path_str.c_str();
  if (duckdb_open(path, &_db) != DuckDBSuccess) {
    throw std::runtime_error("DBController: DB cannot be opened at " + path_str);
  }

  auto          guard = GetConnectionGuard();

  duckdb_result result;
  if (duckdb_query(guard._conn, init_table_query, &result) != DuckDBSuccess) {
    std::string error_message = duckdb_result_error(&result);
    duckdb_destroy_result(&result);
    throw std::runtime_error("DBController: " + error_message);
  }
  duckdb_destroy_result(&result);
}
};  // namespace atelier
