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

#include <cstdint>
#include <string>

namespace duckorm {
/**
 * @brief RAII wrapper over a prepared statement and its last result.
 */
class PreparedStatement {
 private:
  void RecycleResult();
  void RecycleResources();

 public:
  duckdb_result             _result;
  duckdb_prepared_statement _stmt = nullptr;
  duckdb_connection&        _con;

  bool                      _prepared = false;
  bool                      _executed = false;

  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  ~PreparedStatement();

  void BindVarchar(idx_t index, const std::string& value);
  void BindInt64(idx_t index, int64_t value);

  /**
   * @brief Execute with the current bindings. Throws std::runtime_error carrying duckdb's
   *        message on failure. The result stays valid until the next Execute.
   */
  auto Execute() -> duckdb_result&;

  auto RowCount() -> idx_t;
  auto VarcharAt(idx_t col, idx_t row) -> std::string;
  auto Int64At(idx_t col, idx_t row) -> int64_t;
};
};  // namespace duckorm
