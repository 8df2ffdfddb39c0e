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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <stdexcept>

namespace duckorm {
void PreparedStatement::RecycleResult() {
  if (_executed) {
    duckdb_destroy_result(&_result);
    _executed = false;
  }
}

void PreparedStatement::RecycleResources() {
  RecycleResult();
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
    _stmt = nullptr;
  }
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : _con(con) {
  std::memset(&_result, 0, sizeof(_result));

  if (duckdb_prepare(_con, prepare_query.c_str(), &_stmt) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(_stmt);
    std::string msg = "PreparedStatement: prepare failed";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw std::runtime_error(msg);
  }
  _prepared = true;
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

void PreparedStatement::BindVarchar(idx_t index, const std::string& value) {
  if (duckdb_bind_varchar(_stmt, index, value.c_str()) != DuckDBSuccess) {
    throw std::runtime_error("PreparedStatement: failed to bind varchar parameter " +
                             std::to_string(index));
  }
}

void PreparedStatement::BindInt64(idx_t index, int64_t value) {
  if (duckdb_bind_int64(_stmt, index, value) != DuckDBSuccess) {
    throw std::runtime_error("PreparedStatement: failed to bind int64 parameter " +
                             std::to_string(index));
  }
}

auto PreparedStatement::Execute() -> duckdb_result& {
  RecycleResult();
  duckdb_state state = duckdb_execute_prepared(_stmt, &_result);
  _executed          = true;
  if (state != DuckDBSuccess) {
    const char* err = duckdb_result_error(&_result);
    std::string msg = std::string("PreparedStatement: ") + (err ? err : "execution failed");
    RecycleResult();
    throw std::runtime_error(msg);
  }
  return _result;
}

auto PreparedStatement::RowCount() -> idx_t { return _executed ? duckdb_row_count(&_result) : 0; }

auto PreparedStatement::VarcharAt(idx_t col, idx_t row) -> std::string {
  char* raw = duckdb_value_varchar(&_result, col, row);
  if (!raw) return {};
  std::string value(raw);
  duckdb_free(raw);
  return value;
}

auto PreparedStatement::Int64At(idx_t col, idx_t row) -> int64_t {
  return duckdb_value_int64(&_result, col, row);
}
}  // namespace duckorm
