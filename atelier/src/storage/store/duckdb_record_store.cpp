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

#include "storage/store/duckdb_record_store.hpp"

#include <iostream>
#include <string>

#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace atelier {
namespace {
constexpr const char* kMaxSeqQuery = "SELECT COALESCE(MAX(seq), 0) FROM AssetRecord;";
constexpr const char* kInsertQuery = "INSERT INTO AssetRecord (seq, id, record) VALUES (?, ?, ?);";
constexpr const char* kSelectQuery = "SELECT record FROM AssetRecord ORDER BY seq;";
constexpr const char* kFindQuery   = "SELECT record FROM AssetRecord WHERE id = ?;";
constexpr const char* kUpdateQuery = "UPDATE AssetRecord SET record = ? WHERE id = ?;";
constexpr const char* kCountQuery  = "SELECT COUNT(*) FROM AssetRecord;";
constexpr const char* kRetainQuery =
    "DELETE FROM AssetRecord WHERE seq NOT IN "
    "(SELECT seq FROM AssetRecord ORDER BY seq DESC LIMIT ?);";
}  // namespace

DuckDBRecordStore::DuckDBRecordStore(const file_path_t& db_path) : db_ctrl_(db_path) {
  auto                       guard = db_ctrl_.GetConnectionGuard();
  duckorm::PreparedStatement max_seq(guard._conn, kMaxSeqQuery);
  max_seq.Execute();
  next_seq_ = max_seq.RowCount() > 0 ? max_seq.Int64At(0, 0) + 1 : 1;
}

void DuckDBRecordStore::Append(const nlohmann::json& record) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        guard = db_ctrl_.GetConnectionGuard();
  duckorm::PreparedStatement  insert(guard._conn, kInsertQuery);
  insert.BindInt64(1, next_seq_);
  insert.BindVarchar(2, record.value("id", std::string()));
  insert.BindVarchar(3, record.dump());
  insert.Execute();
  ++next_seq_;
}

auto DuckDBRecordStore::All() const -> std::vector<nlohmann::json> {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        guard = db_ctrl_.GetConnectionGuard();
  duckorm::PreparedStatement  select(guard._conn, kSelectQuery);
  select.Execute();

  std::vector<nlohmann::json> records;
  const idx_t                 rows = select.RowCount();
  records.reserve(rows);
  for (idx_t row = 0; row < rows; ++row) {
    auto parsed = nlohmann::json::parse(select.VarcharAt(0, row), nullptr, false);
    if (parsed.is_discarded()) {
      std::cerr << "[WARN] DuckDBRecordStore: Skipping unparsable record at row " << row
                << std::endl;
      continue;
    }
    records.push_back(std::move(parsed));
  }
  return records;
}

auto DuckDBRecordStore::Update(const std::string& id, const Mutation& mutation) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        guard = db_ctrl_.GetConnectionGuard();
  duckorm::PreparedStatement  find(guard._conn, kFindQuery);
  find.BindVarchar(1, id);
  find.Execute();
  if (find.RowCount() == 0) {
    return false;
  }
  auto record = nlohmann::json::parse(find.VarcharAt(0, 0));
  mutation(record);

  duckorm::PreparedStatement update(guard._conn, kUpdateQuery);
  update.BindVarchar(1, record.dump());
  update.BindVarchar(2, id);
  update.Execute();
  return true;
}

auto DuckDBRecordStore::Size() const -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        guard = db_ctrl_.GetConnectionGuard();
  duckorm::PreparedStatement  count(guard._conn, kCountQuery);
  count.Execute();
  return count.RowCount() > 0 ? static_cast<size_t>(count.Int64At(0, 0)) : 0;
}

void DuckDBRecordStore::RetainLatest(size_t count) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        guard = db_ctrl_.GetConnectionGuard();
  duckorm::PreparedStatement  retain(guard._conn, kRetainQuery);
  retain.BindInt64(1, static_cast<int64_t>(count));
  retain.Execute();
}
};  // namespace atelier
