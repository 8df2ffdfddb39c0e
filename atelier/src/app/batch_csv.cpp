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

#include "app/batch_csv.hpp"

#include <algorithm>
#include <cctype>

#include "type/errors.hpp"

namespace atelier {
namespace {
auto Trim(const std::string& s) -> std::string {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

auto Lower(std::string s) -> std::string {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

auto ColumnOf(const std::vector<std::string>& header, const std::string& name) -> int {
  for (size_t i = 0; i < header.size(); ++i) {
    if (Lower(Trim(header[i])) == name) return static_cast<int>(i);
  }
  return -1;
}

auto FieldAt(const std::vector<std::string>& row, int column) -> std::string {
  if (column < 0 || static_cast<size_t>(column) >= row.size()) return {};
  return Trim(row[column]);
}
}  // namespace

auto SplitCsv(const std::string& csv) -> std::vector<std::vector<std::string>> {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string>              record;
  std::string                           field;
  bool                                  in_quotes  = false;
  bool                                  field_open = false;

  auto                                  end_field  = [&]() {
    record.push_back(std::move(field));
    field.clear();
    field_open = false;
  };
  auto end_record = [&]() {
    if (field_open || !record.empty() || !field.empty()) {
      end_field();
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (size_t i = 0; i < csv.size(); ++i) {
    const char c = csv[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < csv.size() && csv[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    switch (c) {
      case '"':
        in_quotes  = true;
        field_open = true;
        break;
      case ',':
        field_open = true;
        end_field();
        field_open = true;
        break;
      case '\r':
        break;
      case '\n':
        end_record();
        break;
      default:
        field.push_back(c);
        field_open = true;
        break;
    }
  }
  if (in_quotes) {
    throw ValidationError("unterminated quoted field in CSV");
  }
  end_record();
  return records;
}

auto ParseBatchCsv(const std::string& csv, const std::vector<ImageSize>& valid_sizes)
    -> std::vector<BatchRow> {
  auto records = SplitCsv(csv);
  if (records.empty()) {
    throw ValidationError("CSV is empty");
  }
  const auto& header     = records.front();
  const int   prompt_col = ColumnOf(header, "prompt");
  if (prompt_col < 0) {
    throw ValidationError("CSV header must contain a prompt column");
  }
  const int             style_col = ColumnOf(header, "style");
  const int             size_col  = ColumnOf(header, "size");
  const int             model_col = ColumnOf(header, "model");

  std::vector<BatchRow> rows;
  for (size_t r = 1; r < records.size(); ++r) {
    BatchRow row;
    row.prompt_ = FieldAt(records[r], prompt_col);
    if (row.prompt_.empty()) continue;

    const std::string style = FieldAt(records[r], style_col);
    if (!style.empty()) row.style_ = style;

    const std::string size = FieldAt(records[r], size_col);
    if (!size.empty()) {
      row.size_ = ParseImageSize(size);
      if (std::find(valid_sizes.begin(), valid_sizes.end(), row.size_) == valid_sizes.end()) {
        throw ValidationError("row " + std::to_string(r) + " has unsupported size " + size);
      }
    }

    const std::string model = FieldAt(records[r], model_col);
    if (!model.empty()) row.model_ = model;

    rows.push_back(std::move(row));
    if (rows.size() > kMaxBatchRows) {
      throw ValidationError("CSV batches are limited to " + std::to_string(kMaxBatchRows) +
                            " rows");
    }
  }
  if (rows.empty()) {
    throw ValidationError("CSV contains no prompts");
  }
  return rows;
}
};  // namespace atelier
