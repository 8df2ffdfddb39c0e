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

#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace atelier {
constexpr size_t kMaxBatchRows = 50;

struct BatchRow {
  std::string                prompt_;
  std::string                style_ = "none";
  ImageSize                  size_{1024, 1024};
  std::optional<std::string> model_;
};

/**
 * @brief Parse an uploaded batch sheet. The header must name a prompt column; style, size and
 *        model columns are optional. Rows with a blank prompt are skipped. Throws
 *        ValidationError on a missing prompt column, an invalid size, no usable rows or more
 *        than kMaxBatchRows rows.
 */
auto ParseBatchCsv(const std::string& csv, const std::vector<ImageSize>& valid_sizes)
    -> std::vector<BatchRow>;

/**
 * @brief Split CSV text into records of fields. Handles quoted fields, doubled quotes and
 *        line breaks inside quotes.
 */
auto SplitCsv(const std::string& csv) -> std::vector<std::vector<std::string>>;
};  // namespace atelier
