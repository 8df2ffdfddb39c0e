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
#include <string_view>

namespace atelier {
/**
 * @brief The single operation that produced an asset.
 */
enum class OperationKind : int {
  ORIGINAL,
  REFINE,
  INPAINT,
  UPSCALE,
  ADJUST,
  BACKGROUND_REMOVAL,
  STYLE_TRANSFER,
  WATERMARK,
  OUTPAINT,
  DEPTH_MAP,
  OBJECT_REPLACEMENT,
  PRODUCT_PHOTO,
  BATCH_ITEM,
  STYLE_PRESET
};

auto OperationKindToString(OperationKind kind) -> std::string_view;
auto OperationKindFromString(std::string_view name) -> std::optional<OperationKind>;
};  // namespace atelier
