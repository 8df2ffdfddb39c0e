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

#include "type/operation_kind.hpp"

#include <array>
#include <utility>

namespace atelier {
namespace {
constexpr std::array<std::pair<OperationKind, std::string_view>, 14> kKindNames = {{
    {OperationKind::ORIGINAL, "original"},
    {OperationKind::REFINE, "refine"},
    {OperationKind::INPAINT, "inpaint"},
    {OperationKind::UPSCALE, "upscale"},
    {OperationKind::ADJUST, "adjust"},
    {OperationKind::BACKGROUND_REMOVAL, "background_removal"},
    {OperationKind::STYLE_TRANSFER, "style_transfer"},
    {OperationKind::WATERMARK, "watermark"},
    {OperationKind::OUTPAINT, "outpaint"},
    {OperationKind::DEPTH_MAP, "depth_map"},
    {OperationKind::OBJECT_REPLACEMENT, "object_replacement"},
    {OperationKind::PRODUCT_PHOTO, "product_photo"},
    {OperationKind::BATCH_ITEM, "batch_item"},
    {OperationKind::STYLE_PRESET, "style_preset"},
}};
}  // namespace

auto OperationKindToString(OperationKind kind) -> std::string_view {
  for (const auto& [k, name] : kKindNames) {
    if (k == kind) return name;
  }
  return "original";
}

auto OperationKindFromString(std::string_view name) -> std::optional<OperationKind> {
  for (const auto& [k, n] : kKindNames) {
    if (n == name) return k;
  }
  return std::nullopt;
}
};  // namespace atelier
