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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "type/operation_kind.hpp"
#include "type/operation_params.hpp"
#include "type/type.hpp"

namespace atelier {
/**
 * @brief One node of the lineage graph: a stored raster plus the operation that produced it.
 *
 * Only favorited_ changes after creation. parent_id_ is a plain id, the parent is looked up
 * through the graph and may be missing.
 */
class ImageAsset {
 public:
  asset_id_t                id_;
  std::optional<asset_id_t> parent_id_;
  int                       width_  = 0;
  int                       height_ = 0;
  OperationKind             kind_   = OperationKind::ORIGINAL;
  OperationPayload          payload_;
  seq_t                     created_at_ = 0;
  std::string               created_time_;
  bool                      favorited_ = false;

  std::string               prompt_;
  std::string               style_ = "none";
  std::string               filename_;

  auto                      Size() const -> ImageSize { return {width_, height_}; }
  auto                      IsOriginal() const -> bool { return !parent_id_.has_value(); }

  auto                      ToJSON() const -> nlohmann::json;
  /**
   * @brief Read a stored record. Records written before operation_kind existed are resolved
   *        from their boolean markers, see ResolveLegacyKind.
   */
  static auto               FromJSON(const nlohmann::json& j) -> ImageAsset;

  /**
   * @brief Kind of a record that carries no operation_kind. Markers are checked in a fixed
   *        order: outpainted, adjusted, upscaled, background_removed, style_transfer,
   *        watermarked, inpainted / edit_type, refinement_instruction; otherwise original.
   */
  static auto               ResolveLegacyKind(const nlohmann::json& j) -> OperationKind;
};

/**
 * @brief Decode the payload matching kind from its JSON form.
 */
auto PayloadFromJSON(OperationKind kind, const nlohmann::json& j) -> OperationPayload;
};  // namespace atelier
