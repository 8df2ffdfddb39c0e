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
#include <variant>
#include <vector>

namespace atelier {
/**
 * @brief Payload of text-driven generations (original, batch items, preset applications).
 */
struct GenerationParams {
  std::string                style_ = "none";
  std::string                model_;
  std::optional<std::string> enhanced_prompt_;
  std::string                group_id_;
  std::string                comparison_id_;
  std::string                batch_id_;
  std::string                preset_name_;
  std::string                reference_filename_;

  auto                       ToJSON() const -> nlohmann::json;
  void                       FromJSON(const nlohmann::json& j);
};

struct RefineParams {
  std::string instruction_;
  std::string original_prompt_;

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};

struct InpaintParams {
  std::string prompt_;
  std::string api_size_;

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};

struct UpscaleParams {
  int  factor_ = 2;

  auto ToJSON() const -> nlohmann::json;
  void FromJSON(const nlohmann::json& j);
};

/**
 * @brief Enhancement factors. 1.0 leaves a channel untouched, 0.0 collapses it onto the
 *        degenerate image (black, mean gray, grayscale, smoothed).
 */
struct AdjustParams {
  float brightness_ = 1.0f;
  float contrast_   = 1.0f;
  float saturation_ = 1.0f;
  float sharpness_  = 1.0f;
  float blur_       = 0.0f;

  auto  ToJSON() const -> nlohmann::json;
  void  FromJSON(const nlohmann::json& j);
};

struct WatermarkParams {
  std::string text_;
  std::string position_  = "bottom-right";
  float       opacity_   = 0.3f;
  int         font_size_ = 36;
  std::string color_     = "#ffffff";

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};

struct OutpaintParams {
  std::vector<std::string> directions_;
  int                      amount_      = 50;
  int                      ext_left_    = 0;
  int                      ext_right_   = 0;
  int                      ext_top_     = 0;
  int                      ext_bottom_  = 0;

  auto                     ToJSON() const -> nlohmann::json;
  void                     FromJSON(const nlohmann::json& j);
};

struct StyleTransferParams {
  float       strength_ = 0.7f;
  std::string description_;
  std::string reference_filename_;

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};

struct ObjectReplacementParams {
  std::string target_object_;
  std::string replacement_;
  bool        preserve_style_ = true;

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};

struct ProductPhotoParams {
  std::string scene_ = "studio";
  std::string background_color_;

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};

struct DepthMapParams {
  auto ToJSON() const -> nlohmann::json { return nlohmann::json::object(); }
  void FromJSON(const nlohmann::json&) {}
};

struct BackgroundRemovalParams {
  auto ToJSON() const -> nlohmann::json { return nlohmann::json::object(); }
  void FromJSON(const nlohmann::json&) {}
};

using OperationPayload =
    std::variant<std::monostate, GenerationParams, RefineParams, InpaintParams, UpscaleParams,
                 AdjustParams, WatermarkParams, OutpaintParams, StyleTransferParams,
                 ObjectReplacementParams, ProductPhotoParams, DepthMapParams,
                 BackgroundRemovalParams>;

auto PayloadToJSON(const OperationPayload& payload) -> nlohmann::json;
};  // namespace atelier
