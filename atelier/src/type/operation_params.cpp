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

#include "type/operation_params.hpp"

#include <type_traits>
#include <variant>

namespace atelier {
auto GenerationParams::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["style"]           = style_;
  j["model"]           = model_;
  j["enhanced_prompt"] = enhanced_prompt_.has_value() ? nlohmann::json(*enhanced_prompt_)
                                                      : nlohmann::json(nullptr);
  if (!group_id_.empty()) j["group_id"] = group_id_;
  if (!comparison_id_.empty()) j["comparison_id"] = comparison_id_;
  if (!batch_id_.empty()) j["batch_id"] = batch_id_;
  if (!preset_name_.empty()) j["preset_name"] = preset_name_;
  if (!reference_filename_.empty()) j["reference_filename"] = reference_filename_;
  return j;
}

void GenerationParams::FromJSON(const nlohmann::json& j) {
  style_ = j.value("style", std::string("none"));
  model_ = j.value("model", std::string());
  if (j.contains("enhanced_prompt") && j.at("enhanced_prompt").is_string()) {
    enhanced_prompt_ = j.at("enhanced_prompt").get<std::string>();
  } else {
    enhanced_prompt_.reset();
  }
  group_id_           = j.value("group_id", std::string());
  comparison_id_      = j.value("comparison_id", std::string());
  batch_id_           = j.value("batch_id", std::string());
  preset_name_        = j.value("preset_name", std::string());
  reference_filename_ = j.value("reference_filename", std::string());
}

auto RefineParams::ToJSON() const -> nlohmann::json {
  return {{"refinement_instruction", instruction_}, {"original_prompt", original_prompt_}};
}

void RefineParams::FromJSON(const nlohmann::json& j) {
  instruction_     = j.value("refinement_instruction", std::string());
  original_prompt_ = j.value("original_prompt", std::string());
}

auto InpaintParams::ToJSON() const -> nlohmann::json {
  return {{"prompt", prompt_}, {"api_size", api_size_}};
}

void InpaintParams::FromJSON(const nlohmann::json& j) {
  prompt_   = j.value("prompt", std::string());
  api_size_ = j.value("api_size", std::string());
}

auto UpscaleParams::ToJSON() const -> nlohmann::json { return {{"upscale_factor", factor_}}; }

void UpscaleParams::FromJSON(const nlohmann::json& j) { factor_ = j.value("upscale_factor", 2); }

auto AdjustParams::ToJSON() const -> nlohmann::json {
  return {{"brightness", brightness_}, {"contrast", contrast_}, {"saturation", saturation_},
          {"sharpness", sharpness_},   {"blur", blur_}};
}

void AdjustParams::FromJSON(const nlohmann::json& j) {
  brightness_ = j.value("brightness", 1.0f);
  contrast_   = j.value("contrast", 1.0f);
  saturation_ = j.value("saturation", 1.0f);
  sharpness_  = j.value("sharpness", 1.0f);
  blur_       = j.value("blur", 0.0f);
}

auto WatermarkParams::ToJSON() const -> nlohmann::json {
  return {{"watermark_text", text_},
          {"watermark_position", position_},
          {"watermark_opacity", opacity_},
          {"font_size", font_size_},
          {"color", color_}};
}

void WatermarkParams::FromJSON(const nlohmann::json& j) {
  text_      = j.value("watermark_text", std::string());
  position_  = j.value("watermark_position", std::string("bottom-right"));
  opacity_   = j.value("watermark_opacity", 0.3f);
  font_size_ = j.value("font_size", 36);
  color_     = j.value("color", std::string("#ffffff"));
}

auto OutpaintParams::ToJSON() const -> nlohmann::json {
  return {{"directions", directions_}, {"amount", amount_},         {"ext_left", ext_left_},
          {"ext_right", ext_right_},   {"ext_top", ext_top_},       {"ext_bottom", ext_bottom_}};
}

void OutpaintParams::FromJSON(const nlohmann::json& j) {
  directions_ = j.value("directions", std::vector<std::string>{});
  amount_     = j.value("amount", 50);
  ext_left_   = j.value("ext_left", 0);
  ext_right_  = j.value("ext_right", 0);
  ext_top_    = j.value("ext_top", 0);
  ext_bottom_ = j.value("ext_bottom", 0);
}

auto StyleTransferParams::ToJSON() const -> nlohmann::json {
  return {{"style_strength", strength_},
          {"style_description", description_},
          {"style_reference", reference_filename_}};
}

void StyleTransferParams::FromJSON(const nlohmann::json& j) {
  strength_           = j.value("style_strength", 0.7f);
  description_        = j.value("style_description", std::string());
  reference_filename_ = j.value("style_reference", std::string());
}

auto ObjectReplacementParams::ToJSON() const -> nlohmann::json {
  return {{"target_object", target_object_},
          {"replacement", replacement_},
          {"preserve_style", preserve_style_}};
}

void ObjectReplacementParams::FromJSON(const nlohmann::json& j) {
  target_object_  = j.value("target_object", std::string());
  replacement_    = j.value("replacement", std::string());
  preserve_style_ = j.value("preserve_style", true);
}

auto ProductPhotoParams::ToJSON() const -> nlohmann::json {
  return {{"scene", scene_}, {"background_color", background_color_}};
}

void ProductPhotoParams::FromJSON(const nlohmann::json& j) {
  scene_            = j.value("scene", std::string("studio"));
  background_color_ = j.value("background_color", std::string());
}

auto PayloadToJSON(const OperationPayload& payload) -> nlohmann::json {
  return std::visit(
      [](const auto& p) -> nlohmann::json {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nlohmann::json::object();
        } else {
          return p.ToJSON();
        }
      },
      payload);
}
};  // namespace atelier
