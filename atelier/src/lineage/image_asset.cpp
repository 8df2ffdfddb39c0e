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

#include "lineage/image_asset.hpp"

#include <cstdint>
#include <cstdlib>

namespace atelier {
namespace {
auto IsTruthy(const nlohmann::json& j, const char* key) -> bool {
  if (!j.contains(key)) return false;
  const auto& v = j.at(key);
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_string()) return !v.get_ref<const std::string&>().empty();
  return !v.is_null();
}

auto SizeFromLegacy(const nlohmann::json& j) -> ImageSize {
  ImageSize   size{1024, 1024};
  std::string text = j.value("size", std::string());
  auto        pos  = text.find('x');
  if (pos == std::string::npos) return size;
  int w = std::atoi(text.substr(0, pos).c_str());
  int h = std::atoi(text.substr(pos + 1).c_str());
  if (w > 0 && h > 0) size = {w, h};
  return size;
}

template <typename Params>
auto Decode(const nlohmann::json& j) -> OperationPayload {
  Params p;
  p.FromJSON(j);
  return p;
}
}  // namespace

auto PayloadFromJSON(OperationKind kind, const nlohmann::json& j) -> OperationPayload {
  switch (kind) {
    case OperationKind::ORIGINAL:
    case OperationKind::BATCH_ITEM:
    case OperationKind::STYLE_PRESET:
      return Decode<GenerationParams>(j);
    case OperationKind::REFINE:
      return Decode<RefineParams>(j);
    case OperationKind::INPAINT:
      return Decode<InpaintParams>(j);
    case OperationKind::UPSCALE:
      return Decode<UpscaleParams>(j);
    case OperationKind::ADJUST:
      return Decode<AdjustParams>(j);
    case OperationKind::BACKGROUND_REMOVAL:
      return Decode<BackgroundRemovalParams>(j);
    case OperationKind::STYLE_TRANSFER:
      return Decode<StyleTransferParams>(j);
    case OperationKind::WATERMARK:
      return Decode<WatermarkParams>(j);
    case OperationKind::OUTPAINT:
      return Decode<OutpaintParams>(j);
    case OperationKind::DEPTH_MAP:
      return Decode<DepthMapParams>(j);
    case OperationKind::OBJECT_REPLACEMENT:
      return Decode<ObjectReplacementParams>(j);
    case OperationKind::PRODUCT_PHOTO:
      return Decode<ProductPhotoParams>(j);
  }
  return std::monostate{};
}

auto ImageAsset::ResolveLegacyKind(const nlohmann::json& j) -> OperationKind {
  if (IsTruthy(j, "outpainted")) return OperationKind::OUTPAINT;
  if (IsTruthy(j, "adjusted")) return OperationKind::ADJUST;
  if (IsTruthy(j, "upscaled")) return OperationKind::UPSCALE;
  if (IsTruthy(j, "background_removed")) return OperationKind::BACKGROUND_REMOVAL;
  if (IsTruthy(j, "style_transfer")) return OperationKind::STYLE_TRANSFER;
  if (IsTruthy(j, "watermarked")) return OperationKind::WATERMARK;
  if (IsTruthy(j, "edit_type")) {
    const auto& edit_type = j.at("edit_type");
    if (!edit_type.is_string()) return OperationKind::INPAINT;
    return OperationKindFromString(edit_type.get<std::string>()).value_or(OperationKind::INPAINT);
  }
  if (IsTruthy(j, "inpainted")) return OperationKind::INPAINT;
  if (IsTruthy(j, "refinement_instruction")) return OperationKind::REFINE;
  return OperationKind::ORIGINAL;
}

auto ImageAsset::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]             = id_;
  j["parent_id"]      = parent_id_.has_value() ? nlohmann::json(*parent_id_) : nullptr;
  j["prompt"]         = prompt_;
  j["style"]          = style_;
  j["size"]           = Size().ToString();
  j["width"]          = width_;
  j["height"]         = height_;
  j["filename"]       = filename_;
  j["operation_kind"] = std::string(OperationKindToString(kind_));
  j["params"]         = PayloadToJSON(payload_);
  j["created_at"]     = created_at_;
  j["created_time"]   = created_time_;
  j["favorited"]      = favorited_;
  return j;
}

auto ImageAsset::FromJSON(const nlohmann::json& j) -> ImageAsset {
  ImageAsset asset;
  asset.id_ = j.value("id", std::string());
  if (j.contains("parent_id") && j.at("parent_id").is_string() &&
      !j.at("parent_id").get_ref<const std::string&>().empty()) {
    asset.parent_id_ = j.at("parent_id").get<std::string>();
  }
  asset.prompt_    = j.value("prompt", std::string());
  asset.style_     = j.value("style", std::string("none"));
  asset.filename_  = j.value("filename", std::string());
  asset.favorited_ = j.value("favorited", false);

  if (j.contains("width") && j.contains("height")) {
    asset.width_  = j.at("width").get<int>();
    asset.height_ = j.at("height").get<int>();
  } else {
    auto size     = SizeFromLegacy(j);
    asset.width_  = size.width_;
    asset.height_ = size.height_;
  }

  std::optional<OperationKind> kind;
  if (j.contains("operation_kind") && j.at("operation_kind").is_string()) {
    kind = OperationKindFromString(j.at("operation_kind").get<std::string>());
  }
  asset.kind_ = kind.value_or(ResolveLegacyKind(j));

  // Legacy records keep their parameters flat on the record itself
  const nlohmann::json& params = j.contains("params") && j.at("params").is_object()
                                     ? j.at("params")
                                     : j;
  asset.payload_               = PayloadFromJSON(asset.kind_, params);

  if (j.contains("created_at") && j.at("created_at").is_number_integer() &&
      j.at("created_at").get<int64_t>() >= 0) {
    asset.created_at_   = j.at("created_at").get<seq_t>();
    asset.created_time_ = j.value("created_time", std::string());
  } else if (j.contains("created_at") && j.at("created_at").is_string()) {
    asset.created_time_ = j.at("created_at").get<std::string>();
  }
  return asset;
}
};  // namespace atelier
