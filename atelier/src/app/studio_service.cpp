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

#include "app/studio_service.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

#include "app/batch_csv.hpp"
#include "canvas/aspect_normalizer.hpp"
#include "canvas/depth_proxy.hpp"
#include "canvas/enhance_ops.hpp"
#include "canvas/gif_animator.hpp"
#include "canvas/mask_converter.hpp"
#include "canvas/outpaint_planner.hpp"
#include "canvas/watermark_compositor.hpp"
#include "storage/store/duckdb_record_store.hpp"
#include "storage/store/memory_record_store.hpp"
#include "type/errors.hpp"
#include "type/hash_type.hpp"

namespace atelier {
namespace {
constexpr int         kMaxGenerateCount = 4;
constexpr const char* kOutpaintInstruction =
    ". Extend the scene naturally beyond the original borders, matching perspective, lighting "
    "and style.";

auto Trim(const std::string& s) -> std::string {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

auto Decode(raster_bytes_t&& bytes) -> cv::Mat {
  ImageBuffer buffer{std::move(bytes)};
  return buffer.GetCPUData().clone();
}

auto Encode(const cv::Mat& pixels) -> raster_bytes_t {
  ImageBuffer buffer{pixels.clone()};
  return std::move(buffer.GetBuffer());
}

// Put adapters in config order; names the config does not list keep their relative order
auto OrderAdapters(std::vector<std::shared_ptr<ModelAdapter>> adapters,
                   const std::vector<std::string>&            order)
    -> std::vector<std::shared_ptr<ModelAdapter>> {
  if (order.empty()) return adapters;
  std::vector<std::shared_ptr<ModelAdapter>> ordered;
  for (const auto& name : order) {
    auto it = std::find_if(adapters.begin(), adapters.end(),
                           [&](const auto& a) { return a && a->Name() == name; });
    if (it == adapters.end()) {
      std::cerr << "[WARN] StudioService: adapter_order names unknown adapter '" << name << "'"
                << std::endl;
      continue;
    }
    ordered.push_back(*it);
    adapters.erase(it);
  }
  for (auto& rest : adapters) {
    ordered.push_back(std::move(rest));
  }
  return ordered;
}
}  // namespace

StudioService::StudioService(StudioConfig config, std::vector<std::shared_ptr<ModelAdapter>> adapters,
                             std::shared_ptr<PromptEnricher>    enricher,
                             std::shared_ptr<BackgroundRemover> remover,
                             std::shared_ptr<RecordStore>       store)
    : config_(std::move(config)),
      store_(std::move(store)),
      composer_(std::move(enricher)),
      remover_(std::move(remover)) {
  if (!store_) {
    if (config_.db_path_.empty()) {
      store_ = std::make_shared<MemoryRecordStore>();
    } else {
      store_ = std::make_shared<DuckDBRecordStore>(config_.db_path_);
    }
  }
  std::shared_ptr<RecordStore> prompt_store;
  if (config_.prompt_db_path_.empty()) {
    prompt_store = std::make_shared<MemoryRecordStore>();
  } else {
    prompt_store = std::make_shared<DuckDBRecordStore>(config_.prompt_db_path_);
  }
  prompt_history_ = std::make_shared<PromptHistory>(std::move(prompt_store));

  std::filesystem::create_directories(config_.images_dir_);
  lineage_  = std::make_shared<LineageGraph>(store_);
  executor_ = std::make_shared<FallbackExecutor>(
      OrderAdapters(std::move(adapters), config_.adapter_order_));
  coordinator_ = std::make_unique<BatchCoordinator>(config_.worker_count_);
}

auto StudioService::RasterPath(const std::string& filename) const -> file_path_t {
  return config_.images_dir_ / filename;
}

auto StudioService::LoadSource(const asset_id_t& id) -> std::pair<ImageAsset, ImageBuffer> {
  ImageAsset asset  = lineage_->Get(id);
  auto       buffer = ImageBuffer::LoadFromPath(RasterPath(asset.filename_));
  return {std::move(asset), std::move(buffer)};
}

void StudioService::RequireValidSize(const ImageSize& size) const {
  if (!config_.IsValidSize(size)) {
    throw ValidationError("invalid size " + size.ToString());
  }
}

auto StudioService::ApiSizeFor(const ImageSize& size) const -> ImageSize {
  if (config_.IsValidSize(size)) {
    return size;
  }
  if (size.width_ > size.height_) return {1536, 1024};
  if (size.height_ > size.width_) return {1024, 1536};
  return {1024, 1024};
}

auto StudioService::ClosestApiSize(int width, int height) const -> ImageSize {
  const double ratio = static_cast<double>(width) / height;
  ImageSize    best  = config_.valid_sizes_.empty() ? ImageSize{1024, 1024}
                                                    : config_.valid_sizes_.front();
  double       best_diff = std::abs(static_cast<double>(best.width_) / best.height_ - ratio);
  for (const auto& candidate : config_.valid_sizes_) {
    double diff = std::abs(static_cast<double>(candidate.width_) / candidate.height_ - ratio);
    if (diff < best_diff) {
      best      = candidate;
      best_diff = diff;
    }
  }
  return best;
}

auto StudioService::SaveReference(const raster_bytes_t& bytes, const std::string& prefix,
                                  const ImageSize& size)
    -> std::pair<std::string, raster_bytes_t> {
  if (bytes.empty()) {
    throw ValidationError("reference image is empty");
  }
  auto        copy     = bytes;
  cv::Mat     prepared = PrepareReference(Decode(std::move(copy)), size);
  std::string filename = prefix + Hash128::Generate().ToString() + ".png";
  if (!cv::imwrite(RasterPath(filename).string(), prepared)) {
    throw std::runtime_error("StudioService: Failed to write reference " + filename);
  }
  return {filename, Encode(prepared)};
}

auto StudioService::StoreRaster(ImageAsset draft, const cv::Mat& pixels) -> ImageAsset {
  if (pixels.empty()) {
    throw std::runtime_error("StudioService: Refusing to store an empty raster");
  }
  if (draft.id_.empty()) {
    draft.id_ = Hash128::Generate().ToString();
  }
  draft.filename_ = draft.id_ + ".png";
  draft.width_    = pixels.cols;
  draft.height_   = pixels.rows;

  const auto path = RasterPath(draft.filename_);
  if (!cv::imwrite(path.string(), pixels)) {
    throw std::runtime_error("StudioService: Failed to write raster " + path.string());
  }
  return lineage_->Insert(std::move(draft));
}

auto StudioService::DeriveChild(const ImageAsset& parent, OperationKind kind,
                                OperationPayload payload, const cv::Mat& pixels) -> ImageAsset {
  ImageAsset child;
  child.parent_id_ = parent.id_;
  child.kind_      = kind;
  child.payload_   = std::move(payload);
  child.prompt_    = parent.prompt_;
  child.style_     = parent.style_;
  return StoreRaster(std::move(child), pixels);
}

auto StudioService::GenerateOne(const std::string& final_prompt, const std::string& display_prompt,
                                const std::string& style, const ImageSize& size,
                                const std::optional<std::string>& preferred, OperationKind kind,
                                GenerationParams params) -> ImageAsset {
  auto result   = executor_->Synthesize({final_prompt, size}, preferred);
  auto pixels   = NormalizeToAspect(Decode(std::move(result.bytes_)), size);

  params.style_ = style;
  if (params.model_.empty()) {
    params.model_ = result.model_;
  }
  ImageAsset asset;
  asset.kind_    = kind;
  asset.prompt_  = display_prompt;
  asset.style_   = style;
  asset.payload_ = std::move(params);
  return StoreRaster(std::move(asset), pixels);
}

auto StudioService::Generate(const GenerateRequest& request) -> GenerateResult {
  RequireValidSize(request.size_);
  if (Trim(request.prompt_).empty()) {
    throw ValidationError("prompt must not be empty");
  }
  if (request.count_ < 1 || request.count_ > kMaxGenerateCount) {
    throw ValidationError("count must be within [1, 4]");
  }
  prompt_history_->Record(request.prompt_);

  auto composed =
      composer_.ComposeGeneration(request.prompt_, request.style_, request.enhance_,
                                  request.text_overlay_);
  GenerationParams params;
  params.enhanced_prompt_ = composed.enhanced_;

  GenerateResult result;
  if (request.count_ == 1) {
    result.assets_.push_back(GenerateOne(composed.final_, request.prompt_, request.style_,
                                         request.size_, request.model_, OperationKind::ORIGINAL,
                                         params));
    return result;
  }

  result.group_id_ = Hash128::Generate().ToString();
  params.group_id_ = result.group_id_;
  std::vector<BatchUnit> units;
  for (int i = 0; i < request.count_; ++i) {
    units.emplace_back([this, composed, request, params]() {
      return GenerateOne(composed.final_, request.prompt_, request.style_, request.size_,
                         request.model_, OperationKind::ORIGINAL, params);
    });
  }
  auto outcome     = coordinator_->RunAll(std::move(units));
  result.assets_   = std::move(outcome.assets_);
  result.errors_   = std::move(outcome.errors_);
  return result;
}

auto StudioService::Compare(const std::string& prompt, const std::string& style,
                            const ImageSize& size) -> CompareResult {
  RequireValidSize(size);
  if (Trim(prompt).empty()) {
    throw ValidationError("prompt must not be empty");
  }
  const auto models = executor_->AdapterNames();
  if (models.empty()) {
    throw ValidationError("no models configured to compare");
  }
  const std::string final_prompt = prompt + PromptComposer::StyleSuffix(style);

  CompareResult     result;
  result.comparison_id_ = Hash128::Generate().ToString();

  std::vector<BatchUnit> units;
  for (const auto& model : models) {
    GenerationParams params;
    params.model_         = model;
    params.comparison_id_ = result.comparison_id_;
    units.emplace_back([this, final_prompt, prompt, style, size, model, params]() {
      try {
        return GenerateOne(final_prompt, prompt, style, size, model, OperationKind::ORIGINAL,
                           params);
      } catch (const std::exception& e) {
        throw StudioError(model + ": " + e.what());
      }
    });
  }
  auto outcome = coordinator_->RunAll(std::move(units));

  for (const auto& model : models) {
    CompareEntry entry;
    entry.model_ = model;
    for (const auto& asset : outcome.assets_) {
      const auto* params = std::get_if<GenerationParams>(&asset.payload_);
      if (params && params->model_ == model) {
        entry.asset_ = asset;
        break;
      }
    }
    if (!entry.asset_.has_value()) {
      const std::string prefix = model + ": ";
      for (const auto& error : outcome.errors_) {
        if (error.rfind(prefix, 0) == 0) {
          entry.error_ = error.substr(prefix.size());
          break;
        }
      }
    }
    result.results_.push_back(std::move(entry));
  }
  return result;
}

auto StudioService::Refine(const asset_id_t& id, const std::string& instruction) -> ImageAsset {
  if (Trim(instruction).empty()) {
    throw ValidationError("refinement instruction must not be empty");
  }
  auto [parent, source] = LoadSource(id);
  const std::string merged = composer_.MergeRefinement(parent.prompt_, instruction);
  const ImageSize   size   = config_.IsValidSize(parent.Size()) ? parent.Size()
                                                                 : ImageSize{1024, 1024};

  auto result = executor_->Synthesize({merged + PromptComposer::StyleSuffix(parent.style_), size});
  auto pixels = NormalizeToAspect(Decode(std::move(result.bytes_)), size);

  ImageAsset child;
  child.parent_id_ = parent.id_;
  child.kind_      = OperationKind::REFINE;
  child.prompt_    = merged;
  child.style_     = parent.style_;
  child.payload_   = RefineParams{instruction, parent.prompt_};
  return StoreRaster(std::move(child), pixels);
}

auto StudioService::GenerateFromImage(const raster_bytes_t& reference, const std::string& prompt,
                                      const std::string& style, const ImageSize& size)
    -> ImageAsset {
  RequireValidSize(size);
  if (Trim(prompt).empty()) {
    throw ValidationError("prompt must not be empty");
  }
  auto [ref_filename, ref_bytes] = SaveReference(reference, "ref_", size);
  const std::string generation   = composer_.ComposeFromReference(reference, prompt, style);

  auto result = executor_->EditOrSynthesize({ref_bytes, std::nullopt, generation, size},
                                            generation);
  auto pixels = NormalizeToAspect(Decode(std::move(result.bytes_)), size);

  GenerationParams params;
  params.style_              = style;
  params.model_              = result.model_;
  params.reference_filename_ = ref_filename;

  ImageAsset asset;
  asset.kind_    = OperationKind::ORIGINAL;
  asset.prompt_  = prompt;
  asset.style_   = style;
  asset.payload_ = std::move(params);
  return StoreRaster(std::move(asset), pixels);
}

auto StudioService::Inpaint(const asset_id_t& id, const raster_bytes_t& mask,
                            const std::string& prompt) -> ImageAsset {
  if (Trim(prompt).empty()) {
    throw ValidationError("inpaint prompt must not be empty");
  }
  if (mask.empty()) {
    throw ValidationError("inpaint mask is empty");
  }
  auto [parent, source] = LoadSource(id);
  const ImageSize parent_size{source.Width(), source.Height()};
  const ImageSize api_size = ApiSizeFor(parent_size);

  auto            mask_copy = mask;
  cv::Mat         alpha     = MaskToAlpha(Decode(std::move(mask_copy)), api_size);
  cv::Mat         resized   = PrepareReference(source.GetCPUData(), api_size);

  EditRequest     request{Encode(resized), Encode(alpha), prompt, api_size};
  auto            result = executor_->EditChain(request);
  auto            pixels = NormalizeToAspect(Decode(std::move(result.bytes_)), parent_size);

  ImageAsset      child;
  child.parent_id_ = parent.id_;
  child.kind_      = OperationKind::INPAINT;
  child.prompt_    = prompt;
  child.style_     = parent.style_;
  child.payload_   = InpaintParams{prompt, api_size.ToString()};
  return StoreRaster(std::move(child), pixels);
}

auto StudioService::Upscale(const asset_id_t& id, int factor) -> ImageAsset {
  if (factor != 2 && factor != 4) {
    throw ValidationError("upscale factor must be 2 or 4");
  }
  auto [parent, source] = LoadSource(id);
  return DeriveChild(parent, OperationKind::UPSCALE, UpscaleParams{factor},
                     UpscaleImage(source.GetCPUData(), factor));
}

auto StudioService::Adjust(const asset_id_t& id, const AdjustParams& params) -> ImageAsset {
  ValidateAdjustments(params);
  auto [parent, source] = LoadSource(id);
  return DeriveChild(parent, OperationKind::ADJUST, params,
                     ApplyAdjustments(source.GetCPUData(), params));
}

auto StudioService::Watermark(const asset_id_t& id, const WatermarkParams& params) -> ImageAsset {
  ValidateWatermark(params);
  auto [parent, source] = LoadSource(id);
  return DeriveChild(parent, OperationKind::WATERMARK, params,
                     CompositeWatermark(source.GetCPUData(), params));
}

auto StudioService::Outpaint(const asset_id_t& id, const std::vector<std::string>& directions,
                             int amount) -> ImageAsset {
  auto [parent, source] = LoadSource(id);
  const OutpaintPlan plan =
      PlanOutpaint(source.Width(), source.Height(), directions, amount);
  OutpaintCanvas     canvas   = BuildOutpaintCanvas(source.GetCPUData(), plan);

  const ImageSize    api_size = ClosestApiSize(plan.width_, plan.height_);
  const cv::Size     api_cv(api_size.width_, api_size.height_);
  cv::Mat            api_canvas = ResizeExact(canvas.canvas_, api_cv);
  cv::Mat            api_mask   = MaskToAlpha(canvas.mask_, api_size);

  const std::string  prompt =
      (parent.prompt_.empty() ? std::string("Continue the image") : parent.prompt_) +
      kOutpaintInstruction;
  auto               result =
      executor_->EditChain({Encode(api_canvas), Encode(api_mask), prompt, api_size});
  cv::Mat            pixels = ResizeExact(Decode(std::move(result.bytes_)), plan.Size());

  OutpaintParams     params;
  params.directions_ = directions;
  params.amount_     = amount;
  params.ext_left_   = plan.left_;
  params.ext_right_  = plan.right_;
  params.ext_top_    = plan.up_;
  params.ext_bottom_ = plan.down_;
  return DeriveChild(parent, OperationKind::OUTPAINT, std::move(params), pixels);
}

auto StudioService::DepthMap(const asset_id_t& id) -> ImageAsset {
  auto [parent, source] = LoadSource(id);
  return DeriveChild(parent, OperationKind::DEPTH_MAP, DepthMapParams{},
                     SynthesizeDepthMap(source.GetCPUData()));
}

auto StudioService::ReplaceObject(const asset_id_t& id, const std::string& target,
                                  const std::string& replacement, bool preserve_style)
    -> ImageAsset {
  if (Trim(target).empty()) {
    throw ValidationError("target_object cannot be empty");
  }
  if (Trim(replacement).empty()) {
    throw ValidationError("replacement cannot be empty");
  }
  auto [parent, source] = LoadSource(id);
  const ImageSize   parent_size{source.Width(), source.Height()};
  const ImageSize   api_size = ApiSizeFor(parent_size);
  const std::string prompt =
      PromptComposer::ComposeObjectReplacement(target, replacement, preserve_style);

  auto result = executor_->Edit({Encode(PrepareReference(source.GetCPUData(), api_size)),
                                 std::nullopt, prompt, api_size});
  auto pixels = NormalizeToAspect(Decode(std::move(result.bytes_)), parent_size);

  ImageAsset child;
  child.parent_id_ = parent.id_;
  child.kind_      = OperationKind::OBJECT_REPLACEMENT;
  child.prompt_    = prompt;
  child.style_     = parent.style_;
  child.payload_   = ObjectReplacementParams{target, replacement, preserve_style};
  return StoreRaster(std::move(child), pixels);
}

auto StudioService::StyleTransfer(const raster_bytes_t& reference, const std::string& prompt,
                                  float strength, const std::string& style, const ImageSize& size)
    -> ImageAsset {
  RequireValidSize(size);
  if (Trim(prompt).empty()) {
    throw ValidationError("prompt must not be empty");
  }
  if (!(strength >= 0.0f && strength <= 1.0f)) {
    throw ValidationError("strength must be within [0, 1]");
  }
  auto [ref_filename, ref_bytes] = SaveReference(reference, "style_", size);
  prompt_history_->Record(prompt);
  auto [generation, description] =
      composer_.ComposeStyleTransfer(reference, prompt, strength, style);

  auto result = executor_->Synthesize({generation, size});
  auto pixels = NormalizeToAspect(Decode(std::move(result.bytes_)), size);

  ImageAsset asset;
  asset.kind_    = OperationKind::STYLE_TRANSFER;
  asset.prompt_  = prompt;
  asset.style_   = style;
  asset.payload_ = StyleTransferParams{strength, description, ref_filename};
  return StoreRaster(std::move(asset), pixels);
}

auto StudioService::ProductPhoto(const asset_id_t& id, const std::string& scene,
                                 const std::string& background_color) -> ImageAsset {
  const std::string prompt = PromptComposer::ComposeProductScene(scene, background_color);
  auto [parent, source]    = LoadSource(id);
  const ImageSize parent_size{source.Width(), source.Height()};
  const ImageSize api_size = ApiSizeFor(parent_size);

  auto result = executor_->EditOrSynthesize(
      {Encode(PrepareReference(source.GetCPUData(), api_size)), std::nullopt, prompt, api_size},
      parent.prompt_.empty() ? prompt : parent.prompt_ + ". " + prompt);
  auto pixels = NormalizeToAspect(Decode(std::move(result.bytes_)), parent_size);
  return DeriveChild(parent, OperationKind::PRODUCT_PHOTO,
                     ProductPhotoParams{scene, background_color}, pixels);
}

auto StudioService::ApplyPreset(const StylePreset& preset, const std::string& prompt)
    -> ImageAsset {
  if (Trim(preset.name_).empty()) {
    throw ValidationError("preset name must not be empty");
  }
  const ImageSize size = ParseImageSize(preset.size_);
  RequireValidSize(size);
  const std::string base = PromptComposer::ComposePreset(preset, prompt);
  if (base.empty()) {
    throw ValidationError("preset produced an empty prompt");
  }
  auto             composed = composer_.ComposeGeneration(base, preset.style_, preset.enhance_);

  GenerationParams params;
  params.enhanced_prompt_ = composed.enhanced_;
  params.preset_name_     = preset.name_;
  return GenerateOne(composed.final_, prompt, preset.style_, size, std::nullopt,
                     OperationKind::STYLE_PRESET, std::move(params));
}

auto StudioService::ExportGif(const asset_id_t& id, const std::string& effect, double duration,
                              int fps) -> raster_bytes_t {
  GifSpec spec;
  spec.effect_   = GifEffectFromString(effect);
  spec.duration_ = duration;
  spec.fps_      = fps;
  spec.max_edge_ = config_.gif_max_edge_;

  auto [asset, source] = LoadSource(id);
  return EncodeGif(BuildGifFrames(source.GetCPUData(), spec), fps);
}

auto StudioService::RemoveBackground(const asset_id_t& id) -> ImageAsset {
  if (!remover_) {
    throw ValidationError("background removal is not configured");
  }
  auto [parent, source] = LoadSource(id);
  const cv::Size parent_size(source.Width(), source.Height());
  cv::Mat        cut = Decode(remover_->Remove(source.GetBuffer()));
  if (cut.size() != parent_size) {
    cut = ResizeExact(cut, parent_size);
  }
  return DeriveChild(parent, OperationKind::BACKGROUND_REMOVAL, BackgroundRemovalParams{}, cut);
}

auto StudioService::SubmitCsvBatch(const std::string& csv) -> job_id_t {
  auto                   rows     = ParseBatchCsv(csv, config_.valid_sizes_);
  const job_id_t         batch_id = Hash128::Generate().ToString();

  std::vector<BatchUnit> units;
  units.reserve(rows.size());
  for (auto& row : rows) {
    units.emplace_back([this, row, batch_id]() {
      const std::string final_prompt = row.prompt_ + PromptComposer::StyleSuffix(row.style_);
      GenerationParams  params;
      params.batch_id_ = batch_id;
      return GenerateOne(final_prompt, row.prompt_, row.style_, row.size_, row.model_,
                         OperationKind::BATCH_ITEM, std::move(params));
    });
  }
  return coordinator_->Submit(std::move(units), batch_id);
}

auto StudioService::GetBatchStatus(const job_id_t& id) -> BatchSnapshot {
  return coordinator_->Query(id);
}

auto StudioService::AwaitBatch(const job_id_t& id) -> BatchSnapshot {
  return coordinator_->Await(id);
}

auto StudioService::ExpireBatch(const job_id_t& id) -> bool { return coordinator_->Expire(id); }
};  // namespace atelier
