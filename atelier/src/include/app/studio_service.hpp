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

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "app/batch_coordinator.hpp"
#include "app/prompt_composer.hpp"
#include "app/prompt_history.hpp"
#include "app/studio_config.hpp"
#include "image/image_buffer.hpp"
#include "lineage/lineage_graph.hpp"
#include "model/fallback_executor.hpp"
#include "storage/store/record_store.hpp"

namespace atelier {
struct GenerateRequest {
  std::string                prompt_;
  std::string                style_ = "none";
  ImageSize                  size_{1024, 1024};
  std::optional<std::string> model_;
  bool                       enhance_ = false;
  int                        count_   = 1;
  std::optional<TextOverlay> text_overlay_;
};

struct GenerateResult {
  std::vector<ImageAsset>  assets_;
  // Set when count_ > 1
  std::string              group_id_;
  std::vector<std::string> errors_;
};

struct CompareEntry {
  std::string               model_;
  std::optional<ImageAsset> asset_;
  std::string               error_;
};

struct CompareResult {
  std::string               comparison_id_;
  std::vector<CompareEntry> results_;
};

/**
 * @brief Every single-asset pipeline of the studio: validate, call the model backends through
 *        the fallback executor, run the canvas transforms, write the raster and record the
 *        lineage node. Batch work is handed to the BatchCoordinator.
 */
class StudioService {
 private:
  StudioConfig                       config_;
  std::shared_ptr<RecordStore>       store_;
  std::shared_ptr<LineageGraph>      lineage_;
  std::shared_ptr<FallbackExecutor>  executor_;
  PromptComposer                     composer_;
  std::shared_ptr<BackgroundRemover> remover_;
  std::shared_ptr<PromptHistory>     prompt_history_;

  // Declared last: its pool drains queued units while everything above is still alive
  std::unique_ptr<BatchCoordinator>  coordinator_;

  auto RasterPath(const std::string& filename) const -> file_path_t;
  auto LoadSource(const asset_id_t& id) -> std::pair<ImageAsset, ImageBuffer>;
  auto ApiSizeFor(const ImageSize& size) const -> ImageSize;
  auto ClosestApiSize(int width, int height) const -> ImageSize;
  void RequireValidSize(const ImageSize& size) const;
  auto SaveReference(const raster_bytes_t& bytes, const std::string& prefix,
                     const ImageSize& size) -> std::pair<std::string, raster_bytes_t>;

  /**
   * @brief Write pixels to images_dir as <id>.png and insert the asset into the lineage graph.
   */
  auto StoreRaster(ImageAsset draft, const cv::Mat& pixels) -> ImageAsset;
  auto DeriveChild(const ImageAsset& parent, OperationKind kind, OperationPayload payload,
                   const cv::Mat& pixels) -> ImageAsset;

  auto GenerateOne(const std::string& final_prompt, const std::string& display_prompt,
                   const std::string& style, const ImageSize& size,
                   const std::optional<std::string>& preferred, OperationKind kind,
                   GenerationParams params) -> ImageAsset;

 public:
  StudioService(StudioConfig config, std::vector<std::shared_ptr<ModelAdapter>> adapters,
                std::shared_ptr<PromptEnricher>    enricher = nullptr,
                std::shared_ptr<BackgroundRemover> remover  = nullptr,
                std::shared_ptr<RecordStore>       store    = nullptr);

  StudioService(const StudioService&)            = delete;
  StudioService& operator=(const StudioService&) = delete;

  auto GetConfig() const -> const StudioConfig& { return config_; }
  auto GetLineage() const -> std::shared_ptr<LineageGraph> { return lineage_; }
  auto GetExecutor() const -> std::shared_ptr<FallbackExecutor> { return executor_; }
  auto GetPromptHistory() const -> std::shared_ptr<PromptHistory> { return prompt_history_; }

  auto Generate(const GenerateRequest& request) -> GenerateResult;
  auto Compare(const std::string& prompt, const std::string& style, const ImageSize& size)
      -> CompareResult;
  auto Refine(const asset_id_t& id, const std::string& instruction) -> ImageAsset;
  auto GenerateFromImage(const raster_bytes_t& reference, const std::string& prompt,
                         const std::string& style, const ImageSize& size) -> ImageAsset;

  auto Inpaint(const asset_id_t& id, const raster_bytes_t& mask, const std::string& prompt)
      -> ImageAsset;
  auto Upscale(const asset_id_t& id, int factor) -> ImageAsset;
  auto Adjust(const asset_id_t& id, const AdjustParams& params) -> ImageAsset;
  auto Watermark(const asset_id_t& id, const WatermarkParams& params) -> ImageAsset;
  auto Outpaint(const asset_id_t& id, const std::vector<std::string>& directions, int amount)
      -> ImageAsset;
  auto DepthMap(const asset_id_t& id) -> ImageAsset;
  auto ReplaceObject(const asset_id_t& id, const std::string& target,
                     const std::string& replacement, bool preserve_style) -> ImageAsset;
  auto StyleTransfer(const raster_bytes_t& reference, const std::string& prompt, float strength,
                     const std::string& style, const ImageSize& size) -> ImageAsset;
  auto ProductPhoto(const asset_id_t& id, const std::string& scene,
                    const std::string& background_color) -> ImageAsset;
  auto ApplyPreset(const StylePreset& preset, const std::string& prompt) -> ImageAsset;
  auto ExportGif(const asset_id_t& id, const std::string& effect, double duration, int fps)
      -> raster_bytes_t;
  auto RemoveBackground(const asset_id_t& id) -> ImageAsset;

  auto SubmitCsvBatch(const std::string& csv) -> job_id_t;
  auto GetBatchStatus(const job_id_t& id) -> BatchSnapshot;
  auto AwaitBatch(const job_id_t& id) -> BatchSnapshot;
  auto ExpireBatch(const job_id_t& id) -> bool;

  auto Undo(const asset_id_t& id) -> ImageAsset { return lineage_->Undo(id); }
  auto Redo(const asset_id_t& id) -> ImageAsset { return lineage_->Redo(id); }
  auto History(const asset_id_t& id) -> HistoryView { return lineage_->History(id); }
  auto ToggleFavorite(const asset_id_t& id) -> bool { return lineage_->ToggleFavorite(id); }
  auto Get(const asset_id_t& id) -> ImageAsset { return lineage_->Get(id); }
  auto List(size_t page, size_t limit, const std::string& search = "",
            bool favorites_only = false) -> AssetPage {
    return lineage_->List(page, limit, search, favorites_only);
  }

  auto RecentPrompts(size_t limit = PromptHistory::kMaxEntries) -> std::vector<PromptEntry> {
    return prompt_history_->Recent(limit);
  }
  auto SuggestPrompts(const std::string& query) -> std::vector<PromptEntry> {
    return prompt_history_->Suggest(query);
  }
  void ClearPromptHistory() { prompt_history_->Clear(); }
};
};  // namespace atelier
