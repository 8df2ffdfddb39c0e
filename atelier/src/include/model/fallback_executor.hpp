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
#include <vector>

#include "model/fallback_chain.hpp"
#include "model/model_adapter.hpp"

namespace atelier {
/**
 * @brief Bytes produced by a fallback run, tagged with the strategy that produced them.
 */
struct AdapterResult {
  raster_bytes_t bytes_;
  std::string    model_;
};

class FallbackExecutor {
 private:
  std::vector<std::shared_ptr<ModelAdapter>> adapters_;

  auto OrderFor(const std::optional<std::string>& preferred) const
      -> std::vector<std::shared_ptr<ModelAdapter>>;

 public:
  static constexpr const char* kBlendSuffix =
      ". Seamlessly blend with the surrounding image context.";

  explicit FallbackExecutor(std::vector<std::shared_ptr<ModelAdapter>> adapters);

  auto AdapterNames() const -> std::vector<std::string>;
  auto HasAdapter(const std::string& name) const -> bool;

  /**
   * @brief Text-to-image over every adapter. A known preferred adapter is tried first; an
   *        unknown one is ignored with a warning.
   */
  auto Synthesize(const GenerationRequest& request,
                  const std::optional<std::string>& preferred = std::nullopt) const
      -> AdapterResult;

  auto Edit(const EditRequest& request,
            const std::optional<std::string>& preferred = std::nullopt) const -> AdapterResult;

  /**
   * @brief Edit then synthesize: the edit attempts over every adapter, then text-to-image
   *        from the prompt alone.
   */
  auto EditOrSynthesize(const EditRequest& request, const std::string& synth_prompt,
                        const std::optional<std::string>& preferred = std::nullopt) const
      -> AdapterResult;

  /**
   * @brief Three-stage chain for masked edits on the lead adapter: edit with the mask, edit
   *        without it, then regenerate from the prompt with kBlendSuffix over every adapter.
   */
  auto EditChain(const EditRequest& request,
                 const std::optional<std::string>& preferred = std::nullopt) const
      -> AdapterResult;
};
};  // namespace atelier
