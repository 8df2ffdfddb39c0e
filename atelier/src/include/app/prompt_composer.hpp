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

#include "type/type.hpp"

namespace atelier {
/**
 * @brief Text model used to improve prompts. Every call may throw; PromptComposer treats any
 *        failure as "no enrichment" and falls back to a deterministic prompt.
 */
class PromptEnricher {
 public:
  virtual ~PromptEnricher()                                                         = default;

  virtual auto Enhance(const std::string& prompt) -> std::string                    = 0;
  virtual auto MergeRefinement(const std::string& original, const std::string& instruction)
      -> std::string                                                                = 0;
  virtual auto DescribeReference(const raster_bytes_t& reference) -> std::string    = 0;
  virtual auto DescribeStyle(const raster_bytes_t& reference) -> std::string        = 0;
};

struct TextOverlay {
  std::string text_;
  std::string font_hint_ = "bold";
  std::string placement_ = "center";
};

struct ComposedPrompt {
  std::string                final_;
  std::optional<std::string> enhanced_;
};

/**
 * @brief Saved prompt recipe applied on top of a user prompt.
 */
struct StylePreset {
  std::string name_;
  std::string prompt_prefix_;
  std::string prompt_suffix_;
  std::string style_ = "none";
  std::string size_  = "1024x1024";
  bool        enhance_ = false;
  std::string negative_prompt_;
};

class PromptComposer {
 private:
  std::shared_ptr<PromptEnricher> enricher_;

 public:
  static constexpr const char* kFallbackStyleDescription = "artistic, stylized";

  explicit PromptComposer(std::shared_ptr<PromptEnricher> enricher = nullptr)
      : enricher_(std::move(enricher)) {}

  static auto StyleSuffix(const std::string& style) -> std::string;
  static auto ApplyTextOverlay(const std::string& prompt, const std::optional<TextOverlay>& overlay)
      -> std::string;
  static auto StrengthWord(float strength) -> std::string;

  /**
   * @brief Optional enhancement, then the style suffix, then the text overlay instruction.
   */
  auto        ComposeGeneration(const std::string& prompt, const std::string& style, bool enhance,
                                const std::optional<TextOverlay>& overlay = std::nullopt)
      -> ComposedPrompt;

  /**
   * @brief Merged prompt without style suffix; "<prompt>. <instruction>" when the enricher is
   *        unavailable or fails.
   */
  auto        MergeRefinement(const std::string& original, const std::string& instruction)
      -> std::string;

  auto        ComposeFromReference(const raster_bytes_t& reference, const std::string& prompt,
                                   const std::string& style) -> std::string;

  /**
   * @brief Returns the generation prompt and the style description it used.
   */
  auto        ComposeStyleTransfer(const raster_bytes_t& reference, const std::string& prompt,
                                   float strength, const std::string& style)
      -> std::pair<std::string, std::string>;

  static auto ComposeObjectReplacement(const std::string& target, const std::string& replacement,
                                       bool preserve_style) -> std::string;
  /**
   * @brief Throws ValidationError for an unknown scene.
   */
  static auto ComposeProductScene(const std::string& scene, const std::string& background_color)
      -> std::string;
  static auto ComposePreset(const StylePreset& preset, const std::string& prompt) -> std::string;
};
};  // namespace atelier
