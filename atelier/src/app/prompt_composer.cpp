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

#include "app/prompt_composer.hpp"

#include <exception>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "type/errors.hpp"

namespace atelier {
namespace {
const std::unordered_map<std::string, std::string> kStyleSuffixes = {
    {"none", ""},
    {"photorealistic", ", photorealistic, ultra detailed, 8k, DSLR photo"},
    {"digital-art", ", digital art, vibrant colors, detailed illustration"},
    {"watercolor", ", watercolor painting, soft edges, artistic, paper texture"},
    {"oil-painting", ", oil painting, rich textures, classical style, canvas"},
    {"anime", ", anime style, manga, Japanese animation, cel shaded"},
    {"3d-render", ", 3D render, Cinema 4D, octane render, detailed lighting"},
    {"minimalist", ", minimalist, clean lines, simple shapes, modern design"},
    {"vintage", ", vintage, retro, film grain, muted colors, nostalgic"},
};

const std::unordered_map<std::string, std::string> kProductScenes = {
    {"studio",
     "Place this product in a professional studio setting with soft box lighting and a clean "
     "seamless backdrop"},
    {"outdoor",
     "Place this product outdoors in natural daylight with a softly blurred landscape behind it"},
    {"lifestyle",
     "Show this product in a warm, lived-in lifestyle scene being naturally used at home"},
    {"flat-lay",
     "Arrange this product in a top-down flat-lay composition with complementary props"},
    {"holiday",
     "Place this product in a festive holiday scene with warm lights and seasonal decorations"},
};

const std::unordered_set<std::string> kFontHints   = {"bold",      "handwritten", "3d",
                                                      "graffiti",  "serif",       "sans-serif",
                                                      "decorative"};
const std::unordered_set<std::string> kPlacements  = {"center", "top", "bottom"};

auto Trim(const std::string& s) -> std::string {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

void WarnEnrichment(const char* what, const std::exception& e) {
  std::cerr << "[WARN] PromptComposer: " << what << " failed, using fallback: " << e.what()
            << std::endl;
}

void WarnEnrichment(const char* what) {
  std::cerr << "[WARN] PromptComposer: " << what
            << " failed with a non-standard exception, using fallback" << std::endl;
}
}  // namespace

auto PromptComposer::StyleSuffix(const std::string& style) -> std::string {
  auto it = kStyleSuffixes.find(style);
  return it == kStyleSuffixes.end() ? std::string() : it->second;
}

auto PromptComposer::ApplyTextOverlay(const std::string&                prompt,
                                      const std::optional<TextOverlay>& overlay) -> std::string {
  if (!overlay.has_value() || overlay->text_.empty()) {
    return prompt;
  }
  const std::string font = kFontHints.contains(overlay->font_hint_) ? overlay->font_hint_ : "bold";
  const std::string placement =
      kPlacements.contains(overlay->placement_) ? overlay->placement_ : "center";
  return prompt + ", with the text \"" + overlay->text_ + "\" prominently displayed in " + font +
         " lettering positioned at the " + placement + " of the image";
}

auto PromptComposer::StrengthWord(float strength) -> std::string {
  if (strength < 0.4f) return "subtly";
  if (strength < 0.7f) return "moderately";
  return "strongly";
}

auto PromptComposer::ComposeGeneration(const std::string& prompt, const std::string& style,
                                       bool enhance, const std::optional<TextOverlay>& overlay)
    -> ComposedPrompt {
  ComposedPrompt composed;
  std::string    base = prompt;
  if (enhance && enricher_) {
    try {
      composed.enhanced_ = enricher_->Enhance(prompt);
      base               = *composed.enhanced_;
    } catch (const std::exception& e) {
      WarnEnrichment("Prompt enhancement", e);
      composed.enhanced_.reset();
    } catch (...) {
      WarnEnrichment("Prompt enhancement");
      composed.enhanced_.reset();
    }
  }
  composed.final_ = ApplyTextOverlay(base + StyleSuffix(style), overlay);
  return composed;
}

auto PromptComposer::MergeRefinement(const std::string& original, const std::string& instruction)
    -> std::string {
  if (enricher_) {
    try {
      return enricher_->MergeRefinement(original, instruction);
    } catch (const std::exception& e) {
      WarnEnrichment("Refinement merge", e);
    } catch (...) {
      WarnEnrichment("Refinement merge");
    }
  }
  return original + ". " + instruction;
}

auto PromptComposer::ComposeFromReference(const raster_bytes_t& reference,
                                          const std::string& prompt, const std::string& style)
    -> std::string {
  const std::string suffix = StyleSuffix(style);
  if (enricher_) {
    try {
      const std::string description = enricher_->DescribeReference(reference);
      return "Based on this reference image: " + description +
             ". Now apply this modification: " + prompt + suffix;
    } catch (const std::exception& e) {
      WarnEnrichment("Reference description", e);
    } catch (...) {
      WarnEnrichment("Reference description");
    }
  }
  return prompt + suffix;
}

auto PromptComposer::ComposeStyleTransfer(const raster_bytes_t& reference,
                                          const std::string& prompt, float strength,
                                          const std::string& style)
    -> std::pair<std::string, std::string> {
  std::string description = kFallbackStyleDescription;
  if (enricher_) {
    try {
      description = enricher_->DescribeStyle(reference);
    } catch (const std::exception& e) {
      WarnEnrichment("Style description", e);
    } catch (...) {
      WarnEnrichment("Style description");
    }
  }
  std::string generation = prompt + ", " + StrengthWord(strength) +
                           " in the style of: " + description + StyleSuffix(style);
  return {generation, description};
}

auto PromptComposer::ComposeObjectReplacement(const std::string& target,
                                              const std::string& replacement, bool preserve_style)
    -> std::string {
  std::string prompt = "Replace '" + target + "' with '" + replacement +
                       "' in this image, keeping everything else exactly the same.";
  if (preserve_style) {
    prompt +=
        " Maintain the exact same artistic style, lighting, color palette, and composition.";
  }
  return prompt;
}

auto PromptComposer::ComposeProductScene(const std::string& scene,
                                         const std::string& background_color) -> std::string {
  auto it = kProductScenes.find(scene);
  if (it == kProductScenes.end()) {
    throw ValidationError("invalid product scene: " + scene);
  }
  std::string prompt = it->second;
  if (!background_color.empty()) {
    prompt += ", with a " + background_color + " background";
  }
  return prompt + ". Keep the product itself unchanged, commercial product photography.";
}

auto PromptComposer::ComposePreset(const StylePreset& preset, const std::string& prompt)
    -> std::string {
  std::string composed = Trim(preset.prompt_prefix_);
  const std::string body = Trim(prompt);
  if (!body.empty()) {
    composed += composed.empty() ? body : " " + body;
  }
  const std::string suffix = Trim(preset.prompt_suffix_);
  if (!suffix.empty()) {
    composed += composed.empty() ? suffix : " " + suffix;
  }
  const std::string negative = Trim(preset.negative_prompt_);
  if (!negative.empty()) {
    composed += ". Avoid: " + negative;
  }
  return composed;
}
};  // namespace atelier
