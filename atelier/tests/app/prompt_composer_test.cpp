#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>

#include "app/prompt_composer.hpp"
#include "type/errors.hpp"

using namespace atelier;

namespace {
class ScriptedEnricher : public PromptEnricher {
 public:
  bool fail_     = false;
  // Throws a value that is not a std::exception
  bool fail_raw_ = false;

  void MaybeFail() const {
    if (fail_) throw std::runtime_error("enricher offline");
    if (fail_raw_) throw 42;
  }

  auto Enhance(const std::string& prompt) -> std::string override {
    MaybeFail();
    return prompt + ", golden hour";
  }
  auto MergeRefinement(const std::string& original, const std::string& instruction)
      -> std::string override {
    MaybeFail();
    return original + " but " + instruction;
  }
  auto DescribeReference(const raster_bytes_t&) -> std::string override {
    MaybeFail();
    return "a cat on a sofa";
  }
  auto DescribeStyle(const raster_bytes_t&) -> std::string override {
    MaybeFail();
    return "bold cubist shapes";
  }
};
}  // namespace

TEST(PromptComposerTests, StyleSuffixes) {
  EXPECT_EQ(PromptComposer::StyleSuffix("none"), "");
  EXPECT_EQ(PromptComposer::StyleSuffix("anime"),
            ", anime style, manga, Japanese animation, cel shaded");
  EXPECT_EQ(PromptComposer::StyleSuffix("unknown-style"), "");
}

TEST(PromptComposerTests, GenerationWithoutEnricher) {
  PromptComposer composer;
  auto           composed = composer.ComposeGeneration("a lighthouse", "vintage", true);
  EXPECT_FALSE(composed.enhanced_.has_value());
  EXPECT_EQ(composed.final_, "a lighthouse, vintage, retro, film grain, muted colors, nostalgic");
}

TEST(PromptComposerTests, GenerationEnhancedWithOverlay) {
  auto           enricher = std::make_shared<ScriptedEnricher>();
  PromptComposer composer(enricher);
  TextOverlay    overlay;
  overlay.text_      = "SALE";
  overlay.placement_ = "top";
  auto composed      = composer.ComposeGeneration("a shop", "none", true, overlay);
  ASSERT_TRUE(composed.enhanced_.has_value());
  EXPECT_EQ(*composed.enhanced_, "a shop, golden hour");
  EXPECT_EQ(composed.final_,
            "a shop, golden hour, with the text \"SALE\" prominently displayed in bold lettering "
            "positioned at the top of the image");
}

TEST(PromptComposerTests, EnricherFailureFallsBack) {
  auto enricher   = std::make_shared<ScriptedEnricher>();
  enricher->fail_ = true;
  PromptComposer composer(enricher);

  auto composed   = composer.ComposeGeneration("a shop", "none", true);
  EXPECT_FALSE(composed.enhanced_.has_value());
  EXPECT_EQ(composed.final_, "a shop");
  EXPECT_EQ(composer.MergeRefinement("a dog", "make it blue"), "a dog. make it blue");
  EXPECT_EQ(composer.ComposeFromReference({}, "add a hat", "none"), "add a hat");

  auto [generation, description] = composer.ComposeStyleTransfer({}, "a tree", 0.5f, "none");
  EXPECT_EQ(description, PromptComposer::kFallbackStyleDescription);
  EXPECT_EQ(generation, "a tree, moderately in the style of: artistic, stylized");
}

TEST(PromptComposerTests, NonStandardEnricherFailureFallsBack) {
  auto enricher       = std::make_shared<ScriptedEnricher>();
  enricher->fail_raw_ = true;
  PromptComposer composer(enricher);

  std::optional<ComposedPrompt> composed;
  EXPECT_NO_THROW(composed = composer.ComposeGeneration("a shop", "none", true));
  ASSERT_TRUE(composed.has_value());
  EXPECT_FALSE(composed->enhanced_.has_value());
  EXPECT_EQ(composed->final_, "a shop");
  EXPECT_EQ(composer.MergeRefinement("a dog", "make it blue"), "a dog. make it blue");
  EXPECT_EQ(composer.ComposeFromReference({}, "add a hat", "none"), "add a hat");

  auto [generation, description] = composer.ComposeStyleTransfer({}, "a tree", 0.5f, "none");
  EXPECT_EQ(description, PromptComposer::kFallbackStyleDescription);
  EXPECT_EQ(generation, "a tree, moderately in the style of: artistic, stylized");
}

TEST(PromptComposerTests, ReferenceAndStyleDescriptions) {
  PromptComposer composer(std::make_shared<ScriptedEnricher>());
  EXPECT_EQ(composer.ComposeFromReference({}, "add a hat", "none"),
            "Based on this reference image: a cat on a sofa. Now apply this modification: add a "
            "hat");
  auto [generation, description] = composer.ComposeStyleTransfer({}, "a tree", 0.9f, "none");
  EXPECT_EQ(description, "bold cubist shapes");
  EXPECT_EQ(generation, "a tree, strongly in the style of: bold cubist shapes");
}

TEST(PromptComposerTests, StrengthWords) {
  EXPECT_EQ(PromptComposer::StrengthWord(0.1f), "subtly");
  EXPECT_EQ(PromptComposer::StrengthWord(0.4f), "moderately");
  EXPECT_EQ(PromptComposer::StrengthWord(0.7f), "strongly");
}

TEST(PromptComposerTests, ObjectReplacementText) {
  EXPECT_EQ(PromptComposer::ComposeObjectReplacement("cup", "vase", false),
            "Replace 'cup' with 'vase' in this image, keeping everything else exactly the same.");
  EXPECT_NE(PromptComposer::ComposeObjectReplacement("cup", "vase", true)
                .find("Maintain the exact same artistic style"),
            std::string::npos);
}

TEST(PromptComposerTests, ProductScenes) {
  auto prompt = PromptComposer::ComposeProductScene("studio", "pastel pink");
  EXPECT_NE(prompt.find("studio"), std::string::npos);
  EXPECT_NE(prompt.find(", with a pastel pink background"), std::string::npos);
  EXPECT_THROW(PromptComposer::ComposeProductScene("moon", ""), ValidationError);
}

TEST(PromptComposerTests, PresetComposition) {
  StylePreset preset;
  preset.name_            = "noir";
  preset.prompt_prefix_   = "  black and white film still of ";
  preset.prompt_suffix_   = "high contrast ";
  preset.negative_prompt_ = "color";
  EXPECT_EQ(PromptComposer::ComposePreset(preset, " a detective "),
            "black and white film still of a detective high contrast. Avoid: color");
}
