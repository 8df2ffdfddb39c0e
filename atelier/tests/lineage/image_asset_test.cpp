#include <gtest/gtest.h>

#include "lineage/image_asset.hpp"

using namespace atelier;

TEST(ImageAssetTests, JsonRoundTripKeepsKindAndParams) {
  ImageAsset asset;
  asset.id_         = "a1";
  asset.parent_id_  = "p0";
  asset.width_      = 1536;
  asset.height_     = 1024;
  asset.kind_       = OperationKind::OUTPAINT;
  asset.created_at_ = 42;
  OutpaintParams params;
  params.directions_ = {"left", "right"};
  params.amount_     = 50;
  params.ext_left_   = 768;
  params.ext_right_  = 768;
  asset.payload_     = params;

  auto j = asset.ToJSON();
  EXPECT_EQ(j["operation_kind"], "outpaint");
  EXPECT_EQ(j["size"], "1536x1024");

  auto back = ImageAsset::FromJSON(j);
  EXPECT_EQ(back.kind_, OperationKind::OUTPAINT);
  ASSERT_TRUE(back.parent_id_.has_value());
  EXPECT_EQ(*back.parent_id_, "p0");
  EXPECT_EQ(back.created_at_, 42u);
  const auto* restored = std::get_if<OutpaintParams>(&back.payload_);
  ASSERT_NE(restored, nullptr);
  EXPECT_EQ(restored->ext_left_, 768);
  EXPECT_EQ(restored->directions_.size(), 2u);
}

TEST(ImageAssetTests, LegacyMarkersResolveInOrder) {
  // outpainted wins over every later marker
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"outpainted", true}, {"upscaled", true}}),
            OperationKind::OUTPAINT);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"adjusted", true}, {"watermarked", true}}),
            OperationKind::ADJUST);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"upscaled", true}}), OperationKind::UPSCALE);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"background_removed", true}}),
            OperationKind::BACKGROUND_REMOVAL);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"style_transfer", true}}),
            OperationKind::STYLE_TRANSFER);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"watermarked", true}, {"inpainted", true}}),
            OperationKind::WATERMARK);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"inpainted", true}}), OperationKind::INPAINT);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"refinement_instruction", "brighter"}}),
            OperationKind::REFINE);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"prompt", "cat"}}), OperationKind::ORIGINAL);
}

TEST(ImageAssetTests, LegacyEditTypeMapsToKind) {
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"edit_type", "object_replacement"}}),
            OperationKind::OBJECT_REPLACEMENT);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"edit_type", "product_photo"}}),
            OperationKind::PRODUCT_PHOTO);
  EXPECT_EQ(ImageAsset::ResolveLegacyKind({{"edit_type", "mystery"}}), OperationKind::INPAINT);
}

TEST(ImageAssetTests, LegacyRecordReadsFlatParams) {
  nlohmann::json legacy = {{"id", "old"},
                           {"parent_id", "root"},
                           {"prompt", "harbor"},
                           {"size", "1024x1536"},
                           {"upscaled", true},
                           {"upscale_factor", 4},
                           {"created_at", "2024-05-01T10:00:00"}};
  auto           asset  = ImageAsset::FromJSON(legacy);
  EXPECT_EQ(asset.kind_, OperationKind::UPSCALE);
  EXPECT_EQ(asset.width_, 1024);
  EXPECT_EQ(asset.height_, 1536);
  EXPECT_EQ(asset.created_at_, 0u);
  EXPECT_EQ(asset.created_time_, "2024-05-01T10:00:00");
  const auto* params = std::get_if<UpscaleParams>(&asset.payload_);
  ASSERT_NE(params, nullptr);
  EXPECT_EQ(params->factor_, 4);
}

TEST(ImageAssetTests, NullParentIsOriginal) {
  auto asset = ImageAsset::FromJSON({{"id", "x"}, {"parent_id", nullptr}});
  EXPECT_TRUE(asset.IsOriginal());
  EXPECT_EQ(asset.Size(), (ImageSize{1024, 1024}));
}
