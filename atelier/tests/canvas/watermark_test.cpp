#include <gtest/gtest.h>

#include "canvas/watermark_compositor.hpp"
#include "canvas_test_fixation.hpp"
#include "type/errors.hpp"

using namespace atelier;

namespace {
auto MaxAlpha(const cv::Mat& bgra) -> double {
  std::vector<cv::Mat> channels;
  cv::split(bgra, channels);
  double max_val = 0.0;
  cv::minMaxLoc(channels[3], nullptr, &max_val);
  return max_val;
}
}  // namespace

TEST_F(CanvasTests, WatermarkOpacityMapsToAlpha) {
  WatermarkParams params;
  params.text_     = "atelier";
  params.position_ = "center";
  params.opacity_  = 0.3f;

  cv::Mat overlay  = RenderWatermarkOverlay({1024, 1024}, params, 200.0);
  // int(255 * 0.3)
  EXPECT_EQ(MaxAlpha(overlay), 76.0);
  EXPECT_EQ(overlay.at<cv::Vec4b>(0, 0)[3], 0);
}

TEST_F(CanvasTests, WatermarkEveryPositionDrawsSomething) {
  for (const char* position :
       {"center", "top-left", "top-right", "bottom-left", "bottom-right", "tiled"}) {
    WatermarkParams params;
    params.text_     = "proof";
    params.position_ = position;
    params.opacity_  = 1.0f;
    cv::Mat overlay  = RenderWatermarkOverlay({800, 600}, params, 50.0);
    EXPECT_EQ(MaxAlpha(overlay), 255.0) << position;
  }
}

TEST_F(CanvasTests, WatermarkCornerPlacement) {
  WatermarkParams params;
  params.text_     = "corner";
  params.position_ = "bottom-right";
  params.opacity_  = 1.0f;
  cv::Mat overlay  = RenderWatermarkOverlay({1024, 1024}, params, 50.0);

  std::vector<cv::Mat> channels;
  cv::split(overlay, channels);
  EXPECT_EQ(cv::countNonZero(channels[3](cv::Rect(0, 0, 512, 512))), 0);
  EXPECT_GT(cv::countNonZero(channels[3](cv::Rect(512, 512, 512, 512))), 0);
}

TEST_F(CanvasTests, WatermarkCompositeKeepsSize) {
  WatermarkParams params;
  params.text_     = "(c) studio";
  params.position_ = "tiled";
  cv::Mat base     = MakeScene(640, 480);
  cv::Mat out      = CompositeWatermark(base, params);
  EXPECT_EQ(out.size(), base.size());
  EXPECT_EQ(out.type(), CV_8UC3);
  EXPECT_GT(cv::norm(out, base, cv::NORM_L1), 0.0);
}

TEST_F(CanvasTests, WatermarkValidation) {
  WatermarkParams params;
  params.text_ = "ok";
  EXPECT_NO_THROW(ValidateWatermark(params));

  WatermarkParams empty = params;
  empty.text_           = "";
  EXPECT_THROW(ValidateWatermark(empty), ValidationError);

  WatermarkParams bad_position = params;
  bad_position.position_       = "middle";
  EXPECT_THROW(ValidateWatermark(bad_position), ValidationError);

  WatermarkParams faint = params;
  faint.opacity_        = 0.05f;
  EXPECT_THROW(ValidateWatermark(faint), ValidationError);

  WatermarkParams huge = params;
  huge.font_size_      = 201;
  EXPECT_THROW(ValidateWatermark(huge), ValidationError);
}

TEST_F(CanvasTests, HexColorParsing) {
  EXPECT_EQ(ParseHexColor("#ff0000"), cv::Scalar(0, 0, 255));
  EXPECT_EQ(ParseHexColor("00ff00"), cv::Scalar(0, 255, 0));
  EXPECT_EQ(ParseHexColor("#zzz"), cv::Scalar(255, 255, 255));
}

TEST_F(CanvasTests, FontScalesWithWidth) {
  EXPECT_EQ(ScaledFontSize(36, 1024), 36);
  EXPECT_EQ(ScaledFontSize(36, 2048), 72);
  EXPECT_EQ(ScaledFontSize(36, 256), watermark::kMinFontPx);
}
