#include <gtest/gtest.h>

#include "canvas/depth_proxy.hpp"
#include "canvas/enhance_ops.hpp"
#include "canvas_test_fixation.hpp"
#include "type/errors.hpp"

using namespace atelier;

TEST_F(CanvasTests, NeutralAdjustmentIsIdentity) {
  cv::Mat src = MakeScene(120, 80);
  cv::Mat out = ApplyAdjustments(src, AdjustParams{});
  EXPECT_EQ(out.size(), src.size());
  EXPECT_LE(cv::norm(out, src, cv::NORM_INF), 1.0);
}

TEST_F(CanvasTests, ZeroBrightnessIsBlack) {
  AdjustParams params;
  params.brightness_ = 0.0f;
  cv::Mat out        = ApplyAdjustments(MakeScene(50, 50), params);
  EXPECT_EQ(cv::countNonZero(out.reshape(1)), 0);
}

TEST_F(CanvasTests, ZeroSaturationIsGray) {
  AdjustParams params;
  params.saturation_ = 0.0f;
  cv::Mat out        = ApplyAdjustments(Solid(10, 10, {0, 0, 255}), params);
  cv::Vec3b px       = out.at<cv::Vec3b>(5, 5);
  EXPECT_EQ(px[0], px[1]);
  EXPECT_EQ(px[1], px[2]);
}

TEST_F(CanvasTests, AlphaSurvivesAdjustment) {
  cv::Mat src(20, 20, CV_8UC4, cv::Scalar(40, 80, 120, 33));
  AdjustParams params;
  params.contrast_ = 1.5f;
  cv::Mat out      = ApplyAdjustments(src, params);
  ASSERT_EQ(out.channels(), 4);
  EXPECT_EQ(out.at<cv::Vec4b>(3, 3)[3], 33);
}

TEST_F(CanvasTests, AdjustmentValidation) {
  AdjustParams params;
  params.brightness_ = 2.5f;
  EXPECT_THROW(ValidateAdjustments(params), ValidationError);
  params.brightness_ = 1.0f;
  params.blur_       = 11.0f;
  EXPECT_THROW(ValidateAdjustments(params), ValidationError);
  params.blur_ = 10.0f;
  EXPECT_NO_THROW(ValidateAdjustments(params));
}

TEST_F(CanvasTests, UpscaleFactors) {
  cv::Mat src = MakeScene(100, 60);
  EXPECT_EQ(UpscaleImage(src, 2).size(), cv::Size(200, 120));
  EXPECT_EQ(UpscaleImage(src, 4).size(), cv::Size(400, 240));
  EXPECT_THROW(UpscaleImage(src, 3), ValidationError);
}

TEST_F(CanvasTests, DepthMapIsSingleChannelAtSourceSize) {
  cv::Mat depth = SynthesizeDepthMap(MakeScene(300, 200));
  EXPECT_EQ(depth.type(), CV_8UC1);
  EXPECT_EQ(depth.size(), cv::Size(300, 200));
}

TEST_F(CanvasTests, FlatDepthSourceSaturates) {
  // No edges: the inverted edge term is 255, so the doubled sum clips everywhere
  cv::Mat depth = SynthesizeDepthMap(Solid(64, 256, {128, 128, 128}));
  double  lo    = 0.0;
  double  hi    = 0.0;
  cv::minMaxLoc(depth, &lo, &hi);
  EXPECT_EQ(lo, 255.0);
  EXPECT_EQ(hi, 255.0);
}

TEST_F(CanvasTests, TexturedDepthSourceKeepsGradient) {
  // Dark dots on every other pixel of a white field: three quarters of the pixels are edges,
  // so the blurred inverted edge term settles near 64 and the ramp shows through at the top
  cv::Mat src = Solid(64, 256, {255, 255, 255});
  for (int y = 0; y < src.rows; y += 2) {
    for (int x = 0; x < src.cols; x += 2) {
      src.at<cv::Vec3b>(y, x) = cv::Vec3b(0, 0, 0);
    }
  }
  cv::Mat depth  = SynthesizeDepthMap(src);
  double  top    = cv::mean(depth.row(2))[0];
  double  middle = cv::mean(depth.row(128))[0];
  double  bottom = cv::mean(depth.row(250))[0];
  EXPECT_GT(top, 110.0);
  EXPECT_LT(top, 160.0);
  EXPECT_GT(middle, top);
  EXPECT_GE(bottom, 254.0);
}
