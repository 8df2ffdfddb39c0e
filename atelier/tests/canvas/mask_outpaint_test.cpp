#include <gtest/gtest.h>

#include "canvas/mask_converter.hpp"
#include "canvas/outpaint_planner.hpp"
#include "canvas_test_fixation.hpp"
#include "type/errors.hpp"

using namespace atelier;

TEST_F(CanvasTests, BrightMaskBecomesTransparent) {
  cv::Mat mask(64, 64, CV_8UC1, cv::Scalar(200));
  cv::Mat alpha = MaskToAlpha(mask, {1024, 1024});
  ASSERT_EQ(alpha.type(), CV_8UC4);
  EXPECT_EQ(alpha.size(), cv::Size(1024, 1024));
  EXPECT_EQ(alpha.at<cv::Vec4b>(512, 512), cv::Vec4b(0, 0, 0, 0));
}

TEST_F(CanvasTests, DarkMaskStaysOpaque) {
  cv::Mat mask(1024, 1024, CV_8UC1, cv::Scalar(50));
  cv::Mat alpha = MaskToAlpha(mask, {1024, 1024});
  EXPECT_EQ(alpha.at<cv::Vec4b>(10, 10), cv::Vec4b(0, 0, 0, 255));
}

TEST_F(CanvasTests, ThresholdIsStrict) {
  cv::Mat mask(8, 8, CV_8UC1, cv::Scalar(kMaskThreshold));
  cv::Mat alpha = MaskToAlpha(mask, {8, 8});
  EXPECT_EQ(alpha.at<cv::Vec4b>(4, 4)[3], 255);
}

TEST_F(CanvasTests, ColorMaskUsesLuminance) {
  cv::Mat mask = Solid(32, 32, {255, 255, 255});
  mask(cv::Rect(0, 0, 16, 32)).setTo(cv::Scalar(0, 0, 0));
  cv::Mat alpha = MaskToAlpha(mask, {32, 32});
  EXPECT_EQ(alpha.at<cv::Vec4b>(16, 2)[3], 255);
  EXPECT_EQ(alpha.at<cv::Vec4b>(16, 29)[3], 0);
}

TEST_F(CanvasTests, OutpaintLeftAndRightHalf) {
  OutpaintPlan plan = PlanOutpaint(1000, 800, {"left", "right"}, 50);
  EXPECT_EQ(plan.left_, 500);
  EXPECT_EQ(plan.right_, 500);
  EXPECT_EQ(plan.up_, 0);
  EXPECT_EQ(plan.down_, 0);
  EXPECT_EQ(plan.width_, 2000);
  EXPECT_EQ(plan.height_, 800);
}

TEST_F(CanvasTests, OutpaintVerticalUsesHeight) {
  OutpaintPlan plan = PlanOutpaint(1000, 800, {"up", "down"}, 25);
  EXPECT_EQ(plan.up_, 200);
  EXPECT_EQ(plan.down_, 200);
  EXPECT_EQ(plan.Size(), cv::Size(1000, 1200));
}

TEST_F(CanvasTests, OutpaintRejectsBadInput) {
  EXPECT_THROW(PlanOutpaint(100, 100, {}, 50), ValidationError);
  EXPECT_THROW(PlanOutpaint(100, 100, {"sideways"}, 50), ValidationError);
  EXPECT_THROW(PlanOutpaint(100, 100, {"left"}, 5), ValidationError);
  EXPECT_THROW(PlanOutpaint(100, 100, {"left"}, 101), ValidationError);
}

TEST_F(CanvasTests, OutpaintCanvasPlacesOriginal) {
  cv::Mat        original = Solid(100, 80, {10, 20, 30});
  OutpaintPlan   plan     = PlanOutpaint(100, 80, {"left", "down"}, 50);
  OutpaintCanvas canvas   = BuildOutpaintCanvas(original, plan);

  ASSERT_EQ(canvas.canvas_.size(), cv::Size(150, 120));
  EXPECT_EQ(canvas.canvas_.at<cv::Vec4b>(10, 60), cv::Vec4b(10, 20, 30, 255));
  EXPECT_EQ(canvas.canvas_.at<cv::Vec4b>(10, 10), cv::Vec4b(0, 0, 0, 0));
  EXPECT_EQ(canvas.canvas_.at<cv::Vec4b>(100, 60), cv::Vec4b(0, 0, 0, 0));

  EXPECT_EQ(canvas.mask_.at<uchar>(10, 60), 0);
  EXPECT_EQ(canvas.mask_.at<uchar>(10, 10), 255);
  EXPECT_EQ(canvas.mask_.at<uchar>(100, 60), 255);
}
