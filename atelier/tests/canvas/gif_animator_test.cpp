#include <gtest/gtest.h>

#include "canvas/gif_animator.hpp"
#include "canvas_test_fixation.hpp"
#include "type/errors.hpp"

using namespace atelier;

namespace {
// Blue holds the column and green the row, so a frame pixel tells where it was sampled from
auto CoordinateRamp(int width, int height) -> cv::Mat {
  cv::Mat img(height, width, CV_8UC3);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      img.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x), static_cast<uchar>(y), 0);
    }
  }
  return img;
}

auto Frames(const cv::Mat& src, GifEffect effect, int count) -> std::vector<cv::Mat> {
  GifSpec spec;
  spec.effect_   = effect;
  spec.duration_ = 1.0;
  spec.fps_      = count;
  return BuildGifFrames(src, spec);
}

auto SourceColumn(const cv::Mat& frame, int y, int x) -> int { return frame.at<cv::Vec3b>(y, x)[0]; }
auto SourceRow(const cv::Mat& frame, int y, int x) -> int { return frame.at<cv::Vec3b>(y, x)[1]; }
}  // namespace

TEST_F(CanvasTests, GifFrameCounts) {
  EXPECT_EQ(GifFrameCount(2.0, 15), 30);
  EXPECT_EQ(GifFrameCount(3.0, 8), 24);
  EXPECT_EQ(GifFrameCount(0.01, 1), 1);
}

TEST_F(CanvasTests, GifFrameCountLimits) {
  EXPECT_THROW(GifFrameCount(0.0, 15), ValidationError);
  EXPECT_THROW(GifFrameCount(10.5, 15), ValidationError);
  EXPECT_THROW(GifFrameCount(2.0, 0), ValidationError);
  EXPECT_THROW(GifFrameCount(2.0, 31), ValidationError);
}

TEST_F(CanvasTests, GifFramesFitMaxEdge) {
  cv::Mat src = MakeScene(1536, 1024);
  for (GifEffect effect :
       {GifEffect::ZOOM, GifEffect::PAN, GifEffect::ROTATE, GifEffect::PULSE, GifEffect::FADE}) {
    GifSpec spec;
    spec.effect_   = effect;
    spec.duration_ = 1.0;
    spec.fps_      = 6;
    auto frames    = BuildGifFrames(src, spec);
    ASSERT_EQ(frames.size(), 6u);
    for (const auto& frame : frames) {
      EXPECT_LE(std::max(frame.cols, frame.rows), 512);
      EXPECT_EQ(frame.channels(), 3);
    }
  }
}

TEST_F(CanvasTests, GifFadeStartsBlackEndsOnSource) {
  cv::Mat src = Solid(64, 64, {100, 150, 200});
  GifSpec spec;
  spec.effect_   = GifEffect::FADE;
  spec.duration_ = 1.0;
  spec.fps_      = 5;
  auto frames    = BuildGifFrames(src, spec);
  ASSERT_EQ(frames.size(), 5u);
  EXPECT_EQ(frames.front().at<cv::Vec3b>(10, 10), cv::Vec3b(0, 0, 0));
  EXPECT_EQ(frames.back().at<cv::Vec3b>(10, 10), cv::Vec3b(100, 150, 200));
}

TEST_F(CanvasTests, GifEffectNames) {
  EXPECT_EQ(GifEffectFromString("pan"), GifEffect::PAN);
  EXPECT_EQ(GifEffectFromString("pulse"), GifEffect::PULSE);
  EXPECT_THROW(GifEffectFromString("spin"), ValidationError);
}

TEST_F(CanvasTests, GifEncodesAsGif) {
  GifSpec spec;
  spec.duration_ = 0.5;
  spec.fps_      = 4;
  auto bytes     = EncodeGif(BuildGifFrames(MakeScene(128, 96), spec), spec.fps_);
  ASSERT_GT(bytes.size(), 6u);
  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 3), "GIF");
}

TEST_F(CanvasTests, GifZoomEndsOnCenterCrop) {
  // 130 / 1.3 = 100, so the last frame shows source pixels 15..114 on both axes
  auto frames = Frames(CoordinateRamp(130, 130), GifEffect::ZOOM, 2);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(SourceColumn(frames.front(), 65, 0), 0);
  EXPECT_EQ(SourceColumn(frames.front(), 65, 129), 129);

  const cv::Mat& last = frames.back();
  EXPECT_EQ(last.size(), cv::Size(130, 130));
  EXPECT_NEAR(SourceColumn(last, 65, 0), 15, 3);
  EXPECT_NEAR(SourceColumn(last, 65, 129), 114, 3);
  EXPECT_NEAR(SourceRow(last, 0, 65), 15, 3);
  EXPECT_NEAR(SourceRow(last, 129, 65), 114, 3);
}

TEST_F(CanvasTests, GifPanSlidesWindowAcross) {
  // Window of 80 columns starting at 0, then at 0.2 * 100 = 20
  auto frames = Frames(CoordinateRamp(100, 40), GifEffect::PAN, 2);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_NEAR(SourceColumn(frames.front(), 20, 0), 0, 3);
  EXPECT_NEAR(SourceColumn(frames.front(), 20, 99), 79, 3);
  EXPECT_NEAR(SourceColumn(frames.back(), 20, 0), 20, 3);
  EXPECT_NEAR(SourceColumn(frames.back(), 20, 99), 99, 3);
  // Only the horizontal axis moves
  EXPECT_NEAR(SourceRow(frames.back(), 39, 50), 39, 3);
}

TEST_F(CanvasTests, GifRotateSwingsFromMinusToPlusFive) {
  // A bright line through the center. 80px right of center it sits 80 * sin(5deg) ~ 7 rows
  // below the center at -5 degrees and 7 rows above it at +5 degrees
  cv::Mat src = Solid(200, 200, {0, 0, 0});
  src.rowRange(99, 102).setTo(cv::Scalar(255, 255, 255));
  auto frames = Frames(src, GifEffect::ROTATE, 2);
  ASSERT_EQ(frames.size(), 2u);

  const cv::Mat& first = frames.front();
  EXPECT_GT(first.at<cv::Vec3b>(107, 180)[0], 128);
  EXPECT_LT(first.at<cv::Vec3b>(93, 180)[0], 64);
  EXPECT_GT(first.at<cv::Vec3b>(93, 20)[0], 128);

  const cv::Mat& last = frames.back();
  EXPECT_GT(last.at<cv::Vec3b>(93, 180)[0], 128);
  EXPECT_LT(last.at<cv::Vec3b>(107, 180)[0], 64);
  EXPECT_GT(last.at<cv::Vec3b>(107, 20)[0], 128);
  // The pivot stays put
  EXPECT_GT(last.at<cv::Vec3b>(100, 100)[0], 128);
}

TEST_F(CanvasTests, GifPulseBreathesInAndOut) {
  // Five frames: t = 0, 0.25, 0.5, 0.75, 1. Scale 1.1 at t = 0.25 crops 110 / 1.1 = 100
  // columns from offset 5; scale 0.9 at t = 0.75 clamps to the full image
  cv::Mat src    = CoordinateRamp(110, 110);
  auto    frames = Frames(src, GifEffect::PULSE, 5);
  ASSERT_EQ(frames.size(), 5u);
  EXPECT_EQ(cv::norm(frames[0], src, cv::NORM_INF), 0.0);
  EXPECT_NEAR(SourceColumn(frames[1], 55, 0), 5, 3);
  EXPECT_NEAR(SourceColumn(frames[1], 55, 109), 104, 3);
  EXPECT_EQ(cv::norm(frames[3], src, cv::NORM_INF), 0.0);
}
