#pragma once

#include <gtest/gtest.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace atelier {
class CanvasTests : public ::testing::Test {
 protected:
  // Horizontal ramp with a bright square in the middle, so edges and gradients exist
  static auto MakeScene(int width, int height) -> cv::Mat {
    cv::Mat img(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
      for (int x = 0; x < width; ++x) {
        uchar v                  = static_cast<uchar>(255 * x / std::max(1, width - 1));
        img.at<cv::Vec3b>(y, x) = cv::Vec3b(v, static_cast<uchar>(255 - v), 128);
      }
    }
    cv::rectangle(img, cv::Rect(width / 3, height / 3, width / 3, height / 3),
                  cv::Scalar(250, 250, 250), cv::FILLED);
    return img;
  }

  static auto Solid(int width, int height, const cv::Scalar& color) -> cv::Mat {
    return cv::Mat(height, width, CV_8UC3, color);
  }
};
};  // namespace atelier
