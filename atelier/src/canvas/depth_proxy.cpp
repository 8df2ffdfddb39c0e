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

#include "canvas/depth_proxy.hpp"

#include <opencv2/imgproc.hpp>

#include "image/image_buffer.hpp"
#include "type/errors.hpp"

namespace atelier {
namespace {
constexpr double kWideSigma   = 10.0;
constexpr double kNarrowSigma = 3.0;

auto ToGray(const cv::Mat& src) -> cv::Mat {
  cv::Mat img = ToDisplayDepth(src);
  cv::Mat gray;
  if (img.channels() == 3) {
    cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
  } else if (img.channels() == 4) {
    cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = img;
  }
  return gray;
}
}  // namespace

auto SynthesizeDepthMap(const cv::Mat& src) -> cv::Mat {
  if (src.empty()) {
    throw ValidationError("depth source is empty");
  }
  cv::Mat gray = ToGray(src);

  // 3x3 find-edges kernel: -1 everywhere, 8 at the center
  cv::Mat kernel = (cv::Mat_<float>(3, 3) << -1, -1, -1, -1, 8, -1, -1, -1, -1);
  cv::Mat edges;
  cv::filter2D(gray, edges, CV_8U, kernel, cv::Point(-1, -1), 0, cv::BORDER_REPLICATE);
  cv::bitwise_not(edges, edges);
  cv::GaussianBlur(edges, edges, cv::Size(0, 0), kWideSigma);

  cv::Mat gradient(gray.size(), CV_32F);
  const int rows = gray.rows;
  for (int y = 0; y < rows; ++y) {
    float v = rows > 1 ? 255.0f * y / (rows - 1) : 0.0f;
    gradient.row(y).setTo(cv::Scalar(v));
  }

  cv::Mat edges_f;
  edges.convertTo(edges_f, CV_32F);
  cv::Mat blended = gradient + 2.0f * edges_f;

  cv::Mat depth;
  blended.convertTo(depth, CV_8U);  // saturating, clips to [0, 255]
  cv::GaussianBlur(depth, depth, cv::Size(0, 0), kNarrowSigma);
  return depth;
}
};  // namespace atelier
