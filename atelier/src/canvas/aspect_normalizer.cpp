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

#include "canvas/aspect_normalizer.hpp"

#include <cmath>
#include <opencv2/imgproc.hpp>
#include <utility>

#include "image/image_buffer.hpp"
#include "type/errors.hpp"

namespace atelier {
namespace {
auto ToColorMode(const cv::Mat& src) -> cv::Mat {
  cv::Mat img = ToDisplayDepth(src);
  if (img.channels() == 1) {
    cv::Mat bgr;
    cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
  }
  return img;
}
}  // namespace

auto ComputeAspectCrop(const cv::Size& src, const ImageSize& target) -> cv::Rect {
  const double target_ratio = static_cast<double>(target.width_) / target.height_;
  const double src_ratio    = static_cast<double>(src.width) / src.height;
  if (std::abs(src_ratio - target_ratio) <= kAspectTolerance) {
    return cv::Rect(0, 0, src.width, src.height);
  }
  if (src_ratio > target_ratio) {
    // Wider than target, crop the sides
    int new_w = static_cast<int>(src.height * target_ratio);
    new_w     = std::max(new_w, 1);
    int left  = (src.width - new_w) / 2;
    return cv::Rect(left, 0, new_w, src.height);
  }
  // Taller than target, crop top and bottom
  int new_h = static_cast<int>(src.width / target_ratio);
  new_h     = std::max(new_h, 1);
  int top   = (src.height - new_h) / 2;
  return cv::Rect(0, top, src.width, new_h);
}

auto ResizeExact(const cv::Mat& src, const cv::Size& target) -> cv::Mat {
  if (src.size() == target) {
    return src.clone();
  }
  const bool shrinking = target.width <= src.cols && target.height <= src.rows;
  cv::Mat    resized;
  cv::resize(src, resized, target, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4);
  return resized;
}

auto NormalizeToAspect(const cv::Mat& src, const ImageSize& target) -> cv::Mat {
  if (target.width_ <= 0 || target.height_ <= 0) {
    throw ValidationError("normalize target " + target.ToString() + " must be positive");
  }
  if (src.empty()) {
    throw ValidationError("normalize source is empty");
  }
  cv::Mat  img  = ToColorMode(src);
  cv::Rect crop = ComputeAspectCrop(img.size(), target);
  cv::Mat  cropped = img(crop);
  return ResizeExact(cropped, cv::Size(target.width_, target.height_));
}

auto NormalizeEncoded(const raster_bytes_t& bytes, const ImageSize& target) -> raster_bytes_t {
  auto        copy = bytes;
  ImageBuffer buffer{std::move(copy)};
  ImageBuffer normalized{NormalizeToAspect(buffer.GetCPUData(), target)};
  return std::move(normalized.GetBuffer());
}
};  // namespace atelier
