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

#include "canvas/mask_converter.hpp"

#include <opencv2/imgproc.hpp>
#include <utility>

#include "image/image_buffer.hpp"
#include "type/errors.hpp"

namespace atelier {
namespace {
auto ToLuminance(const cv::Mat& src) -> cv::Mat {
  cv::Mat img = ToDisplayDepth(src);
  cv::Mat gray;
  switch (img.channels()) {
    case 1:
      gray = img;
      break;
    case 3:
      cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
      break;
    case 4:
      cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
      break;
    default:
      throw ValidationError("mask has unsupported channel count " +
                            std::to_string(img.channels()));
  }
  return gray;
}
}  // namespace

auto MaskToAlpha(const cv::Mat& mask, const ImageSize& target) -> cv::Mat {
  if (mask.empty()) {
    throw ValidationError("mask is empty");
  }
  cv::Mat gray = ToLuminance(mask);
  cv::Mat resized;
  if (gray.cols != target.width_ || gray.rows != target.height_) {
    cv::resize(gray, resized, cv::Size(target.width_, target.height_), 0, 0,
               cv::INTER_LANCZOS4);
  } else {
    resized = gray;
  }

  cv::Mat alpha(resized.size(), CV_8UC4, cv::Scalar(0, 0, 0, 255));
  for (int y = 0; y < resized.rows; ++y) {
    const uint8_t* src = resized.ptr<uint8_t>(y);
    cv::Vec4b*     dst = alpha.ptr<cv::Vec4b>(y);
    for (int x = 0; x < resized.cols; ++x) {
      if (src[x] > kMaskThreshold) {
        dst[x] = cv::Vec4b(0, 0, 0, 0);
      }
    }
  }
  return alpha;
}

auto MaskToAlphaEncoded(const raster_bytes_t& mask_bytes, const ImageSize& target)
    -> raster_bytes_t {
  auto        copy = mask_bytes;
  ImageBuffer mask{std::move(copy)};
  ImageBuffer alpha{MaskToAlpha(mask.GetCPUData(), target)};
  return std::move(alpha.GetBuffer());
}
};  // namespace atelier
