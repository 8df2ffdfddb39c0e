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

#include "canvas/enhance_ops.hpp"

#include <cmath>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

#include "image/image_buffer.hpp"
#include "type/errors.hpp"

namespace atelier {
namespace {
// out = degenerate + (img - degenerate) * factor, saturated
auto Blend(const cv::Mat& degenerate, const cv::Mat& img, float factor) -> cv::Mat {
  cv::Mat out;
  cv::addWeighted(img, factor, degenerate, 1.0 - factor, 0.0, out);
  return out;
}

void CheckFactor(float value, const char* name) {
  if (!(value >= 0.0f && value <= 2.0f)) {
    throw ValidationError(std::string(name) + " must be within [0, 2]");
  }
}
}  // namespace

void ValidateAdjustments(const AdjustParams& params) {
  CheckFactor(params.brightness_, "brightness");
  CheckFactor(params.contrast_, "contrast");
  CheckFactor(params.saturation_, "saturation");
  CheckFactor(params.sharpness_, "sharpness");
  if (!(params.blur_ >= 0.0f && params.blur_ <= 10.0f)) {
    throw ValidationError("blur must be within [0, 10]");
  }
}

auto ApplyAdjustments(const cv::Mat& src, const AdjustParams& params) -> cv::Mat {
  ValidateAdjustments(params);
  if (src.empty()) {
    throw ValidationError("adjust source is empty");
  }
  cv::Mat img = ToDisplayDepth(src);
  cv::Mat alpha;
  if (img.channels() == 4) {
    std::vector<cv::Mat> planes;
    cv::split(img, planes);
    alpha = planes[3];
    planes.pop_back();
    cv::merge(planes, img);
  } else if (img.channels() == 1) {
    cv::cvtColor(img, img, cv::COLOR_GRAY2BGR);
  } else {
    img = img.clone();
  }

  if (params.brightness_ != 1.0f) {
    img = Blend(cv::Mat::zeros(img.size(), img.type()), img, params.brightness_);
  }
  if (params.contrast_ != 1.0f) {
    cv::Mat gray;
    cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    const double mean = std::floor(cv::mean(gray)[0] + 0.5);
    img = Blend(cv::Mat(img.size(), img.type(), cv::Scalar::all(mean)), img, params.contrast_);
  }
  if (params.saturation_ != 1.0f) {
    cv::Mat gray, gray_bgr;
    cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    cv::cvtColor(gray, gray_bgr, cv::COLOR_GRAY2BGR);
    img = Blend(gray_bgr, img, params.saturation_);
  }
  if (params.sharpness_ != 1.0f) {
    cv::Mat kernel = (cv::Mat_<float>(3, 3) << 1, 1, 1, 1, 5, 1, 1, 1, 1);
    kernel /= 13.0f;
    cv::Mat smooth;
    cv::filter2D(img, smooth, -1, kernel, cv::Point(-1, -1), 0, cv::BORDER_REPLICATE);
    img = Blend(smooth, img, params.sharpness_);
  }
  if (params.blur_ > 0.0f) {
    cv::GaussianBlur(img, img, cv::Size(0, 0), params.blur_);
  }

  if (!alpha.empty()) {
    std::vector<cv::Mat> planes;
    cv::split(img, planes);
    planes.push_back(alpha);
    cv::merge(planes, img);
  }
  return img;
}

auto UpscaleImage(const cv::Mat& src, int factor) -> cv::Mat {
  if (factor != 2 && factor != 4) {
    throw ValidationError("upscale factor must be 2 or 4");
  }
  if (src.empty()) {
    throw ValidationError("upscale source is empty");
  }
  cv::Mat up;
  cv::resize(ToDisplayDepth(src), up, cv::Size(src.cols * factor, src.rows * factor), 0, 0,
             cv::INTER_LANCZOS4);
  return up;
}

auto PrepareReference(const cv::Mat& src, const ImageSize& target) -> cv::Mat {
  if (src.empty()) {
    throw ValidationError("reference image is empty");
  }
  cv::Mat img = ToDisplayDepth(src);
  cv::Mat bgra;
  if (img.channels() == 1) {
    cv::cvtColor(img, bgra, cv::COLOR_GRAY2BGRA);
  } else if (img.channels() == 3) {
    cv::cvtColor(img, bgra, cv::COLOR_BGR2BGRA);
  } else {
    bgra = img;
  }
  cv::Mat resized;
  cv::resize(bgra, resized, cv::Size(target.width_, target.height_), 0, 0, cv::INTER_LANCZOS4);
  return resized;
}
};  // namespace atelier
