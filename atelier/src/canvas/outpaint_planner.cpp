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

#include "canvas/outpaint_planner.hpp"

#include <opencv2/imgproc.hpp>

#include "image/image_buffer.hpp"
#include "type/errors.hpp"

namespace atelier {
auto PlanOutpaint(int width, int height, const std::vector<std::string>& directions, int amount)
    -> OutpaintPlan {
  if (directions.empty()) {
    throw ValidationError("at least one outpaint direction is required");
  }
  if (amount < 10 || amount > 100) {
    throw ValidationError("outpaint amount must be within [10, 100]");
  }
  if (width <= 0 || height <= 0) {
    throw ValidationError("outpaint source has no pixels");
  }

  OutpaintPlan plan;
  const double fraction = amount / 100.0;
  for (const auto& dir : directions) {
    if (dir == "left") {
      plan.left_ = static_cast<int>(fraction * width);
    } else if (dir == "right") {
      plan.right_ = static_cast<int>(fraction * width);
    } else if (dir == "up") {
      plan.up_ = static_cast<int>(fraction * height);
    } else if (dir == "down") {
      plan.down_ = static_cast<int>(fraction * height);
    } else {
      throw ValidationError("invalid outpaint direction: " + dir);
    }
  }
  plan.width_  = width + plan.left_ + plan.right_;
  plan.height_ = height + plan.up_ + plan.down_;
  return plan;
}

auto BuildOutpaintCanvas(const cv::Mat& original, const OutpaintPlan& plan) -> OutpaintCanvas {
  cv::Mat src = ToDisplayDepth(original);
  cv::Mat bgra;
  switch (src.channels()) {
    case 1:
      cv::cvtColor(src, bgra, cv::COLOR_GRAY2BGRA);
      break;
    case 3:
      cv::cvtColor(src, bgra, cv::COLOR_BGR2BGRA);
      break;
    default:
      bgra = src;
      break;
  }

  OutpaintCanvas result;
  result.canvas_ = cv::Mat(plan.Size(), CV_8UC4, cv::Scalar(0, 0, 0, 0));
  result.mask_   = cv::Mat(plan.Size(), CV_8UC1, cv::Scalar(255));

  cv::Rect roi(plan.Offset(), bgra.size());
  bgra.copyTo(result.canvas_(roi));
  result.mask_(roi).setTo(cv::Scalar(0));
  return result;
}
};  // namespace atelier
