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

#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace atelier {
struct OutpaintPlan {
  int  left_   = 0;
  int  right_  = 0;
  int  up_     = 0;
  int  down_   = 0;
  int  width_  = 0;
  int  height_ = 0;

  auto Offset() const -> cv::Point { return {left_, up_}; }
  auto Size() const -> cv::Size { return {width_, height_}; }
};

struct OutpaintCanvas {
  cv::Mat canvas_;  // BGRA, original at Offset(), transparent elsewhere
  cv::Mat mask_;    // single channel, 255 over the extension area
};

/**
 * @brief Extension arithmetic. Each selected direction grows by int(amount / 100 * dim),
 *        dim being the width for left/right and the height for up/down. Throws
 *        ValidationError for an empty or unknown direction set or amount outside [10, 100].
 */
auto PlanOutpaint(int width, int height, const std::vector<std::string>& directions, int amount)
    -> OutpaintPlan;

auto BuildOutpaintCanvas(const cv::Mat& original, const OutpaintPlan& plan) -> OutpaintCanvas;
};  // namespace atelier
