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

#include "type/operation_params.hpp"
#include "type/type.hpp"

namespace atelier {
/**
 * @brief Throws ValidationError when a factor leaves [0, 2] or blur leaves [0, 10].
 */
void ValidateAdjustments(const AdjustParams& params);

/**
 * @brief Brightness, contrast, saturation, sharpness, then Gaussian blur, in that order.
 *        Each factor interpolates (or extrapolates) between a degenerate image and the input.
 *        Alpha, when present, passes through.
 */
auto ApplyAdjustments(const cv::Mat& src, const AdjustParams& params) -> cv::Mat;

/**
 * @brief Lanczos upscale by 2 or 4.
 */
auto UpscaleImage(const cv::Mat& src, int factor) -> cv::Mat;

/**
 * @brief Resize a reference raster to the request size as BGRA, ready for an edit backend.
 */
auto PrepareReference(const cv::Mat& src, const ImageSize& target) -> cv::Mat;
};  // namespace atelier
