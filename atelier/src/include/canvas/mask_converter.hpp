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

#include "type/type.hpp"

namespace atelier {
/**
 * @brief Intensity above which a painted mask pixel marks a region to regenerate.
 */
constexpr int kMaskThreshold = 128;

/**
 * @brief Convert a user-painted mask (white = edit, black = keep) into the BGRA form edit
 *        backends expect: editable pixels become fully transparent (0,0,0,0), everything
 *        else opaque black (0,0,0,255). The mask is resized to target with Lanczos first.
 */
auto MaskToAlpha(const cv::Mat& mask, const ImageSize& target) -> cv::Mat;

auto MaskToAlphaEncoded(const raster_bytes_t& mask_bytes, const ImageSize& target)
    -> raster_bytes_t;
};  // namespace atelier
