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

#include "type/operation_params.hpp"

namespace atelier {
namespace watermark {
constexpr int    kReferenceWidth = 1024;
constexpr int    kMinFontPx      = 16;
constexpr int    kPadding        = 20;
constexpr int    kTileGap        = 80;
constexpr int    kShadowAlphaCap = 180;
constexpr double kTileAngle      = 45.0;
};  // namespace watermark

/**
 * @brief Throws ValidationError when the position is unknown, the text is empty, opacity is
 *        outside [0.1, 1.0] or font size is outside [12, 200].
 */
void ValidateWatermark(const WatermarkParams& params);

/**
 * @brief Parse "#rrggbb" into a BGR scalar. Anything unparsable yields white.
 */
auto ParseHexColor(const std::string& color) -> cv::Scalar;

/**
 * @brief Font pixel height for an image of the given width.
 */
auto ScaledFontSize(int font_size, int image_width) -> int;

/**
 * @brief Render the text (with its contrast shadow) onto a transparent BGRA layer of the
 *        given size. base_luminance selects the shadow color.
 */
auto RenderWatermarkOverlay(const cv::Size& canvas, const WatermarkParams& params,
                            double base_luminance) -> cv::Mat;

/**
 * @brief Alpha-composite the watermark over base and flatten to opaque BGR.
 */
auto CompositeWatermark(const cv::Mat& base, const WatermarkParams& params) -> cv::Mat;
};  // namespace atelier
