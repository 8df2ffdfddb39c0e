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

#include "type/type.hpp"

namespace atelier {
enum class GifEffect { ZOOM, PAN, ROTATE, PULSE, FADE };

auto GifEffectFromString(const std::string& name) -> GifEffect;

struct GifSpec {
  GifEffect effect_   = GifEffect::ZOOM;
  double    duration_ = 2.0;
  int       fps_      = 15;
  int       max_edge_ = 512;
};

/**
 * @brief round(duration * fps). Throws ValidationError for duration outside (0, 10] or fps
 *        outside [1, 30].
 */
auto GifFrameCount(double duration, int fps) -> int;

/**
 * @brief Every frame is derived from src directly, never from the previous frame. Frames are
 *        BGR and fit within max_edge.
 */
auto BuildGifFrames(const cv::Mat& src, const GifSpec& spec) -> std::vector<cv::Mat>;

/**
 * @brief Looping GIF, 1000 / fps ms per frame.
 */
auto EncodeGif(const std::vector<cv::Mat>& frames, int fps) -> raster_bytes_t;
};  // namespace atelier
