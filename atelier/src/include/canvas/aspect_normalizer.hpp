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
 * @brief Relative aspect tolerance under which a source is resized without cropping.
 */
constexpr double kAspectTolerance = 0.01;

/**
 * @brief Centered crop rectangle that brings src to the aspect ratio of target. Returns the
 *        full source rectangle when the ratios already agree within kAspectTolerance.
 */
auto ComputeAspectCrop(const cv::Size& src, const ImageSize& target) -> cv::Rect;

/**
 * @brief Crop to aspect, then resize to exactly target. Output is 8-bit BGR, or BGRA when
 *        the source carries alpha.
 */
auto NormalizeToAspect(const cv::Mat& src, const ImageSize& target) -> cv::Mat;

/**
 * @brief Byte-level variant: decode, normalize, re-encode as PNG.
 */
auto NormalizeEncoded(const raster_bytes_t& bytes, const ImageSize& target) -> raster_bytes_t;

/**
 * @brief Resize with the filter suited to the direction: area averaging when shrinking,
 *        Lanczos when enlarging.
 */
auto ResizeExact(const cv::Mat& src, const cv::Size& target) -> cv::Mat;
};  // namespace atelier
