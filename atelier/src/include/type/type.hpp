/*
 * @file        atelier/src/include/type/type.hpp
 * @brief       collection of wrapper types
 * @author      Yurun Zi
 * @date        2025-03-19
 * @license     MIT
 *
 * @copyright   Copyright (c) 2025 Yurun Zi
 */

// Copyright (c) 2025 Yurun Zi
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace atelier {

#define file_path_t    std::filesystem::path

// Opaque identifiers, rendered from Hash128
#define asset_id_t     std::string
#define job_id_t       std::string

// Monotonic ordering key for lineage records
#define seq_t          uint64_t

// Encoded raster payload (PNG/JPEG/GIF bytes)
#define raster_bytes_t std::vector<uint8_t>

struct ImageSize {
  int  width_  = 0;
  int  height_ = 0;

  auto ToString() const -> std::string {
    return std::to_string(width_) + "x" + std::to_string(height_);
  }
  bool operator==(const ImageSize& other) const {
    return width_ == other.width_ && height_ == other.height_;
  }
  bool operator!=(const ImageSize& other) const { return !(*this == other); }
};

/**
 * @brief Parse a "WxH" size string. Throws ValidationError on malformed input.
 */
auto ParseImageSize(const std::string& text) -> ImageSize;
};  // namespace atelier
