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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <opencv2/core.hpp>
#include <utility>
#include <vector>

namespace atelier {
/**
 * @brief A raster held either decoded (cv::Mat, 8-bit BGR/BGRA/GRAY) or encoded (PNG, JPEG,
 *        GIF bytes as returned by a model adapter), converting lazily between the two.
 */
class ImageBuffer {
 private:
  cv::Mat                               _cpu_data;

  std::unique_ptr<std::vector<uint8_t>> _buffer;

  void                                  DecodeBuffer();
  void                                  EncodeCPUData();

 public:
  bool _cpu_data_valid = false;
  bool _buffer_valid   = false;

  ImageBuffer()        = default;
  explicit ImageBuffer(cv::Mat& data);
  explicit ImageBuffer(cv::Mat&& data);
  explicit ImageBuffer(std::vector<uint8_t>&& buffer);
  ImageBuffer(ImageBuffer&& other) noexcept;

  ImageBuffer& operator=(ImageBuffer&& other) noexcept;

  void         ReadFromVectorBuffer(std::vector<uint8_t>&& buffer);

  /**
   * @brief Decoded pixels. Decodes the encoded buffer on first access and converts 16-bit,
   *        palette and two-channel sources to 8-bit BGR, keeping alpha when present.
   */
  auto         GetCPUData() -> cv::Mat&;
  /**
   * @brief Encoded PNG bytes. Encodes the pixels on first access.
   */
  auto         GetBuffer() -> std::vector<uint8_t>&;

  /**
   * @brief Replace the pixels; invalidates any encoded buffer.
   */
  void         SetCPUData(cv::Mat&& data);

  auto         Width() -> int { return GetCPUData().cols; }
  auto         Height() -> int { return GetCPUData().rows; }

  ImageBuffer  Clone() const;

  void         ReleaseCPUData();
  void         ReleaseBuffer();

  static auto  LoadFromPath(const std::filesystem::path& path) -> ImageBuffer;
  void         WriteToPath(const std::filesystem::path& path);
};

/**
 * @brief Convert any decoded raster to 8-bit with 1, 3 or 4 channels.
 */
auto ToDisplayDepth(const cv::Mat& src) -> cv::Mat;
};  // namespace atelier
