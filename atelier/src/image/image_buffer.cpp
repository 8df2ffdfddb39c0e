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

#include "image/image_buffer.hpp"

#include <fstream>
#include <iterator>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <utility>

#include "type/errors.hpp"

namespace atelier {
auto ToDisplayDepth(const cv::Mat& src) -> cv::Mat {
  cv::Mat out;
  if (src.depth() == CV_8U) {
    out = src;
  } else if (src.depth() == CV_16U) {
    src.convertTo(out, CV_8U, 1.0 / 257.0);
  } else if (src.depth() == CV_32F || src.depth() == CV_64F) {
    src.convertTo(out, CV_8U, 255.0);
  } else {
    src.convertTo(out, CV_8U);
  }

  if (out.channels() == 2) {
    // Gray + alpha
    std::vector<cv::Mat> planes;
    cv::split(out, planes);
    cv::Mat bgr;
    cv::cvtColor(planes[0], bgr, cv::COLOR_GRAY2BGR);
    std::vector<cv::Mat> bgra_planes;
    cv::split(bgr, bgra_planes);
    bgra_planes.push_back(planes[1]);
    cv::merge(bgra_planes, out);
  }
  return out;
}

ImageBuffer::ImageBuffer(cv::Mat& data) : _cpu_data_valid(true) { data.copyTo(_cpu_data); }

ImageBuffer::ImageBuffer(cv::Mat&& data) : _cpu_data(std::move(data)), _cpu_data_valid(true) {}

ImageBuffer::ImageBuffer(std::vector<uint8_t>&& buffer) : _buffer_valid(true) {
  _buffer = std::make_unique<std::vector<uint8_t>>(std::move(buffer));
}

ImageBuffer::ImageBuffer(ImageBuffer&& other) noexcept
    : _cpu_data(std::move(other._cpu_data)),
      _buffer(std::move(other._buffer)),
      _cpu_data_valid(other._cpu_data_valid),
      _buffer_valid(other._buffer_valid) {}

ImageBuffer& ImageBuffer::operator=(ImageBuffer&& other) noexcept {
  if (this != &other) {
    _cpu_data       = std::move(other._cpu_data);
    _buffer         = std::move(other._buffer);
    _cpu_data_valid = other._cpu_data_valid;
    _buffer_valid   = other._buffer_valid;
  }
  return *this;
}

void ImageBuffer::ReadFromVectorBuffer(std::vector<uint8_t>&& buffer) {
  _buffer         = std::make_unique<std::vector<uint8_t>>(std::move(buffer));
  _buffer_valid   = true;
  _cpu_data_valid = false;
  _cpu_data.release();
}

void ImageBuffer::DecodeBuffer() {
  if (!_buffer_valid || !_buffer || _buffer->empty()) {
    throw std::runtime_error("Image Buffer: No valid buffer data to decode");
  }
  cv::Mat decoded = cv::imdecode(*_buffer, cv::IMREAD_UNCHANGED);
  if (decoded.empty()) {
    throw std::runtime_error("Image Buffer: Encoded bytes are not a decodable raster");
  }
  _cpu_data       = ToDisplayDepth(decoded);
  _cpu_data_valid = true;
}

void ImageBuffer::EncodeCPUData() {
  if (!_cpu_data_valid || _cpu_data.empty()) {
    throw std::runtime_error("Image Buffer: No valid image data to encode");
  }
  std::vector<uint8_t> encoded;
  if (!cv::imencode(".png", ToDisplayDepth(_cpu_data), encoded)) {
    throw std::runtime_error("Image Buffer: PNG encoding failed");
  }
  _buffer       = std::make_unique<std::vector<uint8_t>>(std::move(encoded));
  _buffer_valid = true;
}

auto ImageBuffer::GetCPUData() -> cv::Mat& {
  if (!_cpu_data_valid) {
    DecodeBuffer();
  }
  return _cpu_data;
}

auto ImageBuffer::GetBuffer() -> std::vector<uint8_t>& {
  if (!_buffer_valid) {
    EncodeCPUData();
  }
  return *_buffer;
}

void ImageBuffer::SetCPUData(cv::Mat&& data) {
  _cpu_data       = std::move(data);
  _cpu_data_valid = true;
  ReleaseBuffer();
}

ImageBuffer ImageBuffer::Clone() const {
  if (_cpu_data_valid) {
    return ImageBuffer{_cpu_data.clone()};
  } else if (_buffer_valid) {
    auto buffer = *_buffer;  // copy the buffer
    return ImageBuffer{std::move(buffer)};
  } else {
    throw std::runtime_error("Image Buffer: No valid data to clone");
  }
}

void ImageBuffer::ReleaseCPUData() {
  _cpu_data.release();
  _cpu_data_valid = false;
}

void ImageBuffer::ReleaseBuffer() {
  _buffer.reset();
  _buffer_valid = false;
}

auto ImageBuffer::LoadFromPath(const std::filesystem::path& path) -> ImageBuffer {
  if (!std::filesystem::exists(path)) {
    throw SourceFileMissing(path.string());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw SourceFileMissing(path.string());
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  return ImageBuffer{std::move(bytes)};
}

void ImageBuffer::WriteToPath(const std::filesystem::path& path) {
  auto&         bytes = GetBuffer();
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Image Buffer: Failed to open " + path.string() + " for writing");
  }
  file.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    throw std::runtime_error("Image Buffer: Failed to write " + path.string());
  }
}
};  // namespace atelier
