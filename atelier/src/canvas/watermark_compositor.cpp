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

#include "canvas/watermark_compositor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <opencv2/imgproc.hpp>

#include "image/image_buffer.hpp"
#include "type/errors.hpp"

namespace atelier {
namespace {
constexpr int                            kFontFace = cv::FONT_HERSHEY_SIMPLEX;

constexpr std::array<const char*, 6>     kPositions = {"center",      "top-left",
                                                       "top-right",   "bottom-left",
                                                       "bottom-right", "tiled"};

auto ToBGR(const cv::Mat& src) -> cv::Mat {
  cv::Mat img = ToDisplayDepth(src);
  cv::Mat bgr;
  if (img.channels() == 1) {
    cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
  } else if (img.channels() == 4) {
    cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = img;
  }
  return bgr;
}

auto HexNibble(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

struct GlyphMetrics {
  double scale_;
  int    thickness_;
  int    width_;
  int    height_;
  int    baseline_;
};

auto MeasureText(const std::string& text, int font_px) -> GlyphMetrics {
  GlyphMetrics m{};
  m.thickness_ = std::max(1, font_px / 12);
  m.scale_     = cv::getFontScaleFromHeight(kFontFace, font_px, m.thickness_);
  cv::Size sz  = cv::getTextSize(text, kFontFace, m.scale_, m.thickness_, &m.baseline_);
  m.width_     = sz.width;
  m.height_    = sz.height;
  return m;
}

// top_left is the upper-left corner of the text box; putText wants the baseline origin
void DrawWithShadow(cv::Mat& layer, const std::string& text, const GlyphMetrics& m,
                    const cv::Point& top_left, const cv::Scalar& fill, const cv::Scalar& shadow,
                    int shadow_offset) {
  cv::Point origin(top_left.x, top_left.y + m.height_);
  cv::putText(layer, text, origin + cv::Point(shadow_offset, shadow_offset), kFontFace,
              m.scale_, shadow, m.thickness_, cv::LINE_AA);
  cv::putText(layer, text, origin, kFontFace, m.scale_, fill, m.thickness_, cv::LINE_AA);
}
}  // namespace

void ValidateWatermark(const WatermarkParams& params) {
  if (params.text_.empty()) {
    throw ValidationError("watermark text must not be empty");
  }
  if (std::find_if(kPositions.begin(), kPositions.end(), [&](const char* p) {
        return params.position_ == p;
      }) == kPositions.end()) {
    throw ValidationError("invalid watermark position: " + params.position_);
  }
  if (params.opacity_ < 0.1f || params.opacity_ > 1.0f) {
    throw ValidationError("watermark opacity must be within [0.1, 1.0]");
  }
  if (params.font_size_ < 12 || params.font_size_ > 200) {
    throw ValidationError("watermark font size must be within [12, 200]");
  }
}

auto ParseHexColor(const std::string& color) -> cv::Scalar {
  std::string hex = color;
  if (!hex.empty() && hex.front() == '#') {
    hex.erase(hex.begin());
  }
  if (hex.size() < 6) {
    return cv::Scalar(255, 255, 255);
  }
  std::array<int, 3> rgb{};
  for (size_t i = 0; i < 3; ++i) {
    int hi = HexNibble(hex[i * 2]);
    int lo = HexNibble(hex[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return cv::Scalar(255, 255, 255);
    }
    rgb[i] = hi * 16 + lo;
  }
  return cv::Scalar(rgb[2], rgb[1], rgb[0]);
}

auto ScaledFontSize(int font_size, int image_width) -> int {
  double scale_factor = static_cast<double>(image_width) / watermark::kReferenceWidth;
  return std::max(static_cast<int>(font_size * scale_factor), watermark::kMinFontPx);
}

auto RenderWatermarkOverlay(const cv::Size& canvas, const WatermarkParams& params,
                            double base_luminance) -> cv::Mat {
  cv::Mat      layer(canvas, CV_8UC4, cv::Scalar(0, 0, 0, 0));

  const int    font_px       = ScaledFontSize(params.font_size_, canvas.width);
  GlyphMetrics metrics       = MeasureText(params.text_, font_px);

  const int    alpha         = static_cast<int>(255 * params.opacity_);
  const int    shadow_alpha  = std::min(alpha, watermark::kShadowAlphaCap);
  const int    shadow_offset = std::max(2, font_px / 20);
  const int    shadow_value  = base_luminance > 127.0 ? 0 : 255;

  cv::Scalar   color         = ParseHexColor(params.color_);
  cv::Scalar   fill(color[0], color[1], color[2], alpha);
  cv::Scalar   shadow(shadow_value, shadow_value, shadow_value, shadow_alpha);

  const int    W             = canvas.width;
  const int    H             = canvas.height;
  const int    pad           = watermark::kPadding;

  if (params.position_ == "tiled") {
    const int step_x = metrics.width_ + watermark::kTileGap;
    const int step_y = metrics.height_ + watermark::kTileGap;
    for (int y = -H; y < 2 * H; y += step_y) {
      for (int x = -W; x < 2 * W; x += step_x) {
        DrawWithShadow(layer, params.text_, metrics, cv::Point(x, y), fill, shadow,
                       shadow_offset);
      }
    }
    cv::Point2f center(static_cast<float>(W / 2), static_cast<float>(H / 2));
    cv::Mat     rotation = cv::getRotationMatrix2D(center, watermark::kTileAngle, 1.0);
    cv::Mat     rotated;
    cv::warpAffine(layer, rotated, rotation, layer.size(), cv::INTER_LINEAR,
                   cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
    return rotated;
  }

  cv::Point top_left;
  if (params.position_ == "center") {
    top_left = {(W - metrics.width_) / 2, (H - metrics.height_) / 2};
  } else if (params.position_ == "top-left") {
    top_left = {pad, pad};
  } else if (params.position_ == "top-right") {
    top_left = {W - metrics.width_ - pad, pad};
  } else if (params.position_ == "bottom-left") {
    top_left = {pad, H - metrics.height_ - pad};
  } else {
    top_left = {W - metrics.width_ - pad, H - metrics.height_ - pad};
  }
  DrawWithShadow(layer, params.text_, metrics, top_left, fill, shadow, shadow_offset);
  return layer;
}

auto CompositeWatermark(const cv::Mat& base, const WatermarkParams& params) -> cv::Mat {
  ValidateWatermark(params);
  if (base.empty()) {
    throw ValidationError("watermark base image is empty");
  }
  cv::Mat bgr = ToBGR(base);
  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  const double luminance = cv::mean(gray)[0];

  cv::Mat      overlay   = RenderWatermarkOverlay(bgr.size(), params, luminance);

  cv::Mat      out(bgr.size(), CV_8UC3);
  for (int y = 0; y < bgr.rows; ++y) {
    const cv::Vec3b* src = bgr.ptr<cv::Vec3b>(y);
    const cv::Vec4b* ovl = overlay.ptr<cv::Vec4b>(y);
    cv::Vec3b*       dst = out.ptr<cv::Vec3b>(y);
    for (int x = 0; x < bgr.cols; ++x) {
      const float a = ovl[x][3] / 255.0f;
      for (int c = 0; c < 3; ++c) {
        dst[x][c] = cv::saturate_cast<uint8_t>(ovl[x][c] * a + src[x][c] * (1.0f - a));
      }
    }
  }
  return out;
}
};  // namespace atelier
