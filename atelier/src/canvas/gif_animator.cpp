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

#include "canvas/gif_animator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "canvas/aspect_normalizer.hpp"
#include "image/image_buffer.hpp"
#include "type/errors.hpp"

namespace atelier {
namespace {
constexpr double kZoomRange  = 0.3;
constexpr double kPanWindow  = 0.8;
constexpr double kPanTravel  = 0.2;
constexpr double kRotateFrom = -5.0;
constexpr double kRotateSpan = 10.0;
constexpr double kPulseDepth = 0.1;

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

// Centered crop of (w / scale, h / scale), clamped to the image, resized back to (w, h)
auto CenterScale(const cv::Mat& src, double scale) -> cv::Mat {
  const int w      = src.cols;
  const int h      = src.rows;
  int       crop_w = std::clamp(static_cast<int>(w / scale), 1, w);
  int       crop_h = std::clamp(static_cast<int>(h / scale), 1, h);
  cv::Rect  roi((w - crop_w) / 2, (h - crop_h) / 2, crop_w, crop_h);
  return ResizeExact(src(roi), src.size());
}

auto RenderFrame(const cv::Mat& src, GifEffect effect, double t) -> cv::Mat {
  const int w = src.cols;
  const int h = src.rows;
  switch (effect) {
    case GifEffect::ZOOM:
      return CenterScale(src, 1.0 + kZoomRange * t);
    case GifEffect::PAN: {
      int      win_w = std::max(1, static_cast<int>(kPanWindow * w));
      int      x     = std::min(static_cast<int>(kPanTravel * w * t), w - win_w);
      cv::Rect roi(x, 0, win_w, h);
      return ResizeExact(src(roi), src.size());
    }
    case GifEffect::ROTATE: {
      cv::Point2f center(w / 2.0f, h / 2.0f);
      cv::Mat     m = cv::getRotationMatrix2D(center, kRotateFrom + kRotateSpan * t, 1.0);
      cv::Mat     rotated;
      cv::warpAffine(src, rotated, m, src.size(), cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                     cv::Scalar(0, 0, 0));
      return rotated;
    }
    case GifEffect::PULSE:
      return CenterScale(src, 1.0 + kPulseDepth * std::sin(2.0 * std::numbers::pi * t));
    case GifEffect::FADE: {
      cv::Mat faded;
      src.convertTo(faded, -1, t, 0.0);
      return faded;
    }
  }
  throw ValidationError("unknown gif effect");
}

auto FitWithin(const cv::Mat& frame, int max_edge) -> cv::Mat {
  const int longest = std::max(frame.cols, frame.rows);
  if (max_edge <= 0 || longest <= max_edge) {
    return frame;
  }
  const double ratio = static_cast<double>(max_edge) / longest;
  cv::Size     target(std::max(1, static_cast<int>(frame.cols * ratio)),
                      std::max(1, static_cast<int>(frame.rows * ratio)));
  return ResizeExact(frame, target);
}
}  // namespace

auto GifEffectFromString(const std::string& name) -> GifEffect {
  if (name == "zoom") return GifEffect::ZOOM;
  if (name == "pan") return GifEffect::PAN;
  if (name == "rotate") return GifEffect::ROTATE;
  if (name == "pulse") return GifEffect::PULSE;
  if (name == "fade") return GifEffect::FADE;
  throw ValidationError("invalid gif effect: " + name);
}

auto GifFrameCount(double duration, int fps) -> int {
  if (!(duration > 0.0) || duration > 10.0) {
    throw ValidationError("gif duration must be within (0, 10] seconds");
  }
  if (fps < 1 || fps > 30) {
    throw ValidationError("gif fps must be within [1, 30]");
  }
  return std::max(1, static_cast<int>(std::lround(duration * fps)));
}

auto BuildGifFrames(const cv::Mat& src, const GifSpec& spec) -> std::vector<cv::Mat> {
  if (src.empty()) {
    throw ValidationError("gif source is empty");
  }
  const int            total = GifFrameCount(spec.duration_, spec.fps_);
  cv::Mat              base  = ToBGR(src);

  std::vector<cv::Mat> frames;
  frames.reserve(total);
  for (int i = 0; i < total; ++i) {
    const double t = total > 1 ? static_cast<double>(i) / (total - 1) : 0.0;
    frames.push_back(FitWithin(RenderFrame(base, spec.effect_, t), spec.max_edge_));
  }
  return frames;
}

auto EncodeGif(const std::vector<cv::Mat>& frames, int fps) -> raster_bytes_t {
  if (frames.empty()) {
    throw ValidationError("gif needs at least one frame");
  }
  if (fps < 1) {
    throw ValidationError("gif fps must be positive");
  }
  cv::Animation animation(0);
  const int     frame_ms = 1000 / fps;
  for (const auto& frame : frames) {
    animation.frames.push_back(frame);
    animation.durations.push_back(frame_ms);
  }
  std::vector<uchar> encoded;
  if (!cv::imencodeanimation(".gif", animation, encoded)) {
    throw std::runtime_error("GifAnimator: GIF encoding failed");
  }
  return raster_bytes_t(encoded.begin(), encoded.end());
}
};  // namespace atelier
