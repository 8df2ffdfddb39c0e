#pragma once

#include <atomic>
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "model/model_adapter.hpp"

namespace atelier {
inline auto EncodePng(const cv::Mat& img) -> raster_bytes_t {
  std::vector<uint8_t> bytes;
  if (!cv::imencode(".png", img, bytes)) {
    throw std::runtime_error("test: png encoding failed");
  }
  return bytes;
}

inline auto SolidPng(int width, int height, const cv::Scalar& color = {90, 120, 150})
    -> raster_bytes_t {
  return EncodePng(cv::Mat(height, width, CV_8UC3, color));
}

/**
 * @brief Scripted backend. Returns a solid raster of the requested size (or output_size_ when
 *        set) and fails on demand, counting every call.
 */
class FakeAdapter : public ModelAdapter {
 public:
  std::string              name_;
  bool                     fail_synthesize_ = false;
  bool                     fail_edit_       = false;
  bool                     fail_masked_     = false;
  // Any prompt containing this text fails
  std::string              fail_on_prompt_;
  std::string              error_;
  std::optional<ImageSize> output_size_;

  std::atomic<int>         synth_calls_{0};
  std::atomic<int>         edit_calls_{0};

  std::mutex               mtx_;
  std::vector<std::string> prompts_;
  std::vector<bool>        edit_had_mask_;

  explicit FakeAdapter(std::string name) : name_(std::move(name)), error_(name_ + " is down") {}

  auto FailsOn(const std::string& prompt) const -> bool {
    return !fail_on_prompt_.empty() && prompt.find(fail_on_prompt_) != std::string::npos;
  }

  auto Name() const -> std::string override { return name_; }

  auto Synthesize(const GenerationRequest& request) -> raster_bytes_t override {
    ++synth_calls_;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      prompts_.push_back(request.prompt_);
    }
    if (fail_synthesize_ || FailsOn(request.prompt_)) {
      throw std::runtime_error(error_);
    }
    const ImageSize out = output_size_.value_or(request.size_);
    return SolidPng(out.width_, out.height_);
  }

  auto Edit(const EditRequest& request) -> raster_bytes_t override {
    ++edit_calls_;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      prompts_.push_back(request.prompt_);
      edit_had_mask_.push_back(request.mask_.has_value());
    }
    if (fail_edit_ || FailsOn(request.prompt_) || (fail_masked_ && request.mask_.has_value())) {
      throw std::runtime_error(error_);
    }
    const ImageSize out = output_size_.value_or(request.size_);
    return SolidPng(out.width_, out.height_, {40, 200, 40});
  }
};

/**
 * @brief Cuts out everything: returns a transparent BGRA raster of a fixed size.
 */
class FakeRemover : public BackgroundRemover {
 public:
  int  width_  = 0;
  int  height_ = 0;

  auto Remove(const raster_bytes_t& source) -> raster_bytes_t override {
    auto    copy = source;
    cv::Mat decoded = cv::imdecode(copy, cv::IMREAD_UNCHANGED);
    int     w       = width_ > 0 ? width_ : decoded.cols;
    int     h       = height_ > 0 ? height_ : decoded.rows;
    return EncodePng(cv::Mat(h, w, CV_8UC4, cv::Scalar(0, 0, 0, 0)));
  }
};
};  // namespace atelier
