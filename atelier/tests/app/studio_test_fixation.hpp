#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <opencv2/imgcodecs.hpp>

#include "app/studio_service.hpp"
#include "model/fake_adapters.hpp"
#include "utils/clock/time_provider.hpp"

namespace atelier {
class StudioServiceTests : public ::testing::Test {
 protected:
  std::filesystem::path          images_dir_;
  std::shared_ptr<FakeAdapter>   alpha_;
  std::shared_ptr<FakeAdapter>   beta_;
  std::shared_ptr<FakeRemover>   remover_;
  std::unique_ptr<StudioService> service_;

  // Run before any unit test runs
  void                           SetUp() override {
    TimeProvider::Refresh();
    images_dir_ = std::filesystem::temp_directory_path() / "atelier_studio_test";
    if (std::filesystem::exists(images_dir_)) {
      std::filesystem::remove_all(images_dir_);
    }
    alpha_   = std::make_shared<FakeAdapter>("alpha");
    beta_    = std::make_shared<FakeAdapter>("beta");
    remover_ = std::make_shared<FakeRemover>();
    Rebuild(nullptr);
  }

  void TearDown() override {
    service_.reset();
    if (std::filesystem::exists(images_dir_)) {
      std::filesystem::remove_all(images_dir_);
    }
  }

  void Rebuild(std::shared_ptr<PromptEnricher> enricher) {
    StudioConfig config;
    config.images_dir_   = images_dir_;
    config.worker_count_ = 2;
    service_             = std::make_unique<StudioService>(
        config, std::vector<std::shared_ptr<ModelAdapter>>{alpha_, beta_}, std::move(enricher),
        remover_);
  }

  auto Original(const std::string& prompt = "a quiet harbor") -> ImageAsset {
    GenerateRequest request;
    request.prompt_ = prompt;
    return service_->Generate(request).assets_.front();
  }

  auto ReadRaster(const ImageAsset& asset) -> cv::Mat {
    return cv::imread((images_dir_ / asset.filename_).string(), cv::IMREAD_UNCHANGED);
  }
};
};  // namespace atelier
