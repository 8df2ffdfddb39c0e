#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "app/studio_config.hpp"
#include "type/errors.hpp"

using namespace atelier;

class StudioConfigTests : public ::testing::Test {
 protected:
  std::filesystem::path config_path_;

  void                  SetUp() override {
    config_path_ = std::filesystem::temp_directory_path() / "atelier_config_test.json";
    if (std::filesystem::exists(config_path_)) {
      std::filesystem::remove(config_path_);
    }
  }

  void TearDown() override {
    if (std::filesystem::exists(config_path_)) {
      std::filesystem::remove(config_path_);
    }
  }
};

TEST_F(StudioConfigTests, MissingFileGivesDefaults) {
  auto config = StudioConfig::Load(config_path_);
  EXPECT_EQ(config.worker_count_, 4u);
  EXPECT_EQ(config.gif_max_edge_, 512);
  EXPECT_TRUE(config.db_path_.empty());
  EXPECT_TRUE(config.IsValidSize({1536, 1024}));
  EXPECT_FALSE(config.IsValidSize({512, 512}));
}

TEST_F(StudioConfigTests, SaveThenLoad) {
  StudioConfig config;
  config.images_dir_     = "/tmp/atelier_images";
  config.worker_count_   = 2;
  config.adapter_order_  = {"beta", "alpha"};
  config.prompt_db_path_ = "/tmp/atelier_prompts.db";
  config.valid_sizes_    = {{512, 512}};
  config.Save(config_path_);

  auto loaded = StudioConfig::Load(config_path_);
  EXPECT_EQ(loaded.images_dir_, config.images_dir_);
  EXPECT_EQ(loaded.worker_count_, 2u);
  EXPECT_EQ(loaded.adapter_order_, config.adapter_order_);
  EXPECT_EQ(loaded.prompt_db_path_, config.prompt_db_path_);
  ASSERT_EQ(loaded.valid_sizes_.size(), 1u);
  EXPECT_TRUE(loaded.IsValidSize({512, 512}));
}

TEST_F(StudioConfigTests, WorkerCountIsClamped) {
  std::ofstream(config_path_) << R"({"worker_count": 64})";
  EXPECT_EQ(StudioConfig::Load(config_path_).worker_count_, 4u);
}

TEST_F(StudioConfigTests, MalformedConfigIsRejected) {
  std::ofstream(config_path_) << "{ not json";
  EXPECT_THROW(StudioConfig::Load(config_path_), ValidationError);

  std::ofstream(config_path_) << R"({"gif_max_edge": 0})";
  EXPECT_THROW(StudioConfig::Load(config_path_), ValidationError);

  std::ofstream(config_path_) << R"({"valid_sizes": ["big"]})";
  EXPECT_THROW(StudioConfig::Load(config_path_), ValidationError);

  std::ofstream(config_path_) << R"({"db_path": "studio.db", "prompt_db_path": "studio.db"})";
  EXPECT_THROW(StudioConfig::Load(config_path_), ValidationError);
}
