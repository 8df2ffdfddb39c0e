#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lineage/lineage_graph.hpp"
#include "storage/store/memory_record_store.hpp"
#include "utils/clock/time_provider.hpp"

namespace atelier {
class LineageGraphTests : public ::testing::Test {
 protected:
  std::shared_ptr<MemoryRecordStore> store_;
  std::unique_ptr<LineageGraph>      graph_;

  void                               SetUp() override {
    TimeProvider::Refresh();
    store_ = std::make_shared<MemoryRecordStore>();
    graph_ = std::make_unique<LineageGraph>(store_);
  }

  auto AddOriginal(const std::string& prompt) -> ImageAsset {
    ImageAsset asset;
    asset.prompt_  = prompt;
    asset.width_   = 1024;
    asset.height_  = 1024;
    asset.payload_ = GenerationParams{};
    return graph_->Insert(std::move(asset));
  }

  auto AddChild(const ImageAsset& parent, OperationKind kind, OperationPayload payload)
      -> ImageAsset {
    ImageAsset asset;
    asset.parent_id_ = parent.id_;
    asset.prompt_    = parent.prompt_;
    asset.width_     = parent.width_;
    asset.height_    = parent.height_;
    asset.kind_      = kind;
    asset.payload_   = std::move(payload);
    return graph_->Insert(std::move(asset));
  }
};
};  // namespace atelier
