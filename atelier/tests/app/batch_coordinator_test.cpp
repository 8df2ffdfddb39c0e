#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "app/batch_coordinator.hpp"
#include "type/errors.hpp"

using namespace atelier;

namespace {
auto Succeeding(const std::string& prompt) -> BatchUnit {
  return [prompt]() {
    ImageAsset asset;
    asset.id_     = prompt;
    asset.prompt_ = prompt;
    return asset;
  };
}

auto Failing(const std::string& message) -> BatchUnit {
  return [message]() -> ImageAsset { throw std::runtime_error(message); };
}
}  // namespace

TEST(BatchCoordinatorTests, SubmitMixedOutcomes) {
  BatchCoordinator       coordinator(4);
  std::vector<BatchUnit> units = {Succeeding("one"), Failing("rate limited"), Succeeding("two"),
                                  Failing("timeout"), Succeeding("three")};
  auto                   id    = coordinator.Submit(std::move(units));

  auto                   snap  = coordinator.Await(id);
  EXPECT_EQ(snap.total_, 5u);
  EXPECT_EQ(snap.completed_, 3u);
  EXPECT_EQ(snap.failed_, 2u);
  EXPECT_EQ(snap.status_, BatchStatus::COMPLETE);
  EXPECT_EQ(snap.results_.size(), 3u);
  EXPECT_EQ(snap.errors_.size(), 2u);
  EXPECT_EQ(snap.ToJSON()["status"], "complete");
}

TEST(BatchCoordinatorTests, QueryWhileRunning) {
  BatchCoordinator  coordinator(1);
  std::atomic<bool> release{false};
  BatchUnit         blocked = [&release]() {
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return ImageAsset{};
  };
  auto id   = coordinator.Submit({blocked, Succeeding("after")});

  auto snap = coordinator.Query(id);
  EXPECT_EQ(snap.status_, BatchStatus::PROCESSING);
  EXPECT_LE(snap.completed_ + snap.failed_, snap.total_);
  EXPECT_FALSE(coordinator.Expire(id));

  release = true;
  snap    = coordinator.Await(id);
  EXPECT_EQ(snap.completed_, 2u);
  EXPECT_TRUE(coordinator.Expire(id));
  EXPECT_EQ(coordinator.JobCount(), 0u);
  EXPECT_THROW(coordinator.Query(id), AssetNotFound);
}

TEST(BatchCoordinatorTests, EmptyJobIsComplete) {
  BatchCoordinator coordinator(2);
  auto             id = coordinator.Submit({});
  EXPECT_EQ(coordinator.Query(id).status_, BatchStatus::COMPLETE);
}

TEST(BatchCoordinatorTests, CallerSuppliedIdMustBeUnique) {
  BatchCoordinator coordinator(2);
  EXPECT_EQ(coordinator.Submit({Succeeding("x")}, "job-1"), "job-1");
  EXPECT_THROW(coordinator.Submit({Succeeding("y")}, "job-1"), ValidationError);
  coordinator.Await("job-1");
}

TEST(BatchCoordinatorTests, RunAllCollectsPartialFailures) {
  BatchCoordinator coordinator(4);
  auto outcome = coordinator.RunAll({Succeeding("a"), Failing("nope"), Succeeding("b")});
  EXPECT_EQ(outcome.assets_.size(), 2u);
  ASSERT_EQ(outcome.errors_.size(), 1u);
  EXPECT_EQ(outcome.errors_[0], "nope");
  EXPECT_TRUE(outcome.PartiallyFailed());
}

TEST(BatchCoordinatorTests, RunAllAllFailing) {
  BatchCoordinator coordinator(2);
  try {
    coordinator.RunAll({Failing("first"), Failing("second")});
    FAIL() << "expected BatchFailed";
  } catch (const BatchFailed& e) {
    EXPECT_EQ(e.Errors().size(), 2u);
    EXPECT_NE(std::string(e.what()).find("first; second"), std::string::npos);
  }
}

TEST(BatchCoordinatorTests, UnknownJob) {
  BatchCoordinator coordinator(1);
  EXPECT_THROW(coordinator.Await("missing"), AssetNotFound);
  EXPECT_THROW(coordinator.Expire("missing"), AssetNotFound);
}
