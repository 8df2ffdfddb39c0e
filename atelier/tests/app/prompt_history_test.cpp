#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "app/prompt_history.hpp"
#include "storage/store/memory_record_store.hpp"
#include "type/errors.hpp"

using namespace atelier;

class PromptHistoryTests : public ::testing::Test {
 protected:
  std::shared_ptr<MemoryRecordStore>    store_;
  std::unique_ptr<PromptHistory>        history_;
  std::chrono::system_clock::time_point now_{std::chrono::hours(24 * 365 * 55)};

  void                                  SetUp() override {
    store_   = std::make_shared<MemoryRecordStore>();
    history_ = std::make_unique<PromptHistory>(store_, [this]() { return now_; });
  }

  void Advance(std::chrono::seconds by) { now_ += by; }
};

TEST_F(PromptHistoryTests, RecentIsNewestFirst) {
  EXPECT_TRUE(history_->Record("a foggy pier"));
  Advance(std::chrono::seconds(1));
  EXPECT_TRUE(history_->Record("a neon alley"));

  auto recent = history_->Recent();
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].prompt_, "a neon alley");
  EXPECT_EQ(recent[1].prompt_, "a foggy pier");
  EXPECT_FALSE(recent[0].created_time_.empty());
  EXPECT_EQ(history_->Recent(1).size(), 1u);
}

TEST_F(PromptHistoryTests, RepeatWithinWindowIsSkipped) {
  EXPECT_TRUE(history_->Record("a red kite"));
  Advance(std::chrono::seconds(299));
  EXPECT_FALSE(history_->Record("a red kite"));
  EXPECT_EQ(store_->Size(), 1u);

  Advance(std::chrono::seconds(1));
  EXPECT_TRUE(history_->Record("a red kite"));
  EXPECT_EQ(store_->Size(), 2u);
  EXPECT_FALSE(history_->Record(""));
}

TEST_F(PromptHistoryTests, RepeatOutsideLastTenIsStoredAgain) {
  EXPECT_TRUE(history_->Record("the first prompt"));
  for (int i = 0; i < 10; ++i) {
    EXPECT_TRUE(history_->Record("filler " + std::to_string(i)));
  }
  EXPECT_TRUE(history_->Record("the first prompt"));
}

TEST_F(PromptHistoryTests, KeepsOnlyNewestFifty) {
  for (int i = 0; i < 60; ++i) {
    history_->Record("prompt " + std::to_string(i));
  }
  EXPECT_EQ(store_->Size(), PromptHistory::kMaxEntries);
  auto recent = history_->Recent(100);
  ASSERT_EQ(recent.size(), 50u);
  EXPECT_EQ(recent.front().prompt_, "prompt 59");
  EXPECT_EQ(recent.back().prompt_, "prompt 10");
}

TEST_F(PromptHistoryTests, SuggestPutsPrefixMatchesFirst) {
  history_->Record("Castle on a hill");
  history_->Record("a sandcastle at dawn");
  history_->Record("castle ruins in fog");
  history_->Record("a forest path");
  Advance(std::chrono::seconds(600));
  history_->Record("castle ruins in fog");

  auto suggestions = history_->Suggest("CASTLE");
  ASSERT_EQ(suggestions.size(), 3u);
  EXPECT_EQ(suggestions[0].prompt_, "castle ruins in fog");
  EXPECT_EQ(suggestions[1].prompt_, "Castle on a hill");
  EXPECT_EQ(suggestions[2].prompt_, "a sandcastle at dawn");
}

TEST_F(PromptHistoryTests, SuggestCapsAtTen) {
  for (int i = 0; i < 15; ++i) {
    history_->Record("sunset " + std::to_string(i));
  }
  EXPECT_EQ(history_->Suggest("sun").size(), PromptHistory::kMaxSuggestions);
  EXPECT_TRUE(history_->Suggest("glacier").empty());
}

TEST_F(PromptHistoryTests, ClearEmptiesHistory) {
  history_->Record("one");
  history_->Record("two");
  history_->Clear();
  EXPECT_EQ(store_->Size(), 0u);
  EXPECT_TRUE(history_->Recent().empty());
  EXPECT_TRUE(history_->Record("one"));
}

TEST_F(PromptHistoryTests, BadArgumentsAreRejected) {
  EXPECT_THROW(history_->Recent(0), ValidationError);
  EXPECT_THROW(history_->Recent(101), ValidationError);
  EXPECT_THROW(history_->Suggest(""), ValidationError);
}
