#include <gtest/gtest.h>

#include "app/batch_csv.hpp"
#include "type/errors.hpp"

using namespace atelier;

namespace {
const std::vector<ImageSize> kSizes = {{1024, 1024}, {1024, 1536}, {1536, 1024}};
}  // namespace

TEST(BatchCsvTests, ParsesOptionalColumns) {
  const std::string csv =
      "Prompt,Style,Size,Model\r\n"
      "a red fox,watercolor,1536x1024,alpha\r\n"
      "\"city, at night\",,,\r\n";
  auto rows = ParseBatchCsv(csv, kSizes);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].prompt_, "a red fox");
  EXPECT_EQ(rows[0].style_, "watercolor");
  EXPECT_EQ(rows[0].size_, (ImageSize{1536, 1024}));
  ASSERT_TRUE(rows[0].model_.has_value());
  EXPECT_EQ(*rows[0].model_, "alpha");

  EXPECT_EQ(rows[1].prompt_, "city, at night");
  EXPECT_EQ(rows[1].style_, "none");
  EXPECT_EQ(rows[1].size_, (ImageSize{1024, 1024}));
  EXPECT_FALSE(rows[1].model_.has_value());
}

TEST(BatchCsvTests, SkipsBlankPrompts) {
  auto rows = ParseBatchCsv("prompt\nfirst\n\n   \nsecond\n", kSizes);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].prompt_, "second");
}

TEST(BatchCsvTests, QuotedFieldsKeepQuotesAndNewlines) {
  auto records = SplitCsv("a,\"say \"\"hi\"\"\",\"two\nlines\"\n");
  ASSERT_EQ(records.size(), 1u);
  ASSERT_EQ(records[0].size(), 3u);
  EXPECT_EQ(records[0][1], "say \"hi\"");
  EXPECT_EQ(records[0][2], "two\nlines");
}

TEST(BatchCsvTests, RejectsBadSheets) {
  EXPECT_THROW(ParseBatchCsv("", kSizes), ValidationError);
  EXPECT_THROW(ParseBatchCsv("style\nanime\n", kSizes), ValidationError);
  EXPECT_THROW(ParseBatchCsv("prompt\n\n", kSizes), ValidationError);
  EXPECT_THROW(ParseBatchCsv("prompt,size\ncat,512x512\n", kSizes), ValidationError);
  EXPECT_THROW(ParseBatchCsv("prompt\n\"open quote\n", kSizes), ValidationError);
}

TEST(BatchCsvTests, RowLimit) {
  std::string csv = "prompt\n";
  for (size_t i = 0; i < kMaxBatchRows; ++i) {
    csv += "prompt " + std::to_string(i) + "\n";
  }
  EXPECT_EQ(ParseBatchCsv(csv, kSizes).size(), kMaxBatchRows);
  csv += "one too many\n";
  EXPECT_THROW(ParseBatchCsv(csv, kSizes), ValidationError);
}
