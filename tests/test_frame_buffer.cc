#include <gtest/gtest.h>
#include <limits>
#include "frame_buffer.hh"
#include "test_helpers.hh"

class FrameBufferTest : public ::testing::Test
{
protected:
  frame_buffer_t buffer;
};

TEST_F(FrameBufferTest, EmptyBuffer)
{
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.frame_count(), 0u);
  EXPECT_EQ(buffer.frame_at_or_before(100.0), nullptr);
  EXPECT_EQ(buffer.update_at_or_before("01001", 100.0, nullptr), nullptr);
}

TEST_F(FrameBufferTest, OutOfOrderArrivalIsSortedByTimestamp)
{
  EXPECT_EQ(buffer.ingest(make_frame(30.0, "01001", make_update(30, 30, 60, 60))), 1);
  EXPECT_EQ(buffer.ingest(make_frame(10.0, "01001", make_update(10, 10, 20, 20))), 1);
  EXPECT_EQ(buffer.ingest(make_frame(20.0, "01001", make_update(20, 20, 40, 40))), 1);

  EXPECT_EQ(buffer.frame_count(), 3u);
  EXPECT_DOUBLE_EQ(buffer.first_timestamp(), 10.0);
  EXPECT_DOUBLE_EQ(buffer.last_timestamp(), 30.0);

  double source = -1.0;
  const county_update* update = buffer.update_at_or_before("01001", 25.0, &source);
  ASSERT_NE(update, nullptr);
  EXPECT_EQ(update->total_votes, 40);
  EXPECT_DOUBLE_EQ(source, 20.0);

  const frame_t* frame = buffer.frame_at_or_before(29.999);
  ASSERT_NE(frame, nullptr);
  EXPECT_DOUBLE_EQ(frame->timestamp, 20.0);
}

TEST_F(FrameBufferTest, CursorBeforeFirstFrameIsNotAnError)
{
  buffer.ingest(make_frame(10.0, "01001", make_update(10, 10, 20, 20)));
  EXPECT_EQ(buffer.frame_at_or_before(5.0), nullptr);
  EXPECT_EQ(buffer.update_at_or_before("01001", 9.99, nullptr), nullptr);
  EXPECT_NE(buffer.update_at_or_before("01001", 10.0, nullptr), nullptr);
}

TEST_F(FrameBufferTest, DuplicateTimestampLaterUpdateWins)
{
  frame_t first;
  first.timestamp = 10.0;
  first.updates["01001"] = make_update(10, 10, 20, 20);
  first.updates["01003"] = make_update(5, 5, 10, 10);
  buffer.ingest(first);
  buffer.ingest(make_frame(10.0, "01001", make_update(15, 15, 30, 30)));

  EXPECT_EQ(buffer.frame_count(), 1u);
  const frame_t* frame = buffer.frame_at_or_before(10.0);
  ASSERT_NE(frame, nullptr);
  ASSERT_EQ(frame->updates.size(), 2u);
  EXPECT_EQ(frame->updates.at("01001").total_votes, 30);
  EXPECT_EQ(frame->updates.at("01003").total_votes, 10);
}

TEST_F(FrameBufferTest, IdsAreNormalized)
{
  buffer.ingest(make_frame(1.0, "1001", make_update(1, 1, 2, 1)));
  EXPECT_NE(buffer.update_at_or_before("01001", 1.0, nullptr), nullptr);

  EXPECT_EQ(buffer.ingest(make_frame(2.0, "not-a-county", make_update(1, 1, 2, 1))), 0);
  std::vector<std::string> ids = buffer.entity_ids();
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(ids[0], "01001");
}

TEST_F(FrameBufferTest, NonFiniteTimestampRejected)
{
  uint64_t revision = buffer.revision();
  frame_t frame = make_frame(std::numeric_limits<double>::quiet_NaN(), "01001", make_update(1, 1, 2, 1));
  EXPECT_EQ(buffer.ingest(frame), -1);
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.rejected_frames(), 1u);
  EXPECT_EQ(buffer.revision(), revision);
}

TEST_F(FrameBufferTest, RevisionAdvancesOnIngest)
{
  uint64_t revision = buffer.revision();
  buffer.ingest(make_frame(1.0, "01001", make_update(1, 1, 2, 1)));
  EXPECT_GT(buffer.revision(), revision);
}

TEST(NormalizeUpdateTest, PartsExceedingTotalAreCorrected)
{
  county_update update = make_update(70, 50, 100, 50);
  update.other_votes = 10;
  update.has_other_votes = true;

  EXPECT_GT(normalize_update(update, 99.9), 0);
  EXPECT_EQ(update.other_votes, 0);
  EXPECT_EQ(update.total_votes, 120);
}

TEST(NormalizeUpdateTest, OtherDerivedWhenMissing)
{
  county_update update = make_update(40, 50, 100, 50);
  EXPECT_EQ(normalize_update(update, 99.9), 0);
  EXPECT_EQ(update.other_votes, 10);
  EXPECT_EQ(update.total_votes, 100);
}

TEST(NormalizeUpdateTest, ClampsNegativesAndReporting)
{
  county_update update = make_update(-5, 20, 30, 140);
  EXPECT_GT(normalize_update(update, 99.9), 0);
  EXPECT_EQ(update.dem_votes, 0);
  EXPECT_EQ(update.other_votes, 10);
  EXPECT_DOUBLE_EQ(update.reporting_percent, 100.0);
  EXPECT_TRUE(update.is_fully_reported);

  county_update nan_update = make_update(1, 1, 2, std::numeric_limits<double>::quiet_NaN());
  normalize_update(nan_update, 99.9);
  EXPECT_DOUBLE_EQ(nan_update.reporting_percent, 0.0);
}

TEST_F(FrameBufferTest, IngestCountsCorrections)
{
  buffer.ingest(make_frame(5.0, "01001", make_update(70, 50, 100, 50)));
  EXPECT_EQ(buffer.corrected_updates(), 1u);
  const county_update* update = buffer.update_at_or_before("01001", 5.0, nullptr);
  ASSERT_NE(update, nullptr);
  EXPECT_EQ(update->total_votes, 120);
}
