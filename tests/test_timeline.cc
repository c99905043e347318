#include <gtest/gtest.h>
#include <limits>
#include <vector>
#include "timeline.hh"

class TimelineTest : public ::testing::Test
{
protected:
  TimelineTest()
    : timeline([this](double cursor) { on_derive(cursor); })
  {
  }

  void on_derive(double cursor)
  {
    derived.push_back(cursor);
    if (hook)
    {
      std::function<void()> fn = hook;
      hook = nullptr;
      fn();
    }
  }

  std::vector<double> derived;
  std::function<void()> hook;
  timeline_controller_t timeline;
};

TEST_F(TimelineTest, IdleUntilLoaded)
{
  EXPECT_EQ(timeline.status(), playback_status::idle);
  EXPECT_FALSE(timeline.play());
  EXPECT_FALSE(timeline.seek_to_time(5.0));
  timeline.tick(1.0, 1);
  EXPECT_TRUE(derived.empty());
}

TEST_F(TimelineTest, LoadDerivesAtZero)
{
  timeline.load(100.0);
  EXPECT_EQ(timeline.status(), playback_status::ready);
  ASSERT_EQ(derived.size(), 1u);
  EXPECT_DOUBLE_EQ(derived[0], 0.0);
}

TEST_F(TimelineTest, RunsAtSpeedAndCompletes)
{
  timeline.load(100.0);
  ASSERT_TRUE(timeline.play());
  ASSERT_TRUE(timeline.set_speed(20.0));
  timeline.tick(1.0, 0);
  EXPECT_DOUBLE_EQ(timeline.cursor(), 20.0);
  EXPECT_EQ(timeline.status(), playback_status::running);

  timeline.tick(10.0, 0);
  EXPECT_DOUBLE_EQ(timeline.cursor(), 100.0);
  EXPECT_EQ(timeline.status(), playback_status::completed);
  EXPECT_DOUBLE_EQ(timeline.progress_percent(), 100.0);
}

TEST_F(TimelineTest, PlayFromCompletedRestarts)
{
  timeline.load(10.0);
  timeline.play();
  timeline.tick(20.0, 0);
  ASSERT_EQ(timeline.status(), playback_status::completed);

  EXPECT_TRUE(timeline.play());
  EXPECT_DOUBLE_EQ(timeline.cursor(), 0.0);
  EXPECT_EQ(timeline.status(), playback_status::running);
}

TEST_F(TimelineTest, PauseStopsAdvancing)
{
  timeline.load(100.0);
  timeline.play();
  timeline.tick(5.0, 0);
  EXPECT_TRUE(timeline.pause());
  timeline.tick(5.0, 0);
  EXPECT_DOUBLE_EQ(timeline.cursor(), 5.0);
  EXPECT_FALSE(timeline.pause());
}

TEST_F(TimelineTest, SpeedMustBePositive)
{
  EXPECT_FALSE(timeline.set_speed(0.0));
  EXPECT_FALSE(timeline.set_speed(-2.0));
  EXPECT_FALSE(timeline.set_speed(std::numeric_limits<double>::infinity()));
  EXPECT_TRUE(timeline.set_speed(0.1));
  EXPECT_DOUBLE_EQ(timeline.speed(), 0.1);
}

TEST_F(TimelineTest, SeekClampsAndKeepsRunning)
{
  timeline.load(100.0);
  timeline.play();

  EXPECT_TRUE(timeline.seek_to_time(-5.0));
  EXPECT_DOUBLE_EQ(timeline.cursor(), 0.0);
  EXPECT_EQ(timeline.status(), playback_status::running);

  EXPECT_TRUE(timeline.seek_to_time(40.0));
  EXPECT_DOUBLE_EQ(timeline.cursor(), 40.0);
  EXPECT_EQ(timeline.status(), playback_status::running);

  EXPECT_TRUE(timeline.seek_to_time(500.0));
  EXPECT_DOUBLE_EQ(timeline.cursor(), 100.0);
  EXPECT_EQ(timeline.status(), playback_status::completed);
}

TEST_F(TimelineTest, SeekFromReadyLeavesPaused)
{
  timeline.load(100.0);
  EXPECT_TRUE(timeline.seek_to_percent(25.0));
  EXPECT_DOUBLE_EQ(timeline.cursor(), 25.0);
  EXPECT_EQ(timeline.status(), playback_status::paused);
  EXPECT_FALSE(timeline.seek_to_time(std::numeric_limits<double>::quiet_NaN()));
}

TEST_F(TimelineTest, SeekToPercentNeedsDuration)
{
  timeline.load(0.0);
  EXPECT_FALSE(timeline.seek_to_percent(50.0));
}

TEST_F(TimelineTest, SeeksDuringDerivationCoalesce)
{
  timeline.load(100.0);
  derived.clear();

  hook = [this]()
  {
    timeline.seek_to_time(30.0);
    timeline.seek_to_time(60.0);
    timeline.seek_to_time(90.0);
  };
  timeline.seek_to_time(10.0);

  ASSERT_EQ(derived.size(), 2u);
  EXPECT_DOUBLE_EQ(derived[0], 10.0);
  EXPECT_DOUBLE_EQ(derived[1], 90.0);
  EXPECT_DOUBLE_EQ(timeline.cursor(), 90.0);
}

TEST_F(TimelineTest, IdleTicksReplayOnlyForNewFrames)
{
  timeline.load(100.0);
  derived.clear();

  timeline.tick(1.0, 0);
  EXPECT_TRUE(derived.empty());
  timeline.tick(1.0, 3);
  EXPECT_EQ(derived.size(), 1u);
  timeline.tick(1.0, 3);
  EXPECT_EQ(derived.size(), 1u);
  EXPECT_DOUBLE_EQ(timeline.cursor(), 0.0);
}

TEST_F(TimelineTest, FailFreezesCursor)
{
  timeline.load(100.0);
  timeline.play();
  timeline.tick(10.0, 0);
  timeline.fail("connection lost");

  EXPECT_EQ(timeline.status(), playback_status::error);
  EXPECT_EQ(timeline.last_error(), "connection lost");
  EXPECT_FALSE(timeline.play());
  EXPECT_FALSE(timeline.seek_to_time(50.0));
  timeline.tick(10.0, 5);
  EXPECT_DOUBLE_EQ(timeline.cursor(), 10.0);

  timeline.load(100.0);
  EXPECT_EQ(timeline.status(), playback_status::ready);
  EXPECT_TRUE(timeline.last_error().empty());
}

TEST_F(TimelineTest, DisposeStopsScheduler)
{
  fixed_step_scheduler_t scheduler(1.0);
  timeline.load(100.0);
  timeline.attach(&scheduler, [this](double delta) { timeline.tick(delta, 0); });
  timeline.play();

  EXPECT_TRUE(scheduler.step());
  EXPECT_DOUBLE_EQ(timeline.cursor(), 1.0);

  timeline.dispose();
  EXPECT_FALSE(scheduler.active());
  EXPECT_FALSE(scheduler.step());
  EXPECT_FALSE(timeline.play());
  EXPECT_DOUBLE_EQ(timeline.cursor(), 1.0);
}

TEST_F(TimelineTest, DisposeDuringDerivationDropsQueuedSeeks)
{
  timeline.load(100.0);
  derived.clear();

  hook = [this]()
  {
    timeline.seek_to_time(50.0);
    timeline.dispose();
  };
  EXPECT_FALSE(timeline.seek_to_time(10.0));
  EXPECT_EQ(derived.size(), 1u);
}

TEST(StatusTest, Names)
{
  EXPECT_EQ(to_string(playback_status::running), "running");
  EXPECT_EQ(to_string(playback_status::completed), "completed");
}
