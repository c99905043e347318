#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "data.hh"

class ScenarioDbTest : public ::testing::Test
{
protected:
  ScenarioDbTest()
    : db(":memory:")
  {
  }

  ~ScenarioDbTest()
  {
    for (size_t idx = 0; idx < written.size(); idx++)
    {
      std::remove(written[idx].c_str());
    }
  }

  std::string write_csv(const std::string& name, const std::string& content)
  {
    std::string path = ::testing::TempDir() + name;
    std::ofstream ofs(path.c_str());
    ofs << content;
    written.push_back(path);
    return path;
  }

  std::string baseline_csv()
  {
    return write_csv("playback_baseline.csv",
      "fips,county,dem_votes,rep_votes,total_votes\n"
      "1001,Autauga,40,60,100\n"
      "13001,Appling,150,150,300\n"
      "123456,Nowhere,1,1,2\n"
      "1001,Autauga,60,140,200\n");
  }

  std::string frames_csv()
  {
    return write_csv("playback_frames.csv",
      "timestamp,fips,dem_votes,gop_votes,total_votes,reporting_percent\n"
      "20.5,1001,10,10,20,20\n"
      "10,1001,5,5,10,10\n"
      "10,13001,1,2,3,1\n"
      "10,1001,6,6,12,11\n");
  }

  scenario_db_t db;
  std::vector<std::string> written;
};

TEST_F(ScenarioDbTest, BaselineAcceptsRepVotesAndPadsFips)
{
  ASSERT_EQ(db.load_baseline_csv(baseline_csv()), 2);

  std::vector<baseline_entity> baseline = db.get_baseline();
  ASSERT_EQ(baseline.size(), 2u);
  EXPECT_EQ(baseline[0].fips, "01001");
  EXPECT_EQ(baseline[0].state_fips, "01");
  EXPECT_EQ(baseline[0].name, "Autauga");
  EXPECT_EQ(baseline[1].fips, "13001");
  EXPECT_EQ(baseline[1].state_fips, "13");
  EXPECT_DOUBLE_EQ(baseline[1].gop_share, 0.5);
}

TEST_F(ScenarioDbTest, DuplicateBaselineRowKeepsTheLastOne)
{
  ASSERT_EQ(db.load_baseline_csv(baseline_csv()), 2);

  std::vector<baseline_entity> baseline = db.get_baseline();
  ASSERT_EQ(baseline[0].fips, "01001");
  EXPECT_EQ(baseline[0].expected_total_votes, 200);
  EXPECT_DOUBLE_EQ(baseline[0].dem_share, 0.3);
  EXPECT_DOUBLE_EQ(baseline[0].gop_share, 0.7);
  EXPECT_DOUBLE_EQ(baseline[0].other_share, 0.0);
}

TEST_F(ScenarioDbTest, BaselineWithoutGopColumnRejected)
{
  std::string path = write_csv("playback_bad_baseline.csv",
    "fips,county,dem_votes,total_votes\n"
    "1001,Autauga,40,100\n");
  EXPECT_EQ(db.load_baseline_csv(path), -1);
}

TEST_F(ScenarioDbTest, OneFramePerTimestampInFileOrder)
{
  ASSERT_EQ(db.load_frames_csv(frames_csv()), 4);

  std::vector<frame_t> frames = db.get_frames();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_DOUBLE_EQ(frames[0].timestamp, 10.0);
  EXPECT_DOUBLE_EQ(frames[1].timestamp, 20.5);

  ASSERT_EQ(frames[0].updates.size(), 2u);
  const county_update& update = frames[0].updates.at("01001");
  EXPECT_EQ(update.total_votes, 12);
  EXPECT_DOUBLE_EQ(update.reporting_percent, 11.0);
  EXPECT_FALSE(update.has_other_votes);
  EXPECT_FALSE(update.is_fully_reported);
  EXPECT_EQ(frames[0].updates.at("13001").gop_votes, 2);
}

TEST_F(ScenarioDbTest, OtherVotesColumnIsOptional)
{
  std::string path = write_csv("playback_frames_other.csv",
    "timestamp,fips,dem_votes,gop_votes,other_votes,total_votes,reporting_percent\n"
    "5,1001,40,50,10,100,100\n");
  ASSERT_EQ(db.load_frames_csv(path), 1);

  std::vector<frame_t> frames = db.get_frames();
  ASSERT_EQ(frames.size(), 1u);
  const county_update& update = frames[0].updates.at("01001");
  EXPECT_TRUE(update.has_other_votes);
  EXPECT_EQ(update.other_votes, 10);
  EXPECT_TRUE(update.is_fully_reported);
}

TEST_F(ScenarioDbTest, DurationFallsBackToLastFrame)
{
  ASSERT_EQ(db.load_frames_csv(frames_csv()), 4);
  EXPECT_DOUBLE_EQ(db.get_duration(), 20.5);

  reporting_config reporting;
  ASSERT_EQ(db.set_scenario("test night", 0.0, reporting), 0);
  EXPECT_DOUBLE_EQ(db.get_duration(), 21.0);

  ASSERT_EQ(db.set_scenario("test night", 90.0, reporting), 0);
  EXPECT_DOUBLE_EQ(db.get_duration(), 90.0);
}

TEST_F(ScenarioDbTest, BootstrapCarriesScenarioMetadata)
{
  ASSERT_EQ(db.load_baseline_csv(baseline_csv()), 2);
  ASSERT_EQ(db.load_frames_csv(frames_csv()), 4);

  scenario_bootstrap unnamed = db.get_bootstrap();
  EXPECT_EQ(unnamed.name, ":memory:");
  EXPECT_FALSE(unnamed.reporting.present);

  reporting_config reporting;
  reporting.present = true;
  reporting.description = "east coast first";
  reporting.reporting_groups.push_back("ET");
  reporting.reporting_groups.push_back("CT");
  ASSERT_EQ(db.set_scenario("test night", 60.0, reporting), 0);

  scenario_bootstrap bootstrap = db.get_bootstrap();
  EXPECT_EQ(bootstrap.name, "test night");
  EXPECT_DOUBLE_EQ(bootstrap.total_duration_seconds, 60.0);
  EXPECT_EQ(bootstrap.baseline.size(), 2u);
  ASSERT_TRUE(bootstrap.reporting.present);
  EXPECT_EQ(bootstrap.reporting.description, "east coast first");
  ASSERT_EQ(bootstrap.reporting.reporting_groups.size(), 2u);
  EXPECT_EQ(bootstrap.reporting.reporting_groups[1], "CT");
}
