#include <gtest/gtest.h>
#include <stdexcept>
#include "county_store.hh"
#include "test_helpers.hh"

class CountyStoreTest : public ::testing::Test
{
protected:
  CountyStoreTest()
    : catalog(three_county_baseline()), store(catalog, buffer)
  {
    buffer.ingest(make_frame(10.0, "01001", make_update(20, 30, 50, 50)));
    buffer.ingest(make_frame(20.0, "01001", make_update(40, 60, 100, 100)));
    buffer.ingest(make_frame(15.0, "13001", make_update(100, 50, 150, 50)));
  }

  baseline_catalog_t catalog;
  frame_buffer_t buffer;
  county_store_t store;
};

TEST_F(CountyStoreTest, EveryCatalogCountyPresentBeforeFirstFrame)
{
  store.apply_up_to_cursor(0.0);
  ASSERT_EQ(store.states().size(), 3u);
  const county_state* c = store.find("01003");
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->total_votes, 0);
  EXPECT_DOUBLE_EQ(c->reporting_percent, 0.0);
  EXPECT_EQ(c->state_fips, "01");
}

TEST_F(CountyStoreTest, ReplayUsesLatestUpdateAtOrBeforeCursor)
{
  store.apply_up_to_cursor(17.0);
  EXPECT_EQ(store.find("01001")->total_votes, 50);
  EXPECT_DOUBLE_EQ(store.find("01001")->source_timestamp, 10.0);
  EXPECT_EQ(store.find("13001")->total_votes, 150);

  store.apply_up_to_cursor(20.0);
  EXPECT_EQ(store.find("01001")->total_votes, 100);
  EXPECT_TRUE(store.find("01001")->is_fully_reported);
}

TEST_F(CountyStoreTest, ReplayIsIdempotent)
{
  store.apply_up_to_cursor(17.0);
  std::map<std::string, county_state> first = store.states();
  store.apply_up_to_cursor(5.0);
  store.apply_up_to_cursor(17.0);
  EXPECT_EQ(first, store.states());
}

TEST_F(CountyStoreTest, RebuildLeavesStoreUntouchedUntilCommit)
{
  store.apply_up_to_cursor(10.0);
  uint64_t revision = store.revision();

  std::map<std::string, county_state> next = store.rebuild(20.0);
  EXPECT_EQ(next.at("01001").total_votes, 100);
  EXPECT_EQ(store.find("01001")->total_votes, 50);
  EXPECT_DOUBLE_EQ(store.cursor(), 10.0);
  EXPECT_EQ(store.revision(), revision);

  store.commit(next, 20.0);
  EXPECT_EQ(store.find("01001")->total_votes, 100);
  EXPECT_DOUBLE_EQ(store.cursor(), 20.0);
  EXPECT_EQ(store.revision(), revision + 1);
}

TEST_F(CountyStoreTest, OverrideSurvivesSeeksBothWays)
{
  store.apply_up_to_cursor(10.0);

  override_fields fields;
  fields.dem_votes = 500;
  fields.has_dem_votes = true;
  fields.gop_votes = 100;
  fields.has_gop_votes = true;
  const county_state& state = store.set_manual_override("1001", fields);
  EXPECT_TRUE(state.is_manual_override);
  EXPECT_EQ(state.total_votes, 600);

  county_state overridden = *store.find("01001");
  store.apply_up_to_cursor(20.0);
  EXPECT_EQ(*store.find("01001"), overridden);
  store.apply_up_to_cursor(0.0);
  EXPECT_EQ(*store.find("01001"), overridden);

  EXPECT_TRUE(store.is_overridden("01001"));
  EXPECT_EQ(store.edited_entities().count("01001"), 1u);
}

TEST_F(CountyStoreTest, OverrideTotalDerivesOther)
{
  store.apply_up_to_cursor(20.0);
  override_fields fields;
  fields.total_votes = 130;
  fields.has_total_votes = true;
  const county_state& state = store.set_manual_override("01001", fields);
  EXPECT_EQ(state.dem_votes, 40);
  EXPECT_EQ(state.gop_votes, 60);
  EXPECT_EQ(state.other_votes, 30);
}

TEST_F(CountyStoreTest, OverrideReportingRecomputesFullyReported)
{
  override_fields fields;
  fields.reporting_percent = 100.0;
  fields.has_reporting_percent = true;
  EXPECT_TRUE(store.set_manual_override("01003", fields).is_fully_reported);
}

TEST_F(CountyStoreTest, InvalidOverridesRejectedWithoutSideEffects)
{
  store.apply_up_to_cursor(20.0);
  std::map<std::string, county_state> before = store.states();

  override_fields negative;
  negative.dem_votes = -1;
  negative.has_dem_votes = true;
  EXPECT_THROW(store.set_manual_override("01001", negative), std::invalid_argument);

  override_fields reporting;
  reporting.reporting_percent = 101.0;
  reporting.has_reporting_percent = true;
  EXPECT_THROW(store.set_manual_override("01001", reporting), std::invalid_argument);

  override_fields small_total;
  small_total.total_votes = 10;
  small_total.has_total_votes = true;
  EXPECT_THROW(store.set_manual_override("01001", small_total), std::invalid_argument);

  override_fields ok;
  ok.dem_votes = 1;
  ok.has_dem_votes = true;
  EXPECT_THROW(store.set_manual_override("99999", ok), std::invalid_argument);
  EXPECT_THROW(store.set_manual_override("x1", ok), std::invalid_argument);

  EXPECT_EQ(before, store.states());
  EXPECT_TRUE(store.edited_entities().empty());
}

TEST_F(CountyStoreTest, ClearReturnsToFrameState)
{
  store.apply_up_to_cursor(20.0);
  county_state derived = *store.find("01001");

  override_fields fields;
  fields.gop_votes = 900;
  fields.has_gop_votes = true;
  store.set_manual_override("01001", fields);
  EXPECT_NE(*store.find("01001"), derived);

  EXPECT_TRUE(store.clear_manual_override("01001"));
  EXPECT_EQ(*store.find("01001"), derived);
  EXPECT_FALSE(store.is_overridden("01001"));
  EXPECT_FALSE(store.clear_manual_override("01001"));
}

TEST_F(CountyStoreTest, UnknownEntityFlaggedOnceItReports)
{
  buffer.ingest(make_frame(12.0, "72001", make_update(5, 5, 10, 100)));

  store.apply_up_to_cursor(11.0);
  EXPECT_EQ(store.find("72001"), nullptr);

  store.apply_up_to_cursor(12.0);
  const county_state* c = store.find("72001");
  ASSERT_NE(c, nullptr);
  EXPECT_TRUE(c->is_unknown_entity);
  EXPECT_EQ(c->state_fips, "");
  EXPECT_EQ(store.unknown_entities().count("72001"), 1u);
}

TEST_F(CountyStoreTest, OverrideAcceptedForCountyKnownOnlyToFrames)
{
  buffer.ingest(make_frame(12.0, "72001", make_update(5, 5, 10, 100)));
  store.apply_up_to_cursor(12.0);

  override_fields fields;
  fields.dem_votes = 9;
  fields.has_dem_votes = true;
  const county_state& state = store.set_manual_override("72001", fields);
  EXPECT_TRUE(state.is_unknown_entity);
  EXPECT_EQ(state.total_votes, 14);
}
