#ifndef PLAYBACK_TEST_HELPERS_HH
#define PLAYBACK_TEST_HELPERS_HH

#include <algorithm>
#include <string>
#include <vector>
#include "baseline.hh"
#include "frame.hh"

inline baseline_entity make_entity(const std::string& fips, int64_t expected, double dem_share = 0.5, double gop_share = 0.5)
{
  baseline_entity entity;
  entity.fips = fips;
  entity.name = "County " + fips;
  entity.expected_total_votes = expected;
  entity.dem_share = dem_share;
  entity.gop_share = gop_share;
  entity.other_share = std::max(0.0, 1.0 - dem_share - gop_share);
  return entity;
}

inline county_update make_update(int64_t dem, int64_t gop, int64_t total, double reporting_percent)
{
  county_update update;
  update.dem_votes = dem;
  update.gop_votes = gop;
  update.total_votes = total;
  update.reporting_percent = reporting_percent;
  return update;
}

inline frame_t make_frame(double timestamp, const std::string& fips, const county_update& update)
{
  frame_t frame;
  frame.timestamp = timestamp;
  frame.updates[fips] = update;
  return frame;
}

// three counties in two states: 01001 and 01003 in Alabama, 13001 in Georgia
inline std::vector<baseline_entity> three_county_baseline()
{
  std::vector<baseline_entity> entities;
  entities.push_back(make_entity("01001", 100, 0.4, 0.6));
  entities.push_back(make_entity("01003", 200, 0.3, 0.7));
  entities.push_back(make_entity("13001", 300, 0.5, 0.5));
  return entities;
}

#endif
