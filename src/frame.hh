#ifndef PLAYBACK_FRAME_HH
#define PLAYBACK_FRAME_HH

#include <cstdint>
#include <string>
#include <map>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// county_update
// absolute snapshot of one county inside a frame
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct county_update
{
  int64_t dem_votes = 0;
  int64_t gop_votes = 0;
  int64_t other_votes = 0;
  int64_t total_votes = 0;
  double reporting_percent = 0.0;
  bool is_fully_reported = false;
  bool has_other_votes = false;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// frame_t
// timestamp is simulated seconds since scenario start
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct frame_t
{
  double timestamp = 0.0;
  std::map<std::string, county_update> updates;
};

#endif
