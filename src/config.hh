#ifndef PLAYBACK_CONFIG_HH
#define PLAYBACK_CONFIG_HH

#include <string>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// playback_config
// tunables shared by the engine, the command line tools and the studio
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct playback_config
{
  // newsroom
  double call_threshold_percent = 99.0;
  double call_safety_margin = 0.5;
  double swing_threshold = 10.0;
  double swing_min_reporting = 20.0;
  size_t max_events = 60;

  // aggregation
  double noise_floor_percent = 1.0;
  double fully_reported_percent = 99.9;

  // timeline
  double initial_speed = 1.0;
  int tick_interval_ms = 100;
};

int parse_config_arg(const std::string& arg, playback_config& config);

#endif
