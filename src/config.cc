#include "config.hh"
#include <iostream>
#include <sstream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// parse_config_arg
// key=value, returns 0 on success, -1 for unknown keys or bad values
/////////////////////////////////////////////////////////////////////////////////////////////////////

int parse_config_arg(const std::string& arg, playback_config& config)
{
  size_t pos = arg.find('=');
  if (pos == std::string::npos || pos == 0)
  {
    std::cerr << "config: expected key=value, got [" << arg << "]" << std::endl;
    return -1;
  }

  std::string key = arg.substr(0, pos);
  std::stringstream ss(arg.substr(pos + 1));
  double value = 0.0;
  ss >> value;
  if (ss.fail() || !ss.eof())
  {
    std::cerr << "config: bad value for " << key << std::endl;
    return -1;
  }

  if (key == "call_threshold") config.call_threshold_percent = value;
  else if (key == "call_margin") config.call_safety_margin = value;
  else if (key == "swing_threshold") config.swing_threshold = value;
  else if (key == "swing_min_reporting") config.swing_min_reporting = value;
  else if (key == "max_events" && value >= 1) config.max_events = static_cast<size_t>(value);
  else if (key == "noise_floor") config.noise_floor_percent = value;
  else if (key == "fully_reported") config.fully_reported_percent = value;
  else if (key == "speed" && value > 0) config.initial_speed = value;
  else if (key == "tick_ms" && value >= 1) config.tick_interval_ms = static_cast<int>(value);
  else
  {
    std::cerr << "config: unknown or out of range setting " << key << std::endl;
    return -1;
  }

  return 0;
}
