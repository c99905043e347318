#ifndef PLAYBACK_FORMAT_HH
#define PLAYBACK_FORMAT_HH

#include <cstdint>
#include <string>

std::string format_number(int64_t num);
std::string format_margin(double margin_percent);
std::string format_clock(double seconds);
std::string margin_to_color(double margin);

#endif
