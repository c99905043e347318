#include "format.hh"
#include <cmath>
#include <iomanip>
#include <sstream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// format_number
// thousands separators, negative numbers keep their sign in front
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string format_number(int64_t num)
{
  std::string s = std::to_string(num);
  int first_digit = (num < 0) ? 1 : 0;
  int insert_pos = static_cast<int>(s.length()) - 3;
  while (insert_pos > first_digit)
  {
    s.insert(insert_pos, ",");
    insert_pos -= 3;
  }
  return s;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// format_margin
// R+4.2, D+0.8, even
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string format_margin(double margin_percent)
{
  std::stringstream ss;
  ss << std::fixed << std::setprecision(1);
  if (margin_percent >= 0.05) ss << "R+" << margin_percent;
  else if (margin_percent <= -0.05) ss << "D+" << -margin_percent;
  else ss << "even";
  return ss.str();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// format_clock
// h:mm:ss of simulation time
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string format_clock(double seconds)
{
  int64_t total = std::isfinite(seconds) && seconds > 0.0 ? static_cast<int64_t>(seconds) : 0;
  std::stringstream ss;
  ss << total / 3600 << ":" << std::setw(2) << std::setfill('0') << (total / 60) % 60
    << ":" << std::setw(2) << std::setfill('0') << total % 60;
  return ss.str();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// margin_to_color
// margin as a fraction: positive = gop (red), negative = dem (blue)
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string margin_to_color(double margin)
{
  if (margin > 0.3334) return "#B82D35";      // strong gop
  if (margin > 0.1667) return "#E48268";      // lean gop
  if (margin > 0.0)    return "#FACCB4";      // slight gop
  if (margin == 0.0)   return "#DDDDDD";      // tie or nothing counted
  if (margin > -0.1667) return "#BFDCEB";     // slight dem
  if (margin > -0.3334) return "#6BACD0";     // lean dem
  return "#2A71AE";                           // strong dem
}
