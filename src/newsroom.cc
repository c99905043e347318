#include "newsroom.hh"
#include "baseline.hh"
#include "format.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace
{
  std::string party_name(const std::string& leader)
  {
    if (leader == "GOP") return "Republicans";
    if (leader == "DEM") return "Democrats";
    return "neither party";
  }

  int sign_of(int64_t margin)
  {
    if (margin > 0) return 1;
    if (margin < 0) return -1;
    return 0;
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// newsroom_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

newsroom_t::newsroom_t(const playback_config& config_)
  : config(config_), flip_frontier(0.0), has_frontier(false), schedule_announced(false), last_fingerprint(0), has_fingerprint(false), sequence(0)
{
}

void newsroom_t::reset()
{
  feed.clear();
  called.clear();
  swung.clear();
  milestones.clear();
  last_sign.clear();
  flip_frontier = 0.0;
  has_frontier = false;
  schedule_announced = false;
  last_fingerprint = 0;
  has_fingerprint = false;
  sequence = 0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// process
// returns the number of new events
/////////////////////////////////////////////////////////////////////////////////////////////////////

size_t newsroom_t::process(const aggregate_set& set)
{
  if (has_fingerprint && set.fingerprint == last_fingerprint)
  {
    return 0;
  }
  last_fingerprint = set.fingerprint;
  has_fingerprint = true;

  // lead changes are only tracked at or past the furthest cursor seen, so scrubbing
  // back over ground already played never re-announces them
  bool at_frontier = !has_frontier || set.cursor >= flip_frontier;
  if (at_frontier)
  {
    flip_frontier = set.cursor;
    has_frontier = true;
  }

  uint64_t before = sequence;
  for (std::map<std::string, aggregate_snapshot>::const_iterator it = set.states.begin(); it != set.states.end(); ++it)
  {
    check_flip(it->second, set.cursor, at_frontier);
    check_call(it->second, set.cursor);
    check_swing(it->second, set.cursor);
  }
  check_milestones(set.national, set.cursor);
  return static_cast<size_t>(sequence - before);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// check_call
/////////////////////////////////////////////////////////////////////////////////////////////////////

void newsroom_t::check_call(const aggregate_snapshot& state, double time)
{
  if (called.count(state.scope))
  {
    return;
  }
  if (state.total_counties == 0 || state.reporting_percent < config.call_threshold_percent)
  {
    return;
  }
  if (std::fabs(state.margin_percent) <= config.call_safety_margin)
  {
    return;
  }

  called.insert(state.scope);

  newsroom_event event;
  event.id = "call-" + state.scope;
  event.simulation_time_seconds = time;
  event.headline = state_label(state.scope) + " called for the " + party_name(state.leader);
  event.detail = format_margin(state.margin_percent) + " with " + std::to_string(state.counties_reporting) + " of " +
    std::to_string(state.total_counties) + " counties reporting";
  event.severity = "success";
  event.kind = "call";
  event.state_fips = state.scope;
  event.margin_percent = state.margin_percent;
  event.reporting_percent = state.reporting_percent;
  emit(event);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// check_flip
// ties do not count as a lead, a flip is DEM -> GOP or GOP -> DEM
// last_sign holds the leader at the frontier and is left alone behind it
/////////////////////////////////////////////////////////////////////////////////////////////////////

void newsroom_t::check_flip(const aggregate_snapshot& state, double time, bool at_frontier)
{
  int sign = sign_of(state.margin_absolute);
  if (sign == 0 || !at_frontier)
  {
    return;
  }

  std::map<std::string, int>::iterator it = last_sign.find(state.scope);
  if (it == last_sign.end())
  {
    last_sign[state.scope] = sign;
    return;
  }
  if (it->second == sign)
  {
    return;
  }
  it->second = sign;

  newsroom_event event;
  event.id = "flip-" + state.scope + "-" + std::to_string(sequence + 1);
  event.simulation_time_seconds = time;
  event.headline = "Lead change in " + state_label(state.scope);
  event.detail = party_name(state.leader) + " now ahead, " + format_margin(state.margin_percent);
  event.severity = "warning";
  event.kind = "flip";
  event.state_fips = state.scope;
  event.margin_percent = state.margin_percent;
  event.reporting_percent = state.reporting_percent;
  emit(event);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// check_swing
// shift against the baseline margin, once per state
/////////////////////////////////////////////////////////////////////////////////////////////////////

void newsroom_t::check_swing(const aggregate_snapshot& state, double time)
{
  if (swung.count(state.scope) || state.total_votes == 0)
  {
    return;
  }
  if (state.vote_reporting_percent < config.swing_min_reporting || std::fabs(state.margin_shift) < config.swing_threshold)
  {
    return;
  }

  swung.insert(state.scope);

  std::stringstream ss;
  ss << std::fixed << std::setprecision(1) << std::fabs(state.margin_shift);

  newsroom_event event;
  event.id = "swing-" + state.scope;
  event.simulation_time_seconds = time;
  event.headline = "Big swing " + std::string(state.margin_shift > 0.0 ? "toward Republicans" : "toward Democrats") +
    " in " + state_label(state.scope);
  event.detail = ss.str() + " points from baseline, now " + format_margin(state.margin_percent);
  event.severity = "info";
  event.kind = "swing";
  event.state_fips = state.scope;
  event.margin_percent = state.margin_percent;
  event.reporting_percent = state.reporting_percent;
  emit(event);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// check_milestones
/////////////////////////////////////////////////////////////////////////////////////////////////////

void newsroom_t::check_milestones(const aggregate_snapshot& national, double time)
{
  static const int marks[] = { 25, 50, 75, 100 };
  for (size_t idx = 0; idx < sizeof(marks) / sizeof(marks[0]); idx++)
  {
    int mark = marks[idx];
    if (milestones.count(mark) || national.vote_reporting_percent < mark || national.expected_total_votes == 0)
    {
      continue;
    }
    milestones.insert(mark);

    newsroom_event event;
    event.id = "milestone-" + std::to_string(mark);
    event.simulation_time_seconds = time;
    event.headline = std::to_string(mark) + "% of the expected vote counted";
    event.detail = "National margin " + format_margin(national.margin_percent);
    event.severity = "info";
    event.kind = "milestone";
    event.margin_percent = national.margin_percent;
    event.reporting_percent = national.vote_reporting_percent;
    emit(event);
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// announce_schedule
/////////////////////////////////////////////////////////////////////////////////////////////////////

void newsroom_t::announce_schedule(const reporting_config& reporting, double simulation_time)
{
  if (schedule_announced || !reporting.present)
  {
    return;
  }
  schedule_announced = true;

  std::string order;
  for (size_t idx = 0; idx < reporting.reporting_groups.size(); idx++)
  {
    if (idx > 0) order += ", ";
    order += reporting.reporting_groups[idx];
  }

  newsroom_event event;
  event.id = "schedule";
  event.simulation_time_seconds = simulation_time;
  event.headline = reporting.description.empty() ? "Polls are closing" : reporting.description;
  event.detail = order.empty() ? "Reporting order not published" : "Expected reporting order: " + order;
  event.severity = "info";
  event.kind = "schedule";
  emit(event);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// emit
// newest first, capped
/////////////////////////////////////////////////////////////////////////////////////////////////////

void newsroom_t::emit(newsroom_event event)
{
  sequence++;
  feed.push_front(event);
  while (feed.size() > config.max_events)
  {
    feed.pop_back();
  }
}

std::vector<newsroom_event> newsroom_t::recent(size_t count) const
{
  size_t n = std::min(count, feed.size());
  return std::vector<newsroom_event>(feed.begin(), feed.begin() + static_cast<std::ptrdiff_t>(n));
}
