#ifndef PLAYBACK_AGGREGATE_HH
#define PLAYBACK_AGGREGATE_HH

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "baseline.hh"
#include "config.hh"
#include "county_store.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// aggregate_snapshot
// rollup of a group of counties. margins follow one sign convention at every level:
// gop - dem, positive = Republican leaning, negative = Democratic leaning, 0 = tie
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct aggregate_snapshot
{
  std::string scope;
  int64_t dem_votes = 0;
  int64_t gop_votes = 0;
  int64_t other_votes = 0;
  int64_t total_votes = 0;
  double dem_percent = 0.0;
  double gop_percent = 0.0;
  double other_percent = 0.0;
  double reporting_percent = 0.0;
  double vote_reporting_percent = 0.0;
  int64_t expected_total_votes = 0;
  int64_t votes_remaining = 0;
  int64_t margin_absolute = 0;
  double margin_percent = 0.0;
  std::string leader = "TIE";
  double win_probability = 50.0;
  int counties_reporting = 0;
  int total_counties = 0;
  int fully_reported = 0;
  int in_progress = 0;
  int not_started = 0;
  double baseline_margin_percent = 0.0;
  double margin_shift = 0.0;
  double reporting_eta_seconds = 0.0;
  double vote_eta_seconds = 0.0;
  bool has_reporting_eta = false;
  bool has_vote_eta = false;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// aggregate_set
// national, per state and unassigned (counties missing from the baseline catalog).
// sum of states + unassigned == national
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct aggregate_set
{
  double cursor = 0.0;
  uint64_t fingerprint = 0;
  aggregate_snapshot national;
  aggregate_snapshot unassigned;
  std::map<std::string, aggregate_snapshot> states;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// county_focus
// county with the most votes still outstanding
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct county_focus
{
  std::string fips;
  int64_t votes_remaining = 0;
  double reporting_percent = 0.0;
  double margin_percent = 0.0;
};

double safe_percent(double part, double whole);
double win_probability_heuristic(int64_t margin_votes, int64_t counted_votes, int64_t votes_remaining);
uint64_t fingerprint_counties(const std::map<std::string, county_state>& counties, double cursor);

aggregate_snapshot rollup_counties(const std::string& scope, const std::vector<const county_state*>& counties,
  const baseline_catalog_t& catalog, double cursor, const playback_config& config);
aggregate_set aggregate_counties(const std::map<std::string, county_state>& counties,
  const baseline_catalog_t& catalog, double cursor, const playback_config& config);

std::vector<aggregate_snapshot> state_leaderboard(const aggregate_set& set, size_t limit);
std::vector<aggregate_snapshot> outstanding_by_state(const aggregate_set& set, size_t limit);
bool find_focus_county(const std::map<std::string, county_state>& counties, const baseline_catalog_t& catalog, county_focus& focus);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// aggregator_t
// recomputes only when the content fingerprint changes
/////////////////////////////////////////////////////////////////////////////////////////////////////

class aggregator_t
{
public:
  aggregator_t(const playback_config& config);

  const aggregate_set& compute(const std::map<std::string, county_state>& counties, const baseline_catalog_t& catalog, double cursor);
  size_t computations() const { return computed; }
  void reset();

private:
  playback_config config;
  aggregate_set last;
  bool has_last;
  size_t computed;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// margin_history_t
// national margin sampled once per distinct cursor, trimmed when playback seeks backward
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct margin_sample
{
  double cursor = 0.0;
  int64_t margin_absolute = 0;
  double margin_percent = 0.0;
  int64_t total_votes = 0;
  double vote_reporting_percent = 0.0;
  std::string leader;
};

class margin_history_t
{
public:
  void record(const aggregate_set& set);
  void clear() { samples.clear(); }
  const std::vector<margin_sample>& all() const { return samples; }

private:
  std::vector<margin_sample> samples;
};

#endif
