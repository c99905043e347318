#include "aggregate.hh"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <functional>

namespace
{
  uint64_t mix_hash(uint64_t h, uint64_t v)
  {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
  }

  uint64_t hash_double(double v)
  {
    if (v == 0.0) return 0; // -0.0 and 0.0 hash alike
    uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
  }

  std::string leader_of(int64_t margin_votes)
  {
    if (margin_votes == 0) return "TIE";
    return margin_votes > 0 ? "GOP" : "DEM";
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// safe_percent
// 0 whenever the denominator is not positive, never NaN
/////////////////////////////////////////////////////////////////////////////////////////////////////

double safe_percent(double part, double whole)
{
  if (!(whole > 0.0) || !std::isfinite(part) || !std::isfinite(whole))
  {
    return 0.0;
  }
  double value = part / whole * 100.0;
  return std::isfinite(value) ? value : 0.0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// win_probability_heuristic
// not a statistical model. 50 at zero margin, grows with the margin relative to the expected
// electorate, so outstanding votes dampen it. oriented like the margin: above 50 favours GOP
/////////////////////////////////////////////////////////////////////////////////////////////////////

double win_probability_heuristic(int64_t margin_votes, int64_t counted_votes, int64_t votes_remaining)
{
  const double scaling = 160.0;
  double electorate = static_cast<double>(std::max<int64_t>(0, counted_votes) + std::max<int64_t>(0, votes_remaining));
  double share = static_cast<double>(margin_votes) / std::max(electorate, 1.0);
  double value = 50.0 + share * scaling;
  if (!std::isfinite(value))
  {
    return 50.0;
  }
  return std::min(100.0, std::max(0.0, value));
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fingerprint_counties
/////////////////////////////////////////////////////////////////////////////////////////////////////

uint64_t fingerprint_counties(const std::map<std::string, county_state>& counties, double cursor)
{
  std::hash<std::string> hash_string;
  uint64_t h = 0xC0DEC0DE12345678ull;
  h = mix_hash(h, static_cast<uint64_t>(counties.size()));
  h = mix_hash(h, hash_double(cursor));
  for (std::map<std::string, county_state>::const_iterator it = counties.begin(); it != counties.end(); ++it)
  {
    const county_state& c = it->second;
    h = mix_hash(h, static_cast<uint64_t>(hash_string(c.fips)));
    h = mix_hash(h, static_cast<uint64_t>(c.dem_votes));
    h = mix_hash(h, static_cast<uint64_t>(c.gop_votes));
    h = mix_hash(h, static_cast<uint64_t>(c.other_votes));
    h = mix_hash(h, static_cast<uint64_t>(c.total_votes));
    h = mix_hash(h, hash_double(c.reporting_percent));
    h = mix_hash(h, (c.is_fully_reported ? 1u : 0u) | (c.is_manual_override ? 2u : 0u) | (c.is_unknown_entity ? 4u : 0u));
  }
  return h;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// rollup_counties
/////////////////////////////////////////////////////////////////////////////////////////////////////

aggregate_snapshot rollup_counties(const std::string& scope, const std::vector<const county_state*>& counties,
  const baseline_catalog_t& catalog, double cursor, const playback_config& config)
{
  aggregate_snapshot s;
  s.scope = scope;

  double expected_estimate = 0.0;
  double baseline_expected = 0.0;
  double baseline_margin = 0.0;

  for (size_t idx = 0; idx < counties.size(); idx++)
  {
    const county_state& c = *counties[idx];
    s.dem_votes += c.dem_votes;
    s.gop_votes += c.gop_votes;
    s.other_votes += c.other_votes;
    s.total_votes += c.total_votes;

    if (c.reporting_percent > 0.0)
    {
      s.counties_reporting++;
      if (c.is_fully_reported || c.reporting_percent >= config.fully_reported_percent)
      {
        s.fully_reported++;
      }
      else
      {
        s.in_progress++;
      }
    }
    else
    {
      s.not_started++;
    }

    const baseline_entity* entity = catalog.find(c.fips);

    // below the noise floor extrapolating from the count is meaningless, use the baseline
    if (c.reporting_percent > config.noise_floor_percent)
    {
      expected_estimate += static_cast<double>(c.total_votes) / (c.reporting_percent / 100.0);
    }
    else if (entity)
    {
      expected_estimate += static_cast<double>(std::max(entity->expected_total_votes, c.total_votes));
    }
    else
    {
      expected_estimate += static_cast<double>(c.total_votes);
    }

    if (entity)
    {
      double expected = static_cast<double>(entity->expected_total_votes);
      baseline_expected += expected;
      baseline_margin += expected * (entity->gop_share - entity->dem_share);
    }
  }

  s.total_counties = static_cast<int>(counties.size());
  s.dem_percent = safe_percent(static_cast<double>(s.dem_votes), static_cast<double>(s.total_votes));
  s.gop_percent = safe_percent(static_cast<double>(s.gop_votes), static_cast<double>(s.total_votes));
  s.other_percent = safe_percent(static_cast<double>(s.other_votes), static_cast<double>(s.total_votes));
  s.reporting_percent = safe_percent(s.counties_reporting, s.total_counties);

  s.expected_total_votes = std::max<int64_t>(s.total_votes, static_cast<int64_t>(std::llround(expected_estimate)));
  s.votes_remaining = std::max<int64_t>(0, s.expected_total_votes - s.total_votes);
  s.vote_reporting_percent = s.expected_total_votes > 0
    ? std::min(100.0, safe_percent(static_cast<double>(s.total_votes), static_cast<double>(s.expected_total_votes)))
    : s.reporting_percent;

  s.margin_absolute = s.gop_votes - s.dem_votes;
  s.margin_percent = static_cast<double>(s.margin_absolute) / static_cast<double>(std::max<int64_t>(s.total_votes, 1)) * 100.0;
  s.leader = leader_of(s.margin_absolute);
  s.win_probability = win_probability_heuristic(s.margin_absolute, s.total_votes, s.votes_remaining);

  s.baseline_margin_percent = safe_percent(baseline_margin, baseline_expected);
  s.margin_shift = s.total_votes > 0 ? s.margin_percent - s.baseline_margin_percent : 0.0;

  if (cursor > 0.0)
  {
    double reporting_velocity = s.reporting_percent / std::max(cursor, 1.0);
    if (reporting_velocity > 0.0)
    {
      s.reporting_eta_seconds = std::max(0.0, (100.0 - s.reporting_percent) / reporting_velocity);
      s.has_reporting_eta = true;
    }
    double vote_velocity = s.vote_reporting_percent / std::max(cursor, 1.0);
    if (vote_velocity > 0.0)
    {
      s.vote_eta_seconds = std::max(0.0, (100.0 - s.vote_reporting_percent) / vote_velocity);
      s.has_vote_eta = true;
    }
  }

  return s;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// aggregate_counties
// states come from the baseline catalog, so states with no reporting counties still exist
/////////////////////////////////////////////////////////////////////////////////////////////////////

aggregate_set aggregate_counties(const std::map<std::string, county_state>& counties,
  const baseline_catalog_t& catalog, double cursor, const playback_config& config)
{
  aggregate_set set;
  set.cursor = cursor;
  set.fingerprint = fingerprint_counties(counties, cursor);

  std::vector<const county_state*> all;
  std::vector<const county_state*> unassigned;
  std::map<std::string, std::vector<const county_state*>> by_state;

  std::vector<std::string> state_ids = catalog.state_ids();
  for (size_t idx = 0; idx < state_ids.size(); idx++)
  {
    by_state[state_ids[idx]];
  }

  for (std::map<std::string, county_state>::const_iterator it = counties.begin(); it != counties.end(); ++it)
  {
    const county_state* c = &it->second;
    all.push_back(c);
    if (c->is_unknown_entity || c->state_fips.empty())
    {
      unassigned.push_back(c);
    }
    else
    {
      by_state[c->state_fips].push_back(c);
    }
  }

  set.national = rollup_counties("national", all, catalog, cursor, config);
  set.unassigned = rollup_counties("unassigned", unassigned, catalog, cursor, config);
  for (std::map<std::string, std::vector<const county_state*>>::const_iterator it = by_state.begin(); it != by_state.end(); ++it)
  {
    set.states[it->first] = rollup_counties(it->first, it->second, catalog, cursor, config);
  }
  return set;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// state_leaderboard
// states with counted votes, widest margin first. limit 0 keeps every row
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<aggregate_snapshot> state_leaderboard(const aggregate_set& set, size_t limit)
{
  std::vector<aggregate_snapshot> rows;
  for (std::map<std::string, aggregate_snapshot>::const_iterator it = set.states.begin(); it != set.states.end(); ++it)
  {
    if (it->second.total_votes > 0)
    {
      rows.push_back(it->second);
    }
  }

  std::stable_sort(rows.begin(), rows.end(), [](const aggregate_snapshot& a, const aggregate_snapshot& b)
  {
    return std::fabs(a.margin_percent) > std::fabs(b.margin_percent);
  });

  if (limit > 0 && rows.size() > limit)
  {
    rows.resize(limit);
  }
  return rows;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// outstanding_by_state
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<aggregate_snapshot> outstanding_by_state(const aggregate_set& set, size_t limit)
{
  std::vector<aggregate_snapshot> rows;
  for (std::map<std::string, aggregate_snapshot>::const_iterator it = set.states.begin(); it != set.states.end(); ++it)
  {
    if (it->second.votes_remaining > 0)
    {
      rows.push_back(it->second);
    }
  }

  std::stable_sort(rows.begin(), rows.end(), [](const aggregate_snapshot& a, const aggregate_snapshot& b)
  {
    return a.votes_remaining > b.votes_remaining;
  });

  if (limit > 0 && rows.size() > limit)
  {
    rows.resize(limit);
  }
  return rows;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// find_focus_county
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool find_focus_county(const std::map<std::string, county_state>& counties, const baseline_catalog_t& catalog, county_focus& focus)
{
  bool found = false;
  for (std::map<std::string, county_state>::const_iterator it = counties.begin(); it != counties.end(); ++it)
  {
    const county_state& c = it->second;
    const baseline_entity* entity = catalog.find(c.fips);
    int64_t expected = entity ? entity->expected_total_votes : c.total_votes;
    int64_t remaining = std::max<int64_t>(0, expected - c.total_votes);

    if (!found || remaining > focus.votes_remaining)
    {
      focus.fips = c.fips;
      focus.votes_remaining = remaining;
      focus.reporting_percent = c.reporting_percent;
      focus.margin_percent = static_cast<double>(c.gop_votes - c.dem_votes) / static_cast<double>(std::max<int64_t>(c.total_votes, 1)) * 100.0;
      found = true;
    }
  }
  return found;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// aggregator_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

aggregator_t::aggregator_t(const playback_config& config_)
  : config(config_), has_last(false), computed(0)
{
}

const aggregate_set& aggregator_t::compute(const std::map<std::string, county_state>& counties, const baseline_catalog_t& catalog, double cursor)
{
  uint64_t fingerprint = fingerprint_counties(counties, cursor);
  if (has_last && last.fingerprint == fingerprint)
  {
    return last;
  }

  last = aggregate_counties(counties, catalog, cursor, config);
  has_last = true;
  computed++;
  return last;
}

void aggregator_t::reset()
{
  last = aggregate_set();
  has_last = false;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// margin_history_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

void margin_history_t::record(const aggregate_set& set)
{
  while (!samples.empty() && samples.back().cursor > set.cursor)
  {
    samples.pop_back();
  }

  margin_sample sample;
  sample.cursor = set.cursor;
  sample.margin_absolute = set.national.margin_absolute;
  sample.margin_percent = set.national.margin_percent;
  sample.total_votes = set.national.total_votes;
  sample.vote_reporting_percent = set.national.vote_reporting_percent;
  sample.leader = set.national.leader;

  if (!samples.empty() && samples.back().cursor == set.cursor)
  {
    samples.back() = sample;
  }
  else
  {
    samples.push_back(sample);
  }
}
