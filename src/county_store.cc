#include "county_store.hh"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

bool operator==(const county_state& a, const county_state& b)
{
  return a.fips == b.fips &&
    a.state_fips == b.state_fips &&
    a.dem_votes == b.dem_votes &&
    a.gop_votes == b.gop_votes &&
    a.other_votes == b.other_votes &&
    a.total_votes == b.total_votes &&
    a.reporting_percent == b.reporting_percent &&
    a.is_fully_reported == b.is_fully_reported &&
    a.source_timestamp == b.source_timestamp &&
    a.is_manual_override == b.is_manual_override &&
    a.is_unknown_entity == b.is_unknown_entity;
}

bool operator!=(const county_state& a, const county_state& b)
{
  return !(a == b);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// county_store_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

county_store_t::county_store_t(const baseline_catalog_t& catalog_, const frame_buffer_t& buffer_, double fully_reported)
  : catalog(catalog_), buffer(buffer_), fully_reported_percent(fully_reported), last_cursor(0.0), store_revision(0)
{
  apply_up_to_cursor(0.0);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// derive
// frame state of one county at the cursor, zero state if it has not reported yet
/////////////////////////////////////////////////////////////////////////////////////////////////////

county_state county_store_t::derive(const std::string& fips, double cursor, bool is_unknown) const
{
  county_state state;
  state.fips = fips;
  state.state_fips = is_unknown ? "" : state_fips_of(fips);
  state.is_unknown_entity = is_unknown;

  double source_timestamp = 0.0;
  const county_update* update = buffer.update_at_or_before(fips, cursor, &source_timestamp);
  if (update)
  {
    state.dem_votes = update->dem_votes;
    state.gop_votes = update->gop_votes;
    state.other_votes = update->other_votes;
    state.total_votes = update->total_votes;
    state.reporting_percent = update->reporting_percent;
    state.is_fully_reported = update->is_fully_reported;
    state.source_timestamp = source_timestamp;
  }
  return state;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// rebuild
// full rebuild from the baseline catalog and the frame buffer. same cursor and same inputs
// always produce the same map. nothing in the store changes until commit
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::map<std::string, county_state> county_store_t::rebuild(double cursor) const
{
  std::map<std::string, county_state> next;

  const std::map<std::string, baseline_entity>& entities = catalog.all();
  for (std::map<std::string, baseline_entity>::const_iterator it = entities.begin(); it != entities.end(); ++it)
  {
    next[it->first] = derive(it->first, cursor, false);
  }

  std::vector<std::string> ids = buffer.entity_ids();
  for (size_t idx = 0; idx < ids.size(); idx++)
  {
    const std::string& fips = ids[idx];
    if (catalog.contains(fips))
    {
      continue;
    }
    if (!buffer.update_at_or_before(fips, cursor, nullptr))
    {
      continue;
    }
    next[fips] = derive(fips, cursor, true);
  }

  for (std::map<std::string, county_state>::const_iterator it = overrides.begin(); it != overrides.end(); ++it)
  {
    next[it->first] = it->second;
  }
  return next;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// commit
// swaps a rebuilt map in, next is left holding the previous state
/////////////////////////////////////////////////////////////////////////////////////////////////////

void county_store_t::commit(std::map<std::string, county_state>& next, double cursor)
{
  for (std::map<std::string, county_state>::const_iterator it = next.begin(); it != next.end(); ++it)
  {
    if (it->second.is_unknown_entity && unknown.insert(it->first).second)
    {
      std::cerr << "unknown entity: " << it->first << " is not in the baseline catalog, counted nationally only" << std::endl;
    }
  }

  current.swap(next);
  last_cursor = cursor;
  store_revision++;
}

void county_store_t::apply_up_to_cursor(double cursor)
{
  std::map<std::string, county_state> next = rebuild(cursor);
  commit(next, cursor);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// set_manual_override
// validates before anything is written, throws std::invalid_argument on rejection
/////////////////////////////////////////////////////////////////////////////////////////////////////

const county_state& county_store_t::set_manual_override(const std::string& id, const override_fields& fields)
{
  std::string fips = normalize_fips(id);
  if (fips.empty())
  {
    throw std::invalid_argument("override: invalid county id [" + id + "]");
  }
  if (!catalog.contains(fips) && !buffer.update_at_or_before(fips, buffer.last_timestamp(), nullptr))
  {
    throw std::invalid_argument("override: unknown county " + fips);
  }
  if ((fields.has_dem_votes && fields.dem_votes < 0) ||
    (fields.has_gop_votes && fields.gop_votes < 0) ||
    (fields.has_other_votes && fields.other_votes < 0) ||
    (fields.has_total_votes && fields.total_votes < 0))
  {
    throw std::invalid_argument("override: negative vote count for " + fips);
  }
  if (fields.has_reporting_percent &&
    (!std::isfinite(fields.reporting_percent) || fields.reporting_percent < 0.0 || fields.reporting_percent > 100.0))
  {
    throw std::invalid_argument("override: reporting percent out of range for " + fips);
  }

  county_state merged;
  std::map<std::string, county_state>::const_iterator existing = current.find(fips);
  if (existing != current.end())
  {
    merged = existing->second;
  }
  else
  {
    merged = derive(fips, last_cursor, !catalog.contains(fips));
  }

  if (fields.has_dem_votes) merged.dem_votes = fields.dem_votes;
  if (fields.has_gop_votes) merged.gop_votes = fields.gop_votes;
  if (fields.has_other_votes) merged.other_votes = fields.other_votes;

  if (fields.has_total_votes)
  {
    if (fields.total_votes < merged.dem_votes + merged.gop_votes)
    {
      throw std::invalid_argument("override: total votes below dem + gop for " + fips);
    }
    if (fields.has_other_votes && merged.dem_votes + merged.gop_votes + merged.other_votes > fields.total_votes)
    {
      throw std::invalid_argument("override: vote components exceed total for " + fips);
    }
    merged.total_votes = fields.total_votes;
    if (!fields.has_other_votes)
    {
      merged.other_votes = fields.total_votes - merged.dem_votes - merged.gop_votes;
    }
  }
  else if (fields.has_dem_votes || fields.has_gop_votes || fields.has_other_votes)
  {
    merged.total_votes = merged.dem_votes + merged.gop_votes + merged.other_votes;
  }

  if (fields.has_reporting_percent)
  {
    merged.reporting_percent = fields.reporting_percent;
  }
  if (fields.has_fully_reported)
  {
    merged.is_fully_reported = fields.is_fully_reported;
  }
  else if (fields.has_reporting_percent)
  {
    merged.is_fully_reported = merged.reporting_percent >= fully_reported_percent;
  }

  merged.source_timestamp = last_cursor;
  merged.is_manual_override = true;

  overrides[fips] = merged;
  edited.insert(fips);
  current[fips] = merged;
  store_revision++;
  return current[fips];
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// clear_manual_override
// the county returns to its frame derived state at the current cursor
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool county_store_t::clear_manual_override(const std::string& id)
{
  std::string fips = normalize_fips(id);
  if (overrides.erase(fips) == 0)
  {
    return false;
  }
  edited.erase(fips);

  bool is_unknown = !catalog.contains(fips);
  if (is_unknown && !buffer.update_at_or_before(fips, last_cursor, nullptr))
  {
    current.erase(fips);
  }
  else
  {
    current[fips] = derive(fips, last_cursor, is_unknown);
  }
  store_revision++;
  return true;
}

bool county_store_t::is_overridden(const std::string& id) const
{
  return overrides.count(normalize_fips(id)) > 0;
}

const county_state* county_store_t::find(const std::string& id) const
{
  std::map<std::string, county_state>::const_iterator it = current.find(normalize_fips(id));
  if (it == current.end())
  {
    return nullptr;
  }
  return &it->second;
}
