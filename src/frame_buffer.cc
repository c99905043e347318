#include "frame_buffer.hh"
#include "baseline.hh"
#include <algorithm>
#include <cmath>
#include <iostream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// normalize_update
// enforces total >= dem + gop and derives other votes when not supplied.
// returns the number of corrections made
/////////////////////////////////////////////////////////////////////////////////////////////////////

int normalize_update(county_update& update, double fully_reported_percent)
{
  int corrected = 0;

  if (update.dem_votes < 0 || update.gop_votes < 0 || update.other_votes < 0 || update.total_votes < 0)
  {
    update.dem_votes = std::max<int64_t>(0, update.dem_votes);
    update.gop_votes = std::max<int64_t>(0, update.gop_votes);
    update.other_votes = std::max<int64_t>(0, update.other_votes);
    update.total_votes = std::max<int64_t>(0, update.total_votes);
    corrected++;
  }

  int64_t parts = update.dem_votes + update.gop_votes;
  if (parts > update.total_votes)
  {
    update.other_votes = 0;
    update.total_votes = parts;
    corrected++;
  }
  else if (!update.has_other_votes)
  {
    update.other_votes = update.total_votes - parts;
  }
  else if (parts + update.other_votes > update.total_votes)
  {
    update.total_votes = parts + update.other_votes;
    corrected++;
  }
  update.has_other_votes = true;

  if (!std::isfinite(update.reporting_percent))
  {
    update.reporting_percent = 0.0;
    corrected++;
  }
  else if (update.reporting_percent < 0.0 || update.reporting_percent > 100.0)
  {
    update.reporting_percent = std::min(100.0, std::max(0.0, update.reporting_percent));
    corrected++;
  }

  if (update.reporting_percent >= fully_reported_percent)
  {
    update.is_fully_reported = true;
  }

  return corrected;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// frame_buffer_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

frame_buffer_t::frame_buffer_t(double fully_reported)
  : fully_reported_percent(fully_reported), ingest_revision(0), corrections(0), rejections(0)
{
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// ingest
// same timestamp and same county: the later ingested update replaces the earlier one.
// returns the number of updates stored, -1 if the frame was rejected
/////////////////////////////////////////////////////////////////////////////////////////////////////

int frame_buffer_t::ingest(const frame_t& frame)
{
  if (!std::isfinite(frame.timestamp))
  {
    std::cerr << "transport: rejecting frame with non-finite timestamp" << std::endl;
    rejections++;
    return -1;
  }

  frame_t& slot = frames[frame.timestamp];
  slot.timestamp = frame.timestamp;

  int stored = 0;
  for (std::map<std::string, county_update>::const_iterator it = frame.updates.begin(); it != frame.updates.end(); ++it)
  {
    std::string fips = normalize_fips(it->first);
    if (fips.empty())
    {
      std::cerr << "transport: skipping update with invalid id [" << it->first << "] at t=" << frame.timestamp << std::endl;
      continue;
    }

    county_update update = it->second;
    int corrected = normalize_update(update, fully_reported_percent);
    if (corrected > 0)
    {
      std::cerr << "invariant: corrected update for " << fips << " at t=" << frame.timestamp
        << " (total " << update.total_votes << ")" << std::endl;
      corrections++;
    }

    slot.updates[fips] = update;
    by_entity[fips][frame.timestamp] = update;
    stored++;
  }

  ingest_revision++;
  return stored;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// frame_at_or_before
// nullptr before the first frame, never an error
/////////////////////////////////////////////////////////////////////////////////////////////////////

const frame_t* frame_buffer_t::frame_at_or_before(double timestamp) const
{
  std::map<double, frame_t>::const_iterator it = frames.upper_bound(timestamp);
  if (it == frames.begin())
  {
    return nullptr;
  }
  --it;
  return &it->second;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// update_at_or_before
// latest update for one county, counties report sparsely so this is the per entity view
/////////////////////////////////////////////////////////////////////////////////////////////////////

const county_update* frame_buffer_t::update_at_or_before(const std::string& fips, double timestamp, double* source_timestamp) const
{
  std::unordered_map<std::string, std::map<double, county_update>>::const_iterator entity = by_entity.find(fips);
  if (entity == by_entity.end())
  {
    return nullptr;
  }

  std::map<double, county_update>::const_iterator it = entity->second.upper_bound(timestamp);
  if (it == entity->second.begin())
  {
    return nullptr;
  }
  --it;
  if (source_timestamp)
  {
    *source_timestamp = it->first;
  }
  return &it->second;
}

double frame_buffer_t::first_timestamp() const
{
  if (frames.empty()) return 0.0;
  return frames.begin()->first;
}

double frame_buffer_t::last_timestamp() const
{
  if (frames.empty()) return 0.0;
  return frames.rbegin()->first;
}

std::vector<std::string> frame_buffer_t::entity_ids() const
{
  std::vector<std::string> ids;
  ids.reserve(by_entity.size());
  for (std::unordered_map<std::string, std::map<double, county_update>>::const_iterator it = by_entity.begin(); it != by_entity.end(); ++it)
  {
    ids.push_back(it->first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}
