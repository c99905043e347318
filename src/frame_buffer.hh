#ifndef PLAYBACK_FRAME_BUFFER_HH
#define PLAYBACK_FRAME_BUFFER_HH

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "frame.hh"

int normalize_update(county_update& update, double fully_reported_percent);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// frame_buffer_t
// timestamp ordered store of incoming frames, tolerant of out of order and duplicate arrival.
// lives for one scenario, a reset disposes it and builds a new one
/////////////////////////////////////////////////////////////////////////////////////////////////////

class frame_buffer_t
{
public:
  frame_buffer_t(double fully_reported_percent = 99.9);

  int ingest(const frame_t& frame);
  const frame_t* frame_at_or_before(double timestamp) const;
  const county_update* update_at_or_before(const std::string& fips, double timestamp, double* source_timestamp) const;

  bool empty() const { return frames.empty(); }
  size_t frame_count() const { return frames.size(); }
  double first_timestamp() const;
  double last_timestamp() const;
  uint64_t revision() const { return ingest_revision; }
  size_t corrected_updates() const { return corrections; }
  size_t rejected_frames() const { return rejections; }
  std::vector<std::string> entity_ids() const;

private:
  double fully_reported_percent;
  std::map<double, frame_t> frames;
  std::unordered_map<std::string, std::map<double, county_update>> by_entity;
  uint64_t ingest_revision;
  size_t corrections;
  size_t rejections;
};

#endif
