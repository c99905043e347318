#ifndef PLAYBACK_COUNTY_STORE_HH
#define PLAYBACK_COUNTY_STORE_HH

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include "baseline.hh"
#include "frame_buffer.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// county_state
// vote state of one county as of the playback cursor
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct county_state
{
  std::string fips;
  std::string state_fips;
  int64_t dem_votes = 0;
  int64_t gop_votes = 0;
  int64_t other_votes = 0;
  int64_t total_votes = 0;
  double reporting_percent = 0.0;
  bool is_fully_reported = false;
  double source_timestamp = 0.0;
  bool is_manual_override = false;
  bool is_unknown_entity = false;
};

bool operator==(const county_state& a, const county_state& b);
bool operator!=(const county_state& a, const county_state& b);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// override_fields
// partial update, only fields with their has_ flag set are merged
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct override_fields
{
  int64_t dem_votes = 0;
  int64_t gop_votes = 0;
  int64_t other_votes = 0;
  int64_t total_votes = 0;
  double reporting_percent = 0.0;
  bool is_fully_reported = false;

  bool has_dem_votes = false;
  bool has_gop_votes = false;
  bool has_other_votes = false;
  bool has_total_votes = false;
  bool has_reporting_percent = false;
  bool has_fully_reported = false;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// county_store_t
// single writer of county state. two entry points mutate it: replay from the frame buffer
// and manual overrides. overrides survive replay until cleared or the scenario is reset
/////////////////////////////////////////////////////////////////////////////////////////////////////

class county_store_t
{
public:
  county_store_t(const baseline_catalog_t& catalog, const frame_buffer_t& buffer, double fully_reported_percent = 99.9);

  void apply_up_to_cursor(double cursor);
  std::map<std::string, county_state> rebuild(double cursor) const;
  void commit(std::map<std::string, county_state>& next, double cursor);
  const county_state& set_manual_override(const std::string& id, const override_fields& fields);
  bool clear_manual_override(const std::string& id);
  bool is_overridden(const std::string& id) const;

  const std::map<std::string, county_state>& states() const { return current; }
  const county_state* find(const std::string& id) const;
  const std::set<std::string>& edited_entities() const { return edited; }
  const std::set<std::string>& unknown_entities() const { return unknown; }
  double cursor() const { return last_cursor; }
  uint64_t revision() const { return store_revision; }

private:
  county_state derive(const std::string& fips, double cursor, bool is_unknown) const;

  const baseline_catalog_t& catalog;
  const frame_buffer_t& buffer;
  double fully_reported_percent;
  std::map<std::string, county_state> current;
  std::map<std::string, county_state> overrides;
  std::set<std::string> edited;
  std::set<std::string> unknown;
  double last_cursor;
  uint64_t store_revision;
};

#endif
