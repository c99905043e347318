#ifndef PLAYBACK_BASELINE_HH
#define PLAYBACK_BASELINE_HH

#include <cstdint>
#include <string>
#include <vector>
#include <map>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// state_info
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct state_info
{
  const char* fips;
  const char* postal;
  const char* name;
};

const std::vector<state_info>& state_table();
const state_info* find_state(const std::string& fips_or_postal);
std::string state_label(const std::string& state_fips);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fips helpers
// normalize_fips returns an empty string when the id cannot be normalized
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string normalize_fips(const std::string& id);
std::string state_fips_of(const std::string& fips);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// baseline_entity
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct baseline_entity
{
  std::string fips;
  std::string state_fips;
  std::string name;
  int64_t expected_total_votes = 0;
  double dem_share = 0.0;
  double gop_share = 0.0;
  double other_share = 0.0;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// baseline_catalog_t
// immutable once built, one entity per county
/////////////////////////////////////////////////////////////////////////////////////////////////////

class baseline_catalog_t
{
public:
  baseline_catalog_t();
  baseline_catalog_t(const std::vector<baseline_entity>& entities);

  const baseline_entity* find(const std::string& fips) const;
  bool contains(const std::string& fips) const;
  size_t size() const { return entities.size(); }
  const std::map<std::string, baseline_entity>& all() const { return entities; }
  std::vector<std::string> state_ids() const;

private:
  std::map<std::string, baseline_entity> entities;
};

#endif
