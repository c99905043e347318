#ifndef PLAYBACK_NEWSROOM_HH
#define PLAYBACK_NEWSROOM_HH

#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "aggregate.hh"
#include "config.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// reporting_config
// opaque per scenario pacing hints, only announced, never validated
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct reporting_config
{
  bool present = false;
  std::string description;
  std::vector<std::string> reporting_groups;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// newsroom_event
// severity: info, success, warning, danger
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct newsroom_event
{
  std::string id;
  double simulation_time_seconds = 0.0;
  std::string headline;
  std::string detail;
  std::string severity;
  std::string kind;
  std::string state_fips;
  double margin_percent = 0.0;
  double reporting_percent = 0.0;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// newsroom_t
// turns threshold crossings in the rollup stream into events. remembers what it already
// fired so the same snapshot content never produces an event twice
/////////////////////////////////////////////////////////////////////////////////////////////////////

class newsroom_t
{
public:
  newsroom_t(const playback_config& config);

  size_t process(const aggregate_set& set);
  void announce_schedule(const reporting_config& reporting, double simulation_time);
  void reset();

  const std::deque<newsroom_event>& events() const { return feed; }
  std::vector<newsroom_event> recent(size_t count) const;
  bool is_called(const std::string& state_fips) const { return called.count(state_fips) > 0; }

private:
  void emit(newsroom_event event);
  void check_call(const aggregate_snapshot& state, double time);
  void check_flip(const aggregate_snapshot& state, double time, bool at_frontier);
  void check_swing(const aggregate_snapshot& state, double time);
  void check_milestones(const aggregate_snapshot& national, double time);

  playback_config config;
  std::deque<newsroom_event> feed;
  std::set<std::string> called;
  std::set<std::string> swung;
  std::set<int> milestones;
  std::map<std::string, int> last_sign;
  double flip_frontier;
  bool has_frontier;
  bool schedule_announced;
  uint64_t last_fingerprint;
  bool has_fingerprint;
  uint64_t sequence;
};

#endif
