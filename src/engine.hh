#ifndef PLAYBACK_ENGINE_HH
#define PLAYBACK_ENGINE_HH

#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "aggregate.hh"
#include "baseline.hh"
#include "config.hh"
#include "county_store.hh"
#include "frame_buffer.hh"
#include "newsroom.hh"
#include "timeline.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// scenario_bootstrap
// initial payload of a scenario: baseline catalog, duration, pacing metadata
/////////////////////////////////////////////////////////////////////////////////////////////////////

struct scenario_bootstrap
{
  std::string name;
  std::vector<baseline_entity> baseline;
  double total_duration_seconds = 0.0;
  reporting_config reporting;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// playback_engine_t
// frames are buffered on arrival, county state is rebuilt from the buffer on tick or seek,
// rollups and newsroom events follow every rebuild. consumers only read
/////////////////////////////////////////////////////////////////////////////////////////////////////

class playback_engine_t
{
public:
  playback_engine_t(const playback_config& config = playback_config());
  ~playback_engine_t();

  void load_scenario(const scenario_bootstrap& bootstrap);
  int ingest_frame(const frame_t& frame);
  void on_transport_ready();
  void on_transport_error(const std::string& message);
  void on_transport_completed();

  void attach_scheduler(tick_scheduler_t* scheduler);
  void tick(double wall_delta_seconds);
  bool play();
  bool pause();
  bool set_speed(double multiplier);
  bool seek_to_time(double seconds);
  bool seek_to_percent(double percent);

  const county_state& set_manual_override(const std::string& id, const override_fields& fields);
  bool clear_manual_override(const std::string& id);
  bool is_overridden(const std::string& id) const;

  const std::map<std::string, county_state>& get_current_county_state() const;
  aggregate_snapshot get_aggregate(const std::string& scope) const;
  const aggregate_set& aggregates() const { return current_aggregates; }
  const std::deque<newsroom_event>& get_newsroom_events() const { return newsroom.events(); }
  const std::vector<margin_sample>& get_margin_history() const { return history.all(); }
  bool is_playback_ready() const;

  playback_status status() const;
  double cursor() const;
  double speed() const;
  double duration() const;
  double progress_percent() const;
  std::string last_error() const;
  bool is_transport_connected() const { return transport_connected; }
  const std::string& name() const { return scenario_name; }
  const baseline_catalog_t* catalog() const { return baseline.get(); }
  const frame_buffer_t* frames() const { return buffer.get(); }
  std::set<std::string> edited_entities() const;
  std::set<std::string> unknown_entities() const;
  const playback_config& settings() const { return config; }

  void dispose();

private:
  void derive(double cursor);
  void publish();

  playback_config config;
  std::unique_ptr<baseline_catalog_t> baseline;
  std::unique_ptr<frame_buffer_t> buffer;
  std::unique_ptr<county_store_t> store;
  std::unique_ptr<timeline_controller_t> timeline;
  tick_scheduler_t* scheduler;
  aggregator_t aggregator;
  newsroom_t newsroom;
  margin_history_t history;
  aggregate_set current_aggregates;
  reporting_config reporting;
  std::string scenario_name;
  bool transport_connected;
  bool transport_completed;
  std::string transport_error;
  bool disposed;
};

#endif
