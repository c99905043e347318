#include "engine.hh"
#include <cmath>
#include <iostream>
#include <stdexcept>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// playback_engine_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

playback_engine_t::playback_engine_t(const playback_config& config_)
  : config(config_), scheduler(nullptr), aggregator(config_), newsroom(config_),
  transport_connected(false), transport_completed(false), disposed(false)
{
}

playback_engine_t::~playback_engine_t()
{
  dispose();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_scenario
// replaces everything owned by the previous scenario, the old timeline is disposed first
/////////////////////////////////////////////////////////////////////////////////////////////////////

void playback_engine_t::load_scenario(const scenario_bootstrap& bootstrap)
{
  if (disposed)
  {
    throw std::logic_error("engine disposed");
  }
  if (!std::isfinite(bootstrap.total_duration_seconds) || bootstrap.total_duration_seconds < 0.0)
  {
    throw std::invalid_argument("scenario duration must be a non-negative number of seconds");
  }

  if (timeline)
  {
    timeline->dispose();
  }
  timeline.reset();
  store.reset();

  baseline = std::make_unique<baseline_catalog_t>(bootstrap.baseline);
  buffer = std::make_unique<frame_buffer_t>(config.fully_reported_percent);
  store = std::make_unique<county_store_t>(*baseline, *buffer, config.fully_reported_percent);
  aggregator.reset();
  newsroom.reset();
  history.clear();
  current_aggregates = aggregate_set();
  reporting = bootstrap.reporting;
  scenario_name = bootstrap.name;
  transport_connected = false;
  transport_completed = false;
  transport_error.clear();

  timeline = std::make_unique<timeline_controller_t>([this](double cursor) { derive(cursor); });
  timeline->set_speed(config.initial_speed);
  timeline->load(bootstrap.total_duration_seconds);
  if (scheduler)
  {
    timeline->attach(scheduler, [this](double wall_delta) { tick(wall_delta); });
  }

  std::cout << "Scenario [" << scenario_name << "] loaded: " << baseline->size() << " counties, "
    << baseline->state_ids().size() << " states, " << timeline->duration() << "s" << std::endl;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// ingest_frame
// buffers only, the next tick or seek picks it up
/////////////////////////////////////////////////////////////////////////////////////////////////////

int playback_engine_t::ingest_frame(const frame_t& frame)
{
  if (disposed || !buffer)
  {
    return -1;
  }
  return buffer->ingest(frame);
}

void playback_engine_t::on_transport_ready()
{
  if (disposed || !buffer) return;
  transport_connected = true;
}

void playback_engine_t::on_transport_error(const std::string& message)
{
  if (disposed) return;
  transport_connected = false;
  if (!timeline)
  {
    // nothing to freeze yet, kept so the failure still shows up
    std::cerr << "transport: " << message << std::endl;
    transport_error = message;
    return;
  }
  timeline->fail(message);
}

void playback_engine_t::on_transport_completed()
{
  if (disposed || !buffer) return;
  transport_completed = true;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// playback control
/////////////////////////////////////////////////////////////////////////////////////////////////////

void playback_engine_t::attach_scheduler(tick_scheduler_t* source)
{
  if (disposed)
  {
    return;
  }
  scheduler = source;
  if (timeline)
  {
    timeline->attach(scheduler, [this](double wall_delta) { tick(wall_delta); });
  }
}

void playback_engine_t::tick(double wall_delta_seconds)
{
  if (disposed || !timeline)
  {
    return;
  }
  timeline->tick(wall_delta_seconds, buffer->revision());
}

bool playback_engine_t::play()
{
  if (disposed || !timeline || !timeline->play())
  {
    return false;
  }
  newsroom.announce_schedule(reporting, timeline->cursor());
  return true;
}

bool playback_engine_t::pause()
{
  return !disposed && timeline && timeline->pause();
}

bool playback_engine_t::set_speed(double multiplier)
{
  if (disposed || !std::isfinite(multiplier) || multiplier <= 0.0)
  {
    return false;
  }
  config.initial_speed = multiplier;
  return !timeline || timeline->set_speed(multiplier);
}

bool playback_engine_t::seek_to_time(double seconds)
{
  return !disposed && timeline && timeline->seek_to_time(seconds);
}

bool playback_engine_t::seek_to_percent(double percent)
{
  return !disposed && timeline && timeline->seek_to_percent(percent);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// overrides
// visible to the very next aggregation pass, which runs right away
/////////////////////////////////////////////////////////////////////////////////////////////////////

const county_state& playback_engine_t::set_manual_override(const std::string& id, const override_fields& fields)
{
  if (disposed || !store)
  {
    throw std::invalid_argument("override: no scenario loaded");
  }
  const county_state& state = store->set_manual_override(id, fields);
  publish();
  return state;
}

bool playback_engine_t::clear_manual_override(const std::string& id)
{
  if (disposed || !store || !store->clear_manual_override(id))
  {
    return false;
  }
  publish();
  return true;
}

bool playback_engine_t::is_overridden(const std::string& id) const
{
  return store && store->is_overridden(id);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// readers
/////////////////////////////////////////////////////////////////////////////////////////////////////

const std::map<std::string, county_state>& playback_engine_t::get_current_county_state() const
{
  static const std::map<std::string, county_state> empty;
  if (!store)
  {
    return empty;
  }
  return store->states();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// get_aggregate
// "national", "unassigned", a state fips code or a postal code. unknown scopes get a zero rollup
/////////////////////////////////////////////////////////////////////////////////////////////////////

aggregate_snapshot playback_engine_t::get_aggregate(const std::string& scope) const
{
  if (scope == "national")
  {
    return current_aggregates.national;
  }
  if (scope == "unassigned")
  {
    return current_aggregates.unassigned;
  }

  const state_info* info = find_state(scope);
  std::string key = info ? info->fips : scope;
  std::map<std::string, aggregate_snapshot>::const_iterator it = current_aggregates.states.find(key);
  if (it != current_aggregates.states.end())
  {
    return it->second;
  }

  aggregate_snapshot empty;
  empty.scope = key;
  return empty;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// is_playback_ready
// arbitrary seeking needs the whole timeline buffered: the transport said so, or the
// frames already reach the end of the scenario
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool playback_engine_t::is_playback_ready() const
{
  if (disposed || !timeline || !buffer || buffer->empty() || timeline->duration() <= 0.0)
  {
    return false;
  }
  if (timeline->status() == playback_status::idle || timeline->status() == playback_status::error)
  {
    return false;
  }
  return transport_completed || buffer->last_timestamp() >= timeline->duration();
}

playback_status playback_engine_t::status() const
{
  return timeline ? timeline->status() : playback_status::idle;
}

double playback_engine_t::cursor() const
{
  return timeline ? timeline->cursor() : 0.0;
}

double playback_engine_t::speed() const
{
  return timeline ? timeline->speed() : config.initial_speed;
}

double playback_engine_t::duration() const
{
  return timeline ? timeline->duration() : 0.0;
}

double playback_engine_t::progress_percent() const
{
  return timeline ? timeline->progress_percent() : 0.0;
}

std::string playback_engine_t::last_error() const
{
  return timeline ? timeline->last_error() : transport_error;
}

std::set<std::string> playback_engine_t::edited_entities() const
{
  return store ? store->edited_entities() : std::set<std::string>();
}

std::set<std::string> playback_engine_t::unknown_entities() const
{
  return store ? store->unknown_entities() : std::set<std::string>();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// dispose
/////////////////////////////////////////////////////////////////////////////////////////////////////

void playback_engine_t::dispose()
{
  if (disposed)
  {
    return;
  }
  if (timeline)
  {
    timeline->dispose();
  }
  scheduler = nullptr;
  disposed = true;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// derive
// called by the timeline for every cursor change
/////////////////////////////////////////////////////////////////////////////////////////////////////

void playback_engine_t::derive(double cursor)
{
  if (disposed || !store || (timeline && timeline->is_disposed()))
  {
    return;
  }
  std::map<std::string, county_state> next = store->rebuild(cursor);
  if (disposed || (timeline && timeline->is_disposed()))
  {
    return;
  }
  store->commit(next, cursor);
  publish();
}

void playback_engine_t::publish()
{
  current_aggregates = aggregator.compute(store->states(), *baseline, store->cursor());
  history.record(current_aggregates);
  newsroom.process(current_aggregates);
}
