#include "timeline.hh"
#include <algorithm>
#include <cmath>
#include <iostream>

std::string to_string(playback_status status)
{
  switch (status)
  {
  case playback_status::idle: return "idle";
  case playback_status::ready: return "ready";
  case playback_status::running: return "running";
  case playback_status::paused: return "paused";
  case playback_status::completed: return "completed";
  case playback_status::error: return "error";
  }
  return "unknown";
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fixed_step_scheduler_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

fixed_step_scheduler_t::fixed_step_scheduler_t(double step)
  : step_seconds(step), running(false)
{
}

void fixed_step_scheduler_t::start(std::function<void(double)> on_tick)
{
  callback = on_tick;
  running = true;
}

void fixed_step_scheduler_t::stop()
{
  running = false;
  callback = nullptr;
}

bool fixed_step_scheduler_t::step()
{
  if (!running || !callback)
  {
    return false;
  }
  std::function<void(double)> fn = callback;
  fn(step_seconds);
  return running;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// timeline_controller_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

timeline_controller_t::timeline_controller_t(derive_fn derive_)
  : derive(derive_), scheduler(nullptr), state(playback_status::idle), position(0.0), multiplier(1.0),
  total_duration(0.0), deriving(false), has_pending(false), pending_target(0.0), derived_revision(0), disposed(false)
{
}

timeline_controller_t::~timeline_controller_t()
{
  dispose();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load
// idle -> ready with the cursor at 0
/////////////////////////////////////////////////////////////////////////////////////////////////////

void timeline_controller_t::load(double total_duration_seconds)
{
  if (disposed)
  {
    return;
  }
  total_duration = std::isfinite(total_duration_seconds) ? std::max(0.0, total_duration_seconds) : 0.0;
  state = playback_status::ready;
  error_message.clear();
  derived_revision = 0;
  move_cursor(0.0);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// play
// ready | paused | completed -> running, resuming from completed restarts at 0
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool timeline_controller_t::play()
{
  if (disposed)
  {
    return false;
  }

  switch (state)
  {
  case playback_status::completed:
    move_cursor(0.0);
    state = playback_status::running;
    return true;
  case playback_status::ready:
  case playback_status::paused:
    state = playback_status::running;
    return true;
  default:
    return false;
  }
}

bool timeline_controller_t::pause()
{
  if (disposed || state != playback_status::running)
  {
    return false;
  }
  state = playback_status::paused;
  return true;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// set_speed
// any positive multiplier, picked up by the next tick
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool timeline_controller_t::set_speed(double value)
{
  if (disposed || !std::isfinite(value) || value <= 0.0)
  {
    return false;
  }
  multiplier = value;
  return true;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// seek_to_time
// clamps to [0, duration] and replays from the start. while running this is pause, seek, resume
/////////////////////////////////////////////////////////////////////////////////////////////////////

bool timeline_controller_t::seek_to_time(double seconds)
{
  if (disposed || state == playback_status::idle || state == playback_status::error)
  {
    return false;
  }
  if (std::isnan(seconds))
  {
    return false;
  }

  double target = std::min(total_duration, std::max(0.0, seconds));
  bool resume = state == playback_status::running;

  state = playback_status::paused;
  move_cursor(target);
  if (disposed)
  {
    return false;
  }

  if (resume)
  {
    state = (total_duration > 0.0 && position >= total_duration) ? playback_status::completed : playback_status::running;
  }
  return true;
}

bool timeline_controller_t::seek_to_percent(double percent)
{
  if (total_duration <= 0.0 || std::isnan(percent))
  {
    return false;
  }
  double clamped = std::min(100.0, std::max(0.0, percent));
  return seek_to_time(clamped / 100.0 * total_duration);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// tick
// running: advance by speed x wall delta. other states only replay when new frames arrived
/////////////////////////////////////////////////////////////////////////////////////////////////////

void timeline_controller_t::tick(double wall_delta_seconds, uint64_t buffer_revision)
{
  if (disposed || state == playback_status::idle || state == playback_status::error)
  {
    return;
  }

  if (state == playback_status::running)
  {
    double delta = std::isfinite(wall_delta_seconds) ? std::max(0.0, wall_delta_seconds) : 0.0;
    double target = std::min(total_duration, position + multiplier * delta);
    derived_revision = buffer_revision;
    move_cursor(target);
    if (!disposed && state == playback_status::running && position >= total_duration)
    {
      state = playback_status::completed;
    }
    return;
  }

  if (buffer_revision != derived_revision)
  {
    derived_revision = buffer_revision;
    move_cursor(position);
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fail
// any non idle state -> error, cursor frozen
/////////////////////////////////////////////////////////////////////////////////////////////////////

void timeline_controller_t::fail(const std::string& message)
{
  if (disposed || state == playback_status::idle)
  {
    return;
  }
  state = playback_status::error;
  error_message = message;
  std::cerr << "transport: " << message << std::endl;
}

void timeline_controller_t::attach(tick_scheduler_t* source, std::function<void(double)> on_tick)
{
  if (disposed)
  {
    return;
  }
  if (scheduler)
  {
    scheduler->stop();
  }
  scheduler = source;
  if (scheduler)
  {
    scheduler->start(on_tick);
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// dispose
// stops the scheduler immediately, nothing mutates afterwards
/////////////////////////////////////////////////////////////////////////////////////////////////////

void timeline_controller_t::dispose()
{
  if (disposed)
  {
    return;
  }
  if (scheduler)
  {
    scheduler->stop();
    scheduler = nullptr;
  }
  has_pending = false;
  disposed = true;
}

double timeline_controller_t::progress_percent() const
{
  if (total_duration <= 0.0)
  {
    return 0.0;
  }
  return std::min(100.0, position / total_duration * 100.0);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// move_cursor
// a target requested while a derivation is running is queued, only the latest one survives
/////////////////////////////////////////////////////////////////////////////////////////////////////

void timeline_controller_t::move_cursor(double target)
{
  if (deriving)
  {
    has_pending = true;
    pending_target = target;
    return;
  }

  deriving = true;
  position = target;
  derive(target);

  while (has_pending && !disposed)
  {
    has_pending = false;
    position = pending_target;
    derive(pending_target);
  }
  deriving = false;
}
