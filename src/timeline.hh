#ifndef PLAYBACK_TIMELINE_HH
#define PLAYBACK_TIMELINE_HH

#include <cstdint>
#include <functional>
#include <string>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// playback_status
/////////////////////////////////////////////////////////////////////////////////////////////////////

enum class playback_status
{
  idle,
  ready,
  running,
  paused,
  completed,
  error
};

std::string to_string(playback_status status);

/////////////////////////////////////////////////////////////////////////////////////////////////////
// tick_scheduler_t
// source of wall clock ticks, the callback receives elapsed wall seconds since the last tick
/////////////////////////////////////////////////////////////////////////////////////////////////////

class tick_scheduler_t
{
public:
  virtual ~tick_scheduler_t() {}
  virtual void start(std::function<void(double)> on_tick) = 0;
  virtual void stop() = 0;
  virtual bool active() const = 0;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// fixed_step_scheduler_t
// ticks only when step() is called, used by the headless replay and the tests
/////////////////////////////////////////////////////////////////////////////////////////////////////

class fixed_step_scheduler_t : public tick_scheduler_t
{
public:
  fixed_step_scheduler_t(double step_seconds);

  virtual void start(std::function<void(double)> on_tick) override;
  virtual void stop() override;
  virtual bool active() const override { return running; }
  bool step();

private:
  double step_seconds;
  std::function<void(double)> callback;
  bool running;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// timeline_controller_t
// owns the playback cursor. every cursor change goes through one derivation callback, at most
// one derivation runs at a time and seeks requested meanwhile collapse to the latest target
/////////////////////////////////////////////////////////////////////////////////////////////////////

class timeline_controller_t
{
public:
  typedef std::function<void(double)> derive_fn;

  timeline_controller_t(derive_fn derive);
  ~timeline_controller_t();

  void load(double total_duration_seconds);
  bool play();
  bool pause();
  bool set_speed(double multiplier);
  bool seek_to_time(double seconds);
  bool seek_to_percent(double percent);
  void tick(double wall_delta_seconds, uint64_t buffer_revision);
  void fail(const std::string& message);
  void attach(tick_scheduler_t* scheduler, std::function<void(double)> on_tick);
  void dispose();

  playback_status status() const { return state; }
  double cursor() const { return position; }
  double speed() const { return multiplier; }
  double duration() const { return total_duration; }
  double progress_percent() const;
  bool is_playing() const { return state == playback_status::running; }
  bool is_disposed() const { return disposed; }
  const std::string& last_error() const { return error_message; }

private:
  void move_cursor(double target);

  derive_fn derive;
  tick_scheduler_t* scheduler;
  playback_status state;
  double position;
  double multiplier;
  double total_duration;
  std::string error_message;
  bool deriving;
  bool has_pending;
  double pending_target;
  uint64_t derived_revision;
  bool disposed;
};

#endif
