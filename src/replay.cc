#include "data.hh"
#include "format.hh"
#include <iostream>
#include <iomanip>
#include <sstream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// print_states
/////////////////////////////////////////////////////////////////////////////////////////////////////

void print_states(const playback_engine_t& engine)
{
  const aggregate_set& set = engine.aggregates();

  std::cout << "\nResults at " << format_clock(engine.cursor()) << " (" << std::fixed << std::setprecision(1)
    << engine.progress_percent() << "% of timeline):\n";
  std::cout << std::left << std::setw(22) << "State"
    << std::right << std::setw(13) << "DEM"
    << std::setw(13) << "GOP"
    << std::setw(9) << "Margin"
    << std::setw(10) << "Rep%"
    << std::setw(10) << "Vote%"
    << std::setw(7) << "Win%" << "\n";
  std::cout << std::string(84, '-') << "\n";

  std::vector<aggregate_snapshot> rows;
  for (std::map<std::string, aggregate_snapshot>::const_iterator it = set.states.begin(); it != set.states.end(); ++it)
  {
    rows.push_back(it->second);
  }
  if (set.unassigned.total_counties > 0)
  {
    rows.push_back(set.unassigned);
  }
  rows.push_back(set.national);

  for (size_t idx = 0; idx < rows.size(); idx++)
  {
    const aggregate_snapshot& s = rows[idx];
    if (idx + 1 == rows.size())
    {
      std::cout << std::string(84, '-') << "\n";
    }

    std::string label = s.scope == "national" ? "TOTAL" : (s.scope == "unassigned" ? "Unassigned" : state_label(s.scope));
    std::cout << std::left << std::setw(22) << label.substr(0, 21)
      << std::right << std::setw(13) << format_number(s.dem_votes)
      << std::setw(13) << format_number(s.gop_votes)
      << std::setw(9) << format_margin(s.margin_percent)
      << std::setw(10) << std::fixed << std::setprecision(1) << s.reporting_percent
      << std::setw(10) << s.vote_reporting_percent
      << std::setw(7) << std::setprecision(0) << s.win_probability << "\n";
  }

  county_focus focus;
  if (engine.catalog() && find_focus_county(engine.get_current_county_state(), *engine.catalog(), focus))
  {
    const baseline_entity* entity = engine.catalog()->find(focus.fips);
    std::cout << "Most outstanding: " << (entity ? entity->name : focus.fips) << " (" << focus.fips << "), "
      << format_number(focus.votes_remaining) << " votes left" << std::endl;
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// print_events
/////////////////////////////////////////////////////////////////////////////////////////////////////

void print_events(const playback_engine_t& engine, size_t count)
{
  const std::deque<newsroom_event>& events = engine.get_newsroom_events();
  std::cout << "\nNewsroom (" << events.size() << " events):\n";
  for (size_t idx = 0; idx < events.size() && idx < count; idx++)
  {
    const newsroom_event& e = events[idx];
    std::cout << std::left << std::setw(10) << format_clock(e.simulation_time_seconds)
      << std::setw(9) << e.severity << e.headline;
    if (!e.detail.empty())
    {
      std::cout << " - " << e.detail;
    }
    std::cout << "\n";
  }
  std::cout << std::right;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// main
// ./playback_replay <db> [step_seconds] [key=value ...] [seek=<percent> ...]
// ./playback_replay scenario.duckdb 1 speed=60 seek=50 seek=100
// plays the scenario with a fixed step clock; each seek= prints the results at that point,
// without any seek the whole timeline is played and printed at the end
/////////////////////////////////////////////////////////////////////////////////////////////////////

int main(int argc, char* argv[])
{
  if (argc < 2)
  {
    std::cout << "Usage: " << argv[0] << " <db> [step_seconds] [key=value ...] [seek=<percent> ...]\n";
    return 1;
  }

  std::string db_path = argv[1];
  double step = 1.0;
  playback_config config;
  std::vector<double> seeks;

  for (int idx = 2; idx < argc; idx++)
  {
    std::string arg = argv[idx];
    if (arg.compare(0, 5, "seek=") == 0)
    {
      std::stringstream ss(arg.substr(5));
      double percent = 0.0;
      ss >> percent;
      if (ss.fail())
      {
        std::cerr << "Invalid seek: " << arg << std::endl;
        return 1;
      }
      seeks.push_back(percent);
    }
    else if (arg.find('=') != std::string::npos)
    {
      if (parse_config_arg(arg, config) < 0)
      {
        return 1;
      }
    }
    else
    {
      std::stringstream ss(arg);
      ss >> step;
      if (ss.fail() || step <= 0.0)
      {
        std::cerr << "Invalid step: " << arg << std::endl;
        return 1;
      }
    }
  }

  try
  {
    scenario_db_t db(db_path);
    scenario_bootstrap bootstrap = db.get_bootstrap();
    std::vector<frame_t> frames = db.get_frames();

    playback_engine_t engine(config);
    fixed_step_scheduler_t scheduler(step);
    engine.attach_scheduler(&scheduler);
    engine.load_scenario(bootstrap);
    engine.on_transport_ready();

    size_t stored = 0;
    for (size_t idx = 0; idx < frames.size(); idx++)
    {
      int count = engine.ingest_frame(frames[idx]);
      if (count < 0)
      {
        std::cerr << "Frame at " << frames[idx].timestamp << " rejected" << std::endl;
        continue;
      }
      stored += count;
    }
    engine.on_transport_completed();
    std::cout << "Buffered " << frames.size() << " frames, " << stored << " county updates" << std::endl;

    if (!engine.is_playback_ready())
    {
      std::cerr << "Scenario is not ready for playback" << std::endl;
      return 1;
    }

    if (seeks.empty())
    {
      engine.play();
      while (engine.status() == playback_status::running && scheduler.step())
      {
      }
      print_states(engine);
    }
    else
    {
      for (size_t idx = 0; idx < seeks.size(); idx++)
      {
        engine.seek_to_percent(seeks[idx]);
        print_states(engine);
      }
    }

    print_events(engine, config.max_events);

    if (!engine.unknown_entities().empty())
    {
      std::cout << "Unknown counties: " << engine.unknown_entities().size() << std::endl;
    }

    engine.dispose();
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
