#include "data.hh"
#include <iostream>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// main
// ./playback_loader <baseline_csv> <frames_csv> <duration> [db] [name]
// ./playback_loader baseline_2020.csv night_2024.csv 3600 scenario.duckdb "Election night"
// a duration of 0 uses the last frame timestamp
/////////////////////////////////////////////////////////////////////////////////////////////////////

int main(int argc, char* argv[])
{
  if (argc < 4)
  {
    std::cout << "Usage: " << argv[0] << " <baseline_csv> <frames_csv> <duration> [db] [name]\n";
    return 1;
  }

  std::string baseline_path = argv[1];
  std::string frames_path = argv[2];
  double duration = 0.0;
  try
  {
    duration = std::stod(argv[3]);
  }
  catch (const std::exception&)
  {
    std::cerr << "Invalid duration: " << argv[3] << std::endl;
    return 1;
  }
  std::string db_path = (argc > 4) ? argv[4] : "scenario.duckdb";
  std::string name = (argc > 5) ? argv[5] : frames_path;

  try
  {
    scenario_db_t db(db_path);

    int baseline_count = db.load_baseline_csv(baseline_path);
    if (baseline_count <= 0)
    {
      return 1;
    }

    std::cout << "Baseline counties: " << baseline_count << std::endl;

    int frame_count = db.load_frames_csv(frames_path);
    if (frame_count <= 0)
    {
      return 1;
    }

    std::cout << "Frame updates: " << frame_count << std::endl;

    reporting_config reporting;
    if (db.set_scenario(name, duration, reporting) < 0)
    {
      return 1;
    }

    db.print_summary();
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
