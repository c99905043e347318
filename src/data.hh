#ifndef PLAYBACK_DATA_HH
#define PLAYBACK_DATA_HH

#include <string>
#include <vector>
#include <memory>
#include "duckdb.hpp"
#include "engine.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// scenario_db_t
// DuckDB scenario file: baseline catalog, recorded frames and scenario metadata
/////////////////////////////////////////////////////////////////////////////////////////////////////

class scenario_db_t
{
private:
  std::unique_ptr<duckdb::DuckDB> db;
  std::unique_ptr<duckdb::Connection> conn;
  std::string db_path;

  int64_t count_rows(const std::string& sql);
  int import_csv(const std::string& table, const std::string& csv_path);

public:
  scenario_db_t(const std::string& path);

  int load_baseline_csv(const std::string& csv_path);
  int load_frames_csv(const std::string& csv_path);
  int set_scenario(const std::string& name, double duration_seconds, const reporting_config& reporting);

  std::vector<baseline_entity> get_baseline();
  std::vector<frame_t> get_frames();
  double get_duration();
  scenario_bootstrap get_bootstrap();
  void print_summary();
};

#endif
