#include "data.hh"
#include <algorithm>
#include <iostream>
#include <iomanip>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// scenario_db_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

scenario_db_t::scenario_db_t(const std::string& path) : db_path(path)
{
  duckdb::DBConfig config;
  db = std::make_unique<duckdb::DuckDB>(db_path, &config);
  conn = std::make_unique<duckdb::Connection>(*db);

  conn->Query(R"(
    CREATE TABLE IF NOT EXISTS baseline (
      fips VARCHAR PRIMARY KEY,
      county_name VARCHAR,
      state_fips VARCHAR NOT NULL,
      expected_total BIGINT NOT NULL,
      dem_share DOUBLE NOT NULL,
      gop_share DOUBLE NOT NULL,
      other_share DOUBLE NOT NULL
    );
  )");

  conn->Query(R"(
    CREATE TABLE IF NOT EXISTS frames (
      seq BIGINT NOT NULL,
      ts DOUBLE NOT NULL,
      fips VARCHAR NOT NULL,
      dem_votes BIGINT NOT NULL,
      gop_votes BIGINT NOT NULL,
      other_votes BIGINT,
      total_votes BIGINT NOT NULL,
      reporting_percent DOUBLE NOT NULL,
      fully_reported BOOLEAN NOT NULL
    );
  )");

  conn->Query(R"(
    CREATE TABLE IF NOT EXISTS scenario (
      name VARCHAR,
      duration_seconds DOUBLE,
      description VARCHAR,
      reporting_groups VARCHAR
    );
  )");

  conn->Query(R"(
    CREATE TABLE IF NOT EXISTS state_names (
      fips VARCHAR PRIMARY KEY,
      postal VARCHAR NOT NULL,
      name VARCHAR NOT NULL
    );
  )");

  const std::vector<state_info>& states = state_table();
  for (size_t idx = 0; idx < states.size(); idx++)
  {
    conn->Query("INSERT OR IGNORE INTO state_names VALUES ('" + std::string(states[idx].fips) + "', '" +
      std::string(states[idx].postal) + "', '" + std::string(states[idx].name) + "');");
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// count_rows
/////////////////////////////////////////////////////////////////////////////////////////////////////

int64_t scenario_db_t::count_rows(const std::string& sql)
{
  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(sql);
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return -1;
  }

  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  if (chunk && chunk->size() > 0)
  {
    return chunk->GetValue(0, 0).GetValue<int64_t>();
  }
  return 0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// import_csv
// raw copy of a csv into a temp table, rowid is the file row
/////////////////////////////////////////////////////////////////////////////////////////////////////

int scenario_db_t::import_csv(const std::string& table, const std::string& csv_path)
{
  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(
    "CREATE OR REPLACE TEMP TABLE " + table + " AS SELECT * FROM read_csv('" + csv_path + "', header=true)");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return -1;
  }
  return 0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_baseline_csv
// columns: fips, county, dem_votes, gop_votes (or rep_votes), total_votes
// shares come from the baseline vote counts, the expected total is total_votes
/////////////////////////////////////////////////////////////////////////////////////////////////////

int scenario_db_t::load_baseline_csv(const std::string& csv_path)
{
  if (import_csv("baseline_import", csv_path) < 0)
  {
    return -1;
  }

  std::unique_ptr<duckdb::MaterializedQueryResult> probe = conn->Query(
    "SELECT column_name FROM (DESCRIBE baseline_import) WHERE column_name IN ('gop_votes', 'rep_votes') ORDER BY column_name");
  if (probe->HasError())
  {
    std::cerr << probe->GetError() << std::endl;
    return -1;
  }

  std::string gop_column;
  duckdb::unique_ptr<duckdb::DataChunk> probe_chunk = probe->Fetch();
  if (probe_chunk && probe_chunk->size() > 0)
  {
    gop_column = probe_chunk->GetValue(0, 0).ToString();
  }
  if (gop_column.empty())
  {
    std::cerr << "Missing required column: one of gop_votes, rep_votes" << std::endl;
    return -1;
  }

  // a county listed twice keeps its last row
  int64_t duplicates = count_rows(R"(
    SELECT COUNT(*) - COUNT(DISTINCT LPAD(CAST(fips AS VARCHAR), 5, '0'))
    FROM baseline_import
    WHERE LENGTH(CAST(fips AS VARCHAR)) BETWEEN 1 AND 5
  )");
  if (duplicates < 0)
  {
    return -1;
  }
  if (duplicates > 0)
  {
    std::cerr << "baseline: " << duplicates << " duplicate county rows, last row wins" << std::endl;
  }

  conn->Query("DELETE FROM baseline;");

  std::string sql = R"(
    INSERT INTO baseline (fips, county_name, state_fips, expected_total, dem_share, gop_share, other_share)
    SELECT
      padded as fips,
      CAST(county AS VARCHAR) as county_name,
      SUBSTR(padded, 1, 2) as state_fips,
      GREATEST(CAST(total_votes AS BIGINT), 0) as expected_total,
      CASE WHEN total_votes > 0 THEN CAST(dem_votes AS DOUBLE) / total_votes ELSE 0 END,
      CASE WHEN total_votes > 0 THEN CAST()" + gop_column + R"( AS DOUBLE) / total_votes ELSE 0 END,
      CASE WHEN total_votes > 0 THEN GREATEST(total_votes - dem_votes - )" + gop_column + R"(, 0) / CAST(total_votes AS DOUBLE) ELSE 0 END
    FROM (
      SELECT *, LPAD(CAST(fips AS VARCHAR), 5, '0') as padded, rowid as file_row
      FROM baseline_import
      WHERE LENGTH(CAST(fips AS VARCHAR)) BETWEEN 1 AND 5
    )
    QUALIFY ROW_NUMBER() OVER (PARTITION BY padded ORDER BY file_row DESC) = 1;
  )";

  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(sql);
  conn->Query("DROP TABLE IF EXISTS baseline_import;");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return -1;
  }

  int64_t count = count_rows("SELECT COUNT(*) FROM baseline");
  if (count >= 0)
  {
    std::cout << "Loaded " << count << " baseline counties" << std::endl;
  }
  return static_cast<int>(count);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// load_frames_csv
// columns: timestamp, fips, dem_votes, gop_votes, total_votes, reporting_percent, [other_votes]
// file row order is the ingestion order, kept as seq
/////////////////////////////////////////////////////////////////////////////////////////////////////

int scenario_db_t::load_frames_csv(const std::string& csv_path)
{
  if (import_csv("frames_import", csv_path) < 0)
  {
    return -1;
  }

  int64_t has_other = count_rows("SELECT COUNT(*) FROM (DESCRIBE frames_import) WHERE column_name = 'other_votes'");
  if (has_other < 0)
  {
    return -1;
  }

  conn->Query("DELETE FROM frames;");

  std::string other_expr = has_other > 0 ? "CAST(other_votes AS BIGINT)" : "CAST(NULL AS BIGINT)";
  std::string sql = R"(
    INSERT INTO frames (seq, ts, fips, dem_votes, gop_votes, other_votes, total_votes, reporting_percent, fully_reported)
    SELECT
      rowid + 1 as seq,
      CAST(timestamp AS DOUBLE) as ts,
      LPAD(CAST(fips AS VARCHAR), 5, '0') as fips,
      CAST(dem_votes AS BIGINT),
      CAST(gop_votes AS BIGINT),
      )" + other_expr + R"(,
      CAST(total_votes AS BIGINT),
      CAST(reporting_percent AS DOUBLE),
      CAST(reporting_percent AS DOUBLE) >= 99.9
    FROM frames_import
    WHERE LENGTH(CAST(fips AS VARCHAR)) BETWEEN 1 AND 5
  )";

  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(sql);
  conn->Query("DROP TABLE IF EXISTS frames_import;");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return -1;
  }

  int64_t count = count_rows("SELECT COUNT(*) FROM frames");
  if (count >= 0)
  {
    std::cout << "Loaded " << count << " frame updates" << std::endl;
  }
  return static_cast<int>(count);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// set_scenario
// a non positive duration falls back to the last frame timestamp
/////////////////////////////////////////////////////////////////////////////////////////////////////

int scenario_db_t::set_scenario(const std::string& name, double duration_seconds, const reporting_config& reporting)
{
  if (duration_seconds <= 0.0)
  {
    int64_t last = count_rows("SELECT CAST(CEIL(COALESCE(MAX(ts), 0)) AS BIGINT) FROM frames");
    if (last < 0)
    {
      return -1;
    }
    duration_seconds = static_cast<double>(last);
  }

  std::string groups;
  for (size_t idx = 0; idx < reporting.reporting_groups.size(); idx++)
  {
    if (idx > 0) groups += "|";
    groups += reporting.reporting_groups[idx];
  }

  conn->Query("DELETE FROM scenario;");

  std::unique_ptr<duckdb::PreparedStatement> stmt = conn->Prepare("INSERT INTO scenario VALUES ($1, $2, $3, $4)");
  if (stmt->HasError())
  {
    std::cerr << stmt->GetError() << std::endl;
    return -1;
  }

  duckdb::Value description_value = reporting.present ? duckdb::Value(reporting.description) : duckdb::Value();
  duckdb::Value groups_value = reporting.present ? duckdb::Value(groups) : duckdb::Value();
  std::unique_ptr<duckdb::QueryResult> result = stmt->Execute(name, duration_seconds, description_value, groups_value);
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return -1;
  }

  std::cout << "Scenario [" << name << "] duration " << duration_seconds << "s" << std::endl;
  return 0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// get_baseline
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<baseline_entity> scenario_db_t::get_baseline()
{
  std::vector<baseline_entity> records;

  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(R"(
    SELECT fips, COALESCE(county_name, ''), state_fips, expected_total, dem_share, gop_share, other_share
    FROM baseline
    ORDER BY fips
  )");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return records;
  }

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      baseline_entity rec;
      rec.fips = chunk->GetValue(0, idx).ToString();
      rec.name = chunk->GetValue(1, idx).ToString();
      rec.state_fips = chunk->GetValue(2, idx).ToString();
      rec.expected_total_votes = chunk->GetValue(3, idx).GetValue<int64_t>();
      rec.dem_share = chunk->GetValue(4, idx).GetValue<double>();
      rec.gop_share = chunk->GetValue(5, idx).GetValue<double>();
      rec.other_share = chunk->GetValue(6, idx).GetValue<double>();
      records.push_back(rec);
    }
  }

  return records;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// get_frames
// one frame per distinct timestamp, updates in ingestion order so later rows win
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<frame_t> scenario_db_t::get_frames()
{
  std::vector<frame_t> frames;

  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(R"(
    SELECT ts, fips, dem_votes, gop_votes, other_votes, total_votes, reporting_percent, fully_reported
    FROM frames
    ORDER BY ts, seq
  )");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return frames;
  }

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      double ts = chunk->GetValue(0, idx).GetValue<double>();
      if (frames.empty() || frames.back().timestamp != ts)
      {
        frame_t frame;
        frame.timestamp = ts;
        frames.push_back(frame);
      }

      county_update update;
      update.dem_votes = chunk->GetValue(2, idx).GetValue<int64_t>();
      update.gop_votes = chunk->GetValue(3, idx).GetValue<int64_t>();

      duckdb::Value other = chunk->GetValue(4, idx);
      if (!other.IsNull())
      {
        update.other_votes = other.GetValue<int64_t>();
        update.has_other_votes = true;
      }

      update.total_votes = chunk->GetValue(5, idx).GetValue<int64_t>();
      update.reporting_percent = chunk->GetValue(6, idx).GetValue<double>();
      update.is_fully_reported = chunk->GetValue(7, idx).GetValue<bool>();
      frames.back().updates[chunk->GetValue(1, idx).ToString()] = update;
    }
  }

  return frames;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// get_duration
/////////////////////////////////////////////////////////////////////////////////////////////////////

double scenario_db_t::get_duration()
{
  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(
    "SELECT COALESCE((SELECT duration_seconds FROM scenario LIMIT 1), (SELECT MAX(ts) FROM frames), 0)");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return 0.0;
  }

  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  if (chunk && chunk->size() > 0)
  {
    return chunk->GetValue(0, 0).GetValue<double>();
  }
  return 0.0;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// get_bootstrap
/////////////////////////////////////////////////////////////////////////////////////////////////////

scenario_bootstrap scenario_db_t::get_bootstrap()
{
  scenario_bootstrap bootstrap;
  bootstrap.name = db_path;
  bootstrap.baseline = get_baseline();
  bootstrap.total_duration_seconds = get_duration();

  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(
    "SELECT name, description, reporting_groups FROM scenario LIMIT 1");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return bootstrap;
  }

  duckdb::unique_ptr<duckdb::DataChunk> chunk = result->Fetch();
  if (chunk && chunk->size() > 0)
  {
    duckdb::Value name = chunk->GetValue(0, 0);
    if (!name.IsNull())
    {
      bootstrap.name = name.ToString();
    }

    duckdb::Value description = chunk->GetValue(1, 0);
    duckdb::Value groups = chunk->GetValue(2, 0);
    if (!description.IsNull() || !groups.IsNull())
    {
      bootstrap.reporting.present = true;
      bootstrap.reporting.description = description.IsNull() ? "" : description.ToString();

      std::string list = groups.IsNull() ? "" : groups.ToString();
      size_t start = 0;
      while (start < list.size())
      {
        size_t end = list.find('|', start);
        if (end == std::string::npos) end = list.size();
        if (end > start)
        {
          bootstrap.reporting.reporting_groups.push_back(list.substr(start, end - start));
        }
        start = end + 1;
      }
    }
  }

  return bootstrap;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// print_summary
// baseline expectations per state, straight from the database
/////////////////////////////////////////////////////////////////////////////////////////////////////

void scenario_db_t::print_summary()
{
  std::unique_ptr<duckdb::MaterializedQueryResult> result = conn->Query(R"(
    SELECT
      b.state_fips,
      COALESCE(s.name, b.state_fips) as state_name,
      COUNT(*) as counties,
      SUM(b.expected_total) as expected,
      SUM(b.expected_total * (b.gop_share - b.dem_share)) / GREATEST(SUM(b.expected_total), 1) * 100 as margin
    FROM baseline b
    LEFT JOIN state_names s ON b.state_fips = s.fips
    GROUP BY b.state_fips, s.name
    ORDER BY state_name
  )");
  if (result->HasError())
  {
    std::cerr << result->GetError() << std::endl;
    return;
  }

  std::cout << "\nBaseline for " << db_path << ":\n";
  std::cout << std::left << std::setw(22) << "State"
    << std::right << std::setw(10) << "Counties"
    << std::setw(14) << "Expected"
    << std::setw(10) << "Margin" << "\n";
  std::cout << std::string(56, '-') << "\n";

  int64_t total_counties = 0, total_expected = 0;

  duckdb::unique_ptr<duckdb::DataChunk> chunk;
  while ((chunk = result->Fetch()) != nullptr)
  {
    for (size_t idx = 0; idx < chunk->size(); idx++)
    {
      int64_t counties = chunk->GetValue(2, idx).GetValue<int64_t>();
      int64_t expected = chunk->GetValue(3, idx).GetValue<int64_t>();
      total_counties += counties;
      total_expected += expected;

      std::cout << std::left << std::setw(22) << chunk->GetValue(1, idx).ToString()
        << std::right << std::setw(10) << counties
        << std::setw(14) << expected
        << std::setw(10) << std::fixed << std::setprecision(1) << chunk->GetValue(4, idx).GetValue<double>() << "\n";
    }
  }

  std::cout << std::string(56, '-') << "\n";
  std::cout << std::left << std::setw(22) << "TOTAL"
    << std::right << std::setw(10) << total_counties
    << std::setw(14) << total_expected << "\n";

  int64_t updates = count_rows("SELECT COUNT(*) FROM frames");
  int64_t timestamps = count_rows("SELECT COUNT(DISTINCT ts) FROM frames");
  std::cout << "Frames: " << timestamps << " timestamps, " << updates << " county updates, duration "
    << get_duration() << "s" << std::endl;
}
