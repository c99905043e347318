#include <Wt/WApplication.h>
#include <Wt/WContainerWidget.h>
#include <Wt/WHBoxLayout.h>
#include <Wt/WVBoxLayout.h>
#include <Wt/WText.h>
#include <Wt/WComboBox.h>
#include <Wt/WPushButton.h>
#include <Wt/WSlider.h>
#include <Wt/WLineEdit.h>
#include <Wt/WTimer.h>
#include <Wt/WTable.h>
#include <Wt/WTableCell.h>
#include <Wt/WCssStyleSheet.h>
#include <Wt/Utils.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <memory>
#include <iomanip>
#include <stdexcept>
#include "data.hh"
#include "format.hh"

/////////////////////////////////////////////////////////////////////////////////////////////////////
// globals
// scenario read once at startup, every session replays it with its own engine
/////////////////////////////////////////////////////////////////////////////////////////////////////

scenario_bootstrap scenario;
std::vector<frame_t> scenario_frames;
bool scenario_loaded = false;

/////////////////////////////////////////////////////////////////////////////////////////////////////
// wt_tick_scheduler_t
// drives the timeline from a WTimer, deltas measured with the steady clock
/////////////////////////////////////////////////////////////////////////////////////////////////////

class wt_tick_scheduler_t : public tick_scheduler_t
{
public:
  wt_tick_scheduler_t(Wt::WTimer* timer_) : timer(timer_), running(false)
  {
    timer->timeout().connect([this]() { fire(); });
  }

  virtual void start(std::function<void(double)> on_tick) override
  {
    callback = on_tick;
    last = std::chrono::steady_clock::now();
    running = true;
    timer->start();
  }

  virtual void stop() override
  {
    running = false;
    callback = nullptr;
    timer->stop();
  }

  virtual bool active() const override { return running; }

  std::function<void()> after_tick;

private:
  void fire()
  {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    double delta = std::chrono::duration<double>(now - last).count();
    last = now;
    if (running && callback)
    {
      std::function<void(double)> fn = callback;
      fn(delta);
    }
    if (after_tick)
    {
      after_tick();
    }
  }

  Wt::WTimer* timer;
  std::function<void(double)> callback;
  std::chrono::steady_clock::time_point last;
  bool running;
};

/////////////////////////////////////////////////////////////////////////////////////////////////////
// ApplicationStudio
/////////////////////////////////////////////////////////////////////////////////////////////////////

class ApplicationStudio : public Wt::WApplication
{
public:
  ApplicationStudio(const Wt::WEnvironment& env);
  ~ApplicationStudio();

private:
  playback_config config;
  std::unique_ptr<playback_engine_t> engine;
  std::unique_ptr<wt_tick_scheduler_t> scheduler;
  size_t next_frame;
  size_t frames_per_tick;
  size_t events_shown;
  std::string newest_shown;

  Wt::WText* clock_text;
  Wt::WText* status_text;
  Wt::WComboBox* speed_combo;
  Wt::WSlider* scrub_slider;
  Wt::WText* stats_text;
  Wt::WTable* results_table;
  Wt::WContainerWidget* news_list;
  Wt::WLineEdit* fips_edit;
  Wt::WLineEdit* dem_edit;
  Wt::WLineEdit* gop_edit;
  Wt::WText* override_text;

  void stream_frames();
  void on_tick();
  void on_speed_changed();
  void on_scrub(int value);
  void on_apply_override();
  void on_clear_override();
  void update_clock();
  void update_stats();
  void update_table();
  void update_news();
};

ApplicationStudio::ApplicationStudio(const Wt::WEnvironment& env)
  : Wt::WApplication(env), next_frame(0), frames_per_tick(50), events_shown(0)
{
  setTitle("Election Night Playback");

  std::string value;
  if (readConfigurationProperty("playback.speed", value))
  {
    parse_config_arg("speed=" + value, config);
  }
  if (readConfigurationProperty("playback.tick_ms", value))
  {
    parse_config_arg("tick_ms=" + value, config);
  }
  if (readConfigurationProperty("playback.call_threshold", value))
  {
    parse_config_arg("call_threshold=" + value, config);
  }
  if (readConfigurationProperty("playback.frames_per_tick", value))
  {
    frames_per_tick = std::max(1, std::atoi(value.c_str()));
  }

  styleSheet().addRule("body", "margin: 0; padding: 0; font-family: sans-serif;");

  std::unique_ptr<Wt::WHBoxLayout> layout = std::make_unique<Wt::WHBoxLayout>();
  layout->setContentsMargins(0, 0, 0, 0);

  /////////////////////////////////////////////////////////////////////////////////////////////////////
  // sidebar: transport controls, national results, overrides
  /////////////////////////////////////////////////////////////////////////////////////////////////////

  std::unique_ptr<Wt::WContainerWidget> sidebar = std::make_unique<Wt::WContainerWidget>();
  styleSheet().addRule("#" + sidebar->id(),
    "background:#1a1a2e;color:#eee;padding:15px;overflow-y:auto;max-height:100vh;");
  sidebar->setWidth(300);

  std::unique_ptr<Wt::WVBoxLayout> layout_sidebar = std::make_unique<Wt::WVBoxLayout>();
  layout_sidebar->setContentsMargins(0, 0, 0, 0);

  layout_sidebar->addWidget(std::make_unique<Wt::WText>("<h3 style='margin:0 0 15px 0;'>" +
    Wt::Utils::htmlEncode(scenario.name) + "</h3>"));
  clock_text = layout_sidebar->addWidget(std::make_unique<Wt::WText>());
  status_text = layout_sidebar->addWidget(std::make_unique<Wt::WText>());

  std::unique_ptr<Wt::WContainerWidget> buttons = std::make_unique<Wt::WContainerWidget>();
  Wt::WPushButton* play_button = buttons->addWidget(std::make_unique<Wt::WPushButton>("Play"));
  Wt::WPushButton* pause_button = buttons->addWidget(std::make_unique<Wt::WPushButton>("Pause"));
  play_button->clicked().connect([this]() { engine->play(); update_clock(); });
  pause_button->clicked().connect([this]() { engine->pause(); update_clock(); });
  layout_sidebar->addWidget(std::move(buttons));

  layout_sidebar->addWidget(std::make_unique<Wt::WText>("<b>Speed</b>"));
  speed_combo = layout_sidebar->addWidget(std::make_unique<Wt::WComboBox>());
  styleSheet().addRule("#" + speed_combo->id(),
    "width:100%;padding:8px;margin:5px 0 15px 0;background:#16213e;color:#fff;border:1px solid #0f3460;border-radius:4px;");
  const char* speeds[] = { "1", "5", "15", "30", "60", "120" };
  for (size_t idx = 0; idx < sizeof(speeds) / sizeof(speeds[0]); idx++)
  {
    speed_combo->addItem(std::string(speeds[idx]) + "x");
  }
  speed_combo->changed().connect(this, &ApplicationStudio::on_speed_changed);

  layout_sidebar->addWidget(std::make_unique<Wt::WText>("<b>Timeline</b>"));
  scrub_slider = layout_sidebar->addWidget(std::make_unique<Wt::WSlider>());
  scrub_slider->setRange(0, 1000);
  scrub_slider->resize(260, 30);
  scrub_slider->setDisabled(true);
  scrub_slider->valueChanged().connect(this, &ApplicationStudio::on_scrub);

  layout_sidebar->addWidget(std::make_unique<Wt::WText>("<b>National Results</b>"));
  stats_text = layout_sidebar->addWidget(std::make_unique<Wt::WText>());

  layout_sidebar->addWidget(std::make_unique<Wt::WText>("<b>Manual Override</b>"));
  fips_edit = layout_sidebar->addWidget(std::make_unique<Wt::WLineEdit>());
  fips_edit->setPlaceholderText("County FIPS");
  dem_edit = layout_sidebar->addWidget(std::make_unique<Wt::WLineEdit>());
  dem_edit->setPlaceholderText("DEM votes");
  gop_edit = layout_sidebar->addWidget(std::make_unique<Wt::WLineEdit>());
  gop_edit->setPlaceholderText("GOP votes");

  std::unique_ptr<Wt::WContainerWidget> override_buttons = std::make_unique<Wt::WContainerWidget>();
  Wt::WPushButton* apply_button = override_buttons->addWidget(std::make_unique<Wt::WPushButton>("Apply"));
  Wt::WPushButton* clear_button = override_buttons->addWidget(std::make_unique<Wt::WPushButton>("Clear"));
  apply_button->clicked().connect(this, &ApplicationStudio::on_apply_override);
  clear_button->clicked().connect(this, &ApplicationStudio::on_clear_override);
  layout_sidebar->addWidget(std::move(override_buttons));
  override_text = layout_sidebar->addWidget(std::make_unique<Wt::WText>());

  layout_sidebar->addStretch(1);
  sidebar->setLayout(std::move(layout_sidebar));
  layout->addWidget(std::move(sidebar), 0);

  /////////////////////////////////////////////////////////////////////////////////////////////////////
  // main area: state table and newsroom feed
  /////////////////////////////////////////////////////////////////////////////////////////////////////

  std::unique_ptr<Wt::WContainerWidget> content = std::make_unique<Wt::WContainerWidget>();
  styleSheet().addRule("#" + content->id(), "padding:15px;overflow-y:auto;max-height:100vh;");

  content->addWidget(std::make_unique<Wt::WText>("<h3>States</h3>"));
  results_table = content->addWidget(std::make_unique<Wt::WTable>());
  styleSheet().addRule("#" + results_table->id(),
    "width:100%;font-size:12px;border-collapse:collapse;");
  styleSheet().addRule("#" + results_table->id() + " td", "padding:2px 6px;");

  content->addWidget(std::make_unique<Wt::WText>("<h3>Newsroom</h3>"));
  news_list = content->addWidget(std::make_unique<Wt::WContainerWidget>());
  styleSheet().addRule("#" + news_list->id(), "font-size:12px;");

  layout->addWidget(std::move(content), 1);
  root()->setLayout(std::move(layout));

  /////////////////////////////////////////////////////////////////////////////////////////////////////
  // engine
  /////////////////////////////////////////////////////////////////////////////////////////////////////

  Wt::WTimer* timer = root()->addChild(std::make_unique<Wt::WTimer>());
  timer->setInterval(std::chrono::milliseconds(config.tick_interval_ms));
  scheduler = std::make_unique<wt_tick_scheduler_t>(timer);
  scheduler->after_tick = [this]() { on_tick(); };

  engine = std::make_unique<playback_engine_t>(config);
  engine->attach_scheduler(scheduler.get());
  if (scenario_loaded)
  {
    try
    {
      engine->load_scenario(scenario);
      engine->on_transport_ready();
    }
    catch (const std::invalid_argument& e)
    {
      std::cerr << e.what() << std::endl;
      engine->on_transport_error(e.what());
    }
  }
  else
  {
    engine->on_transport_error("no scenario database");
  }

  update_clock();
  update_stats();
  update_table();
}

ApplicationStudio::~ApplicationStudio()
{
  engine->dispose();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// stream_frames
// hands the buffered scenario to the engine a batch per tick, the way a live feed would arrive
/////////////////////////////////////////////////////////////////////////////////////////////////////

void ApplicationStudio::stream_frames()
{
  if (!scenario_loaded || next_frame >= scenario_frames.size())
  {
    return;
  }

  size_t end = std::min(scenario_frames.size(), next_frame + frames_per_tick);
  for (; next_frame < end; next_frame++)
  {
    if (engine->ingest_frame(scenario_frames[next_frame]) < 0)
    {
      std::cerr << "Frame at " << scenario_frames[next_frame].timestamp << " rejected" << std::endl;
    }
  }

  if (next_frame >= scenario_frames.size())
  {
    engine->on_transport_completed();
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// on_tick
/////////////////////////////////////////////////////////////////////////////////////////////////////

void ApplicationStudio::on_tick()
{
  stream_frames();
  update_clock();
  update_stats();
  update_table();
  update_news();
}

void ApplicationStudio::on_speed_changed()
{
  std::string text = speed_combo->currentText().toUTF8();
  engine->set_speed(std::atof(text.c_str()));
}

void ApplicationStudio::on_scrub(int value)
{
  if (!engine->is_playback_ready())
  {
    return;
  }
  engine->seek_to_percent(value / 10.0);
  on_tick();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// on_apply_override
// empty fields are left as they are
/////////////////////////////////////////////////////////////////////////////////////////////////////

void ApplicationStudio::on_apply_override()
{
  override_fields fields;
  try
  {
    std::string dem = dem_edit->text().toUTF8();
    std::string gop = gop_edit->text().toUTF8();
    if (!dem.empty())
    {
      fields.dem_votes = std::stoll(dem);
      fields.has_dem_votes = true;
    }
    if (!gop.empty())
    {
      fields.gop_votes = std::stoll(gop);
      fields.has_gop_votes = true;
    }

    const county_state& state = engine->set_manual_override(fips_edit->text().toUTF8(), fields);
    override_text->setText("Override on " + state.fips + ": " + format_number(state.total_votes) + " votes");
  }
  catch (const std::invalid_argument& e)
  {
    override_text->setText("<span style='color:#E48268;'>" + Wt::Utils::htmlEncode(e.what()) + "</span>");
  }
  catch (const std::out_of_range&)
  {
    override_text->setText("<span style='color:#E48268;'>vote count out of range</span>");
  }
  on_tick();
}

void ApplicationStudio::on_clear_override()
{
  std::string fips = normalize_fips(fips_edit->text().toUTF8());
  if (engine->clear_manual_override(fips))
  {
    override_text->setText("Override on " + fips + " cleared");
  }
  else
  {
    override_text->setText("No override on " + Wt::Utils::htmlEncode(fips_edit->text().toUTF8()));
  }
  on_tick();
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// update_clock
/////////////////////////////////////////////////////////////////////////////////////////////////////

void ApplicationStudio::update_clock()
{
  std::stringstream ss;
  ss << "<div style='font-size:20px;margin:5px 0;'>" << format_clock(engine->cursor())
    << " / " << format_clock(engine->duration()) << "</div>";
  clock_text->setText(ss.str());

  std::string status = to_string(engine->status());
  if (engine->status() == playback_status::error)
  {
    status += ": " + Wt::Utils::htmlEncode(engine->last_error());
  }
  else if (!engine->last_error().empty())
  {
    status = "error: " + Wt::Utils::htmlEncode(engine->last_error());
  }
  else if (!engine->is_playback_ready())
  {
    const frame_buffer_t* frames = engine->frames();
    std::stringstream buffered;
    buffered << std::fixed << std::setprecision(0)
      << (frames && !frames->empty() ? frames->last_timestamp() : 0.0);
    status += ", buffering (" + buffered.str() + "s)";
  }
  status_text->setText("<div style='color:#888;margin-bottom:10px;'>" + status + "</div>");

  scrub_slider->setDisabled(!engine->is_playback_ready());
  scrub_slider->setValue(static_cast<int>(engine->progress_percent() * 10.0));
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// update_stats
/////////////////////////////////////////////////////////////////////////////////////////////////////

void ApplicationStudio::update_stats()
{
  aggregate_snapshot national = engine->get_aggregate("national");

  std::stringstream ss;
  ss << std::fixed << std::setprecision(1);
  ss << "<div style='margin:10px 0;'>";
  ss << "<div style='color:#B82D35;'>GOP: " << format_number(national.gop_votes) << " (" << national.gop_percent << "%)</div>";
  ss << "<div style='color:#6BACD0;'>DEM: " << format_number(national.dem_votes) << " (" << national.dem_percent << "%)</div>";
  ss << "<div style='color:#888;margin-top:5px;'>Total: " << format_number(national.total_votes)
    << " of ~" << format_number(national.expected_total_votes) << "</div>";
  ss << "<div style='color:#888;'>Margin: " << format_margin(national.margin_percent)
    << ", GOP win " << std::setprecision(0) << national.win_probability << "%</div>";
  ss << "<div style='color:#888;'>Counties: " << national.counties_reporting << " of " << national.total_counties
    << " reporting, " << std::setprecision(1) << national.vote_reporting_percent << "% of votes</div>";
  if (national.has_vote_eta)
  {
    ss << "<div style='color:#888;'>Count complete in ~" << format_clock(national.vote_eta_seconds) << "</div>";
  }
  ss << "</div>";

  stats_text->setText(ss.str());
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// update_table
/////////////////////////////////////////////////////////////////////////////////////////////////////

void ApplicationStudio::update_table()
{
  results_table->clear();

  results_table->elementAt(0, 0)->addWidget(std::make_unique<Wt::WText>("<b>State</b>"));
  results_table->elementAt(0, 1)->addWidget(std::make_unique<Wt::WText>("<b>Leader</b>"));
  results_table->elementAt(0, 2)->addWidget(std::make_unique<Wt::WText>("<b>Margin</b>"));
  results_table->elementAt(0, 3)->addWidget(std::make_unique<Wt::WText>("<b>Reporting</b>"));
  results_table->elementAt(0, 4)->addWidget(std::make_unique<Wt::WText>("<b>Outstanding</b>"));

  std::vector<aggregate_snapshot> rows = state_leaderboard(engine->aggregates(), 0);
  for (size_t i = 0; i < rows.size(); i++)
  {
    const aggregate_snapshot& s = rows[i];
    int row = static_cast<int>(i) + 1;

    results_table->elementAt(row, 0)->addWidget(std::make_unique<Wt::WText>(state_label(s.scope)));

    std::string color = margin_to_color(s.margin_percent / 100.0);
    results_table->elementAt(row, 1)->addWidget(
      std::make_unique<Wt::WText>("<span style='background:" + color + ";padding:0 6px;'>" + s.leader + "</span>"));
    results_table->elementAt(row, 2)->addWidget(std::make_unique<Wt::WText>(format_margin(s.margin_percent)));

    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << s.vote_reporting_percent << "%";
    results_table->elementAt(row, 3)->addWidget(std::make_unique<Wt::WText>(ss.str()));
    results_table->elementAt(row, 4)->addWidget(std::make_unique<Wt::WText>(format_number(s.votes_remaining)));
  }
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// update_news
// newest first, rebuilt only when the feed changed
/////////////////////////////////////////////////////////////////////////////////////////////////////

void ApplicationStudio::update_news()
{
  const std::deque<newsroom_event>& events = engine->get_newsroom_events();
  std::string newest = events.empty() ? "" : events.front().id;
  if (events.size() == events_shown && newest == newest_shown)
  {
    return;
  }

  news_list->clear();
  for (size_t idx = 0; idx < events.size(); idx++)
  {
    const newsroom_event& e = events[idx];
    std::string color = "#888";
    if (e.severity == "success") color = "#2E8B57";
    else if (e.severity == "warning") color = "#E48268";
    else if (e.severity == "danger") color = "#B82D35";

    std::stringstream ss;
    ss << "<div style='border-left:4px solid " << color << ";padding:4px 8px;margin:4px 0;'>"
      << "<span style='color:#888;'>" << format_clock(e.simulation_time_seconds) << "</span> "
      << "<b>" << Wt::Utils::htmlEncode(e.headline) << "</b><br>"
      << Wt::Utils::htmlEncode(e.detail) << "</div>";
    news_list->addWidget(std::make_unique<Wt::WText>(ss.str()));
  }
  events_shown = events.size();
  newest_shown = newest;
}

std::unique_ptr<Wt::WApplication> create_application(const Wt::WEnvironment& env)
{
  return std::make_unique<ApplicationStudio>(env);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// main
// ./playback_studio --docroot . --http-address 0.0.0.0 --http-port 8080
// scenario database from PLAYBACK_DB, scenario.duckdb otherwise. playback.speed, playback.tick_ms,
// playback.call_threshold and playback.frames_per_tick are read from wt_config.xml per session
/////////////////////////////////////////////////////////////////////////////////////////////////////

int main(int argc, char* argv[])
{
  std::string db_path = "scenario.duckdb";
  const char* env_db = std::getenv("PLAYBACK_DB");
  if (env_db)
  {
    db_path = env_db;
  }

  try
  {
    scenario_db_t db(db_path);
    db.print_summary();
    scenario = db.get_bootstrap();
    scenario_frames = db.get_frames();
    scenario_loaded = !scenario.baseline.empty();
  }
  catch (const std::exception& e)
  {
    std::cerr << e.what() << std::endl;
  }

  return Wt::WRun(argc, argv, &create_application);
}
