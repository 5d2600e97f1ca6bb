#include "main_window.hpp"
#include "deskshell/logger.hpp"

using namespace deskshell;

namespace deskshell_app {

WindowOptions settings_window_options() {
  WindowOptions o;
  o.label = std::string(SETTINGS_WINDOW_LABEL);
  o.title = "Settings";
  o.width = 320;
  o.height = 340;
  o.resizable = true;
  o.visible = true;
  return o;
}

MainWindowController::MainWindowController(AppHandle app,
                                           const AppSettings &initial)
    : app_(app), settings_(initial) {
  countdown_.configure(settings_.timer_mode, countdown_duration_ms(settings_));
}

void MainWindowController::attach() {
  IHost &host = app_.host();
  const std::string main(MAIN_WINDOW_LABEL);

  host.listen(main, std::string(OPEN_SETTINGS_EVENT),
              [this](const json::Value &) {
                if (!open_settings_window())
                  LOG_WARN("Settings window could not be opened");
              });
  host.listen(main, std::string(SETTINGS_CHANGED_EVENT),
              [this](const json::Value &payload) {
                if (!payload.is_obj()) {
                  LOG_WARN("settings:changed without an object payload");
                  return;
                }
                apply_settings(settings_from_json(payload.as_obj(), settings_));
              });
  host.listen(main, std::string(TIMER_START_EVENT), [this](const json::Value &) {
    countdown_.start();
    render();
  });
  host.listen(main, std::string(TIMER_PAUSE_EVENT), [this](const json::Value &) {
    countdown_.pause();
    render();
  });
  host.listen(main, std::string(TIMER_RESET_EVENT), [this](const json::Value &) {
    countdown_.reset();
    render();
  });

  host.on_tick(app_.config().tick_interval_ms,
               [this](std::int64_t elapsed) { tick(elapsed); });

  render();
  if (app_.config().open_settings_on_launch && !open_settings_window())
    LOG_WARN("Settings window could not be opened at launch");
}

bool MainWindowController::open_settings_window() {
  IHost &host = app_.host();
  if (auto w = app_.get_window(SETTINGS_WINDOW_LABEL)) {
    bool shown = host.show_window(*w);
    bool focused = host.focus_window(*w);
    return shown && focused;
  }
  auto w = host.create_window(settings_window_options());
  if (!w)
    return false;
  LOG_DEBUG("Settings window opened");
  return host.focus_window(*w);
}

void MainWindowController::apply_settings(const AppSettings &s) {
  settings_ = normalize_settings(s);
  countdown_.configure(settings_.timer_mode, countdown_duration_ms(settings_));
  render();
}

void MainWindowController::tick(std::int64_t elapsed_ms) {
  if (!countdown_.running())
    return;
  countdown_.advance(elapsed_ms);
  render();
}

std::string MainWindowController::title() const {
  std::string t = app_.config().main_window.title;
  const CountdownDisplay &d = countdown_.display();
  if (!d.visible)
    return t;
  t += " - " + d.text;
  if (d.urgent)
    t += " !";
  return t;
}

void MainWindowController::render() {
  std::string t = title();
  if (t == last_title_)
    return;
  auto w = app_.get_window(MAIN_WINDOW_LABEL);
  if (!w || !app_.host().set_window_title(*w, t))
    return;
  last_title_ = t;
}

} // namespace deskshell_app
