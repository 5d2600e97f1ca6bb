#pragma once
#include "deskshell/app_handle.hpp"
#include "deskshell/countdown.hpp"
#include "deskshell/settings.hpp"
#include <cstdint>
#include <string>

namespace deskshell_app {

// Front-end of the main window: reacts to the shell's events, opens the
// settings window and renders the countdown into the window title.
class MainWindowController {
public:
  MainWindowController(deskshell::AppHandle app,
                       const deskshell::AppSettings &initial);

  // Subscribes to the main window's events and the host tick. Opens the
  // settings window when the config asks for it.
  void attach();

  // Shows and focuses the settings window, creating it on first use.
  // False when the host refused to create it.
  bool open_settings_window();

  void apply_settings(const deskshell::AppSettings &s);
  void tick(std::int64_t elapsed_ms);

  const deskshell::AppSettings &settings() const { return settings_; }
  const deskshell::Countdown &countdown() const { return countdown_; }
  // Title the main window should carry for the current countdown state.
  std::string title() const;

private:
  void render();

  deskshell::AppHandle app_;
  deskshell::AppSettings settings_;
  deskshell::Countdown countdown_;
  std::string last_title_;
};

deskshell::WindowOptions settings_window_options();

} // namespace deskshell_app
