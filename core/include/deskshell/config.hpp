#pragma once
#include "logger.hpp"
#include "tinyjson.hpp"
#include "types.hpp"
#include <string>

namespace deskshell {

struct AppConfig {
  std::string app_name = "Deskshell";
  WindowOptions main_window{std::string(MAIN_WINDOW_LABEL), "Deskshell", 800,
                            600, true, true};
  std::string settings_path; // empty: default_settings_path()
  LogLevel log_level = LogLevel::INFO;
  std::string host = "auto"; // auto | console | win32
  bool open_settings_on_launch = true;
  int tick_interval_ms = 100;
};

struct LaunchOptions {
  AppConfig config;
  std::string config_path; // empty when no --config was given
  bool show_help = false;
};

// $HOME/.deskshell/settings.json (USERPROFILE on Windows), or a file in the
// working directory when neither is set.
std::string default_settings_path();

// Overlays the keys present in `o` onto `cfg`. Throws SetupError on a key of
// the wrong type or an out-of-range value.
void apply_config_json(const json::Object &o, AppConfig &cfg);

// Reads and applies a JSON config file. Throws SetupError when the file is
// missing or malformed.
void load_config_file(const std::string &path, AppConfig &cfg);

// Defaults, then --config <file>, then the remaining flags. Throws SetupError
// on an unknown flag or a flag missing its value.
LaunchOptions parse_launch_options(int argc, const char *const *argv);

std::string usage_text(const std::string &argv0);

} // namespace deskshell
