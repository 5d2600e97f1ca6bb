#include "deskshell/config.hpp"
#include "deskshell/host.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace deskshell {

std::string default_settings_path() {
  const char *home = getenv("USERPROFILE");
  if (!home)
    home = getenv("HOME");
  if (!home)
    return "deskshell-settings.json";
  return std::string(home) + "/.deskshell/settings.json";
}

static int checked_int(const json::Value &v, const std::string &key, int lo,
                       int hi) {
  if (!v.is_num())
    throw SetupError("config: '" + key + "' must be a number");
  double d = v.as_num();
  if (d < lo || d > hi)
    throw SetupError("config: '" + key + "' out of range");
  return (int)d;
}

static const std::string &checked_str(const json::Value &v,
                                      const std::string &key) {
  if (!v.is_str())
    throw SetupError("config: '" + key + "' must be a string");
  return v.as_str();
}

static bool checked_bool(const json::Value &v, const std::string &key) {
  if (!v.is_bool())
    throw SetupError("config: '" + key + "' must be a boolean");
  return v.as_bool();
}

static void set_host(AppConfig &cfg, const std::string &host) {
  if (host != "auto" && host != "console" && host != "win32")
    throw SetupError("config: unknown host '" + host + "'");
  cfg.host = host;
}

static void set_log_level(AppConfig &cfg, const std::string &lvl) {
  auto level = parse_log_level(lvl);
  if (!level)
    throw SetupError("config: unknown log level '" + lvl + "'");
  cfg.log_level = *level;
}

void apply_config_json(const json::Object &o, AppConfig &cfg) {
  for (const auto &[key, v] : o) {
    if (key == "app_name") {
      cfg.app_name = checked_str(v, key);
    } else if (key == "log_level") {
      set_log_level(cfg, checked_str(v, key));
    } else if (key == "host") {
      set_host(cfg, checked_str(v, key));
    } else if (key == "settings_path") {
      cfg.settings_path = checked_str(v, key);
    } else if (key == "open_settings_on_launch") {
      cfg.open_settings_on_launch = checked_bool(v, key);
    } else if (key == "tick_interval_ms") {
      cfg.tick_interval_ms = checked_int(v, key, 10, 60000);
    } else if (key == "main_window") {
      if (!v.is_obj())
        throw SetupError("config: 'main_window' must be an object");
      for (const auto &[wk, wv] : v.as_obj()) {
        std::string full = "main_window." + wk;
        if (wk == "title")
          cfg.main_window.title = checked_str(wv, full);
        else if (wk == "width")
          cfg.main_window.width = checked_int(wv, full, 100, 16384);
        else if (wk == "height")
          cfg.main_window.height = checked_int(wv, full, 100, 16384);
        else if (wk == "resizable")
          cfg.main_window.resizable = checked_bool(wv, full);
        else
          LOG_WARN("config: ignoring unknown key '" + full + "'");
      }
    } else {
      LOG_WARN("config: ignoring unknown key '" + key + "'");
    }
  }
}

void load_config_file(const std::string &path, AppConfig &cfg) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    throw SetupError("config: cannot open " + path);
  std::ostringstream ss;
  ss << f.rdbuf();

  json::Value v;
  try {
    v = json::parse(ss.str());
  } catch (const json::ParseError &e) {
    throw SetupError("config: " + path + ": " + e.what());
  }
  if (!v.is_obj())
    throw SetupError("config: " + path + ": top level must be an object");
  apply_config_json(v.as_obj(), cfg);
  LOG_DEBUG("Loaded config from " + path);
}

std::string usage_text(const std::string &argv0) {
  return "usage: " + argv0 +
         " [options]\n"
         "  --config <file>           JSON config file\n"
         "  --log-level <level>       TRACE, DEBUG, INFO, WARN or ERROR\n"
         "  --host <auto|console|win32>\n"
         "  --settings <file>         settings file\n"
         "  --title <text>            main window title\n"
         "  --tick-ms <n>             timer tick interval\n"
         "  --no-settings-on-launch   do not open the settings window at start\n"
         "  --help\n";
}

LaunchOptions parse_launch_options(int argc, const char *const *argv) {
  LaunchOptions out;

  // --config first so that flags override the file regardless of order.
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      if (i + 1 >= argc)
        throw SetupError("--config requires a value");
      out.config_path = argv[i + 1];
    }
  }
  if (!out.config_path.empty())
    load_config_file(out.config_path, out.config);

  auto value = [&](int &i) -> std::string {
    if (i + 1 >= argc)
      throw SetupError(std::string(argv[i]) + " requires a value");
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      ++i;
    } else if (arg == "--help" || arg == "-h") {
      out.show_help = true;
    } else if (arg == "--log-level") {
      set_log_level(out.config, value(i));
    } else if (arg == "--host") {
      set_host(out.config, value(i));
    } else if (arg == "--settings") {
      out.config.settings_path = value(i);
    } else if (arg == "--title") {
      out.config.main_window.title = value(i);
    } else if (arg == "--tick-ms") {
      std::string v = value(i);
      int ms = 0;
      size_t used = 0;
      try {
        ms = std::stoi(v, &used);
      } catch (const std::exception &) {
        used = 0;
      }
      if (used == 0 || used != v.size())
        throw SetupError("--tick-ms expects a number, got '" + v + "'");
      if (ms < 10 || ms > 60000)
        throw SetupError("--tick-ms out of range");
      out.config.tick_interval_ms = ms;
    } else if (arg == "--no-settings-on-launch") {
      out.config.open_settings_on_launch = false;
    } else {
      throw SetupError("unknown option '" + arg + "'");
    }
  }

  if (out.config.settings_path.empty())
    out.config.settings_path = default_settings_path();
  return out;
}

} // namespace deskshell
