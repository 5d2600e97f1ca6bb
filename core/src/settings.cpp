#include "deskshell/settings.hpp"
#include "deskshell/logger.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

namespace deskshell {

std::string_view timer_mode_name(TimerMode m) {
  return m == TimerMode::COUNTDOWN ? "countdown" : "off";
}

const std::vector<PaletteEntry> &palette() {
  static const std::vector<PaletteEntry> entries = {
      {"turquoise", "PCC Turquoise", "--pcc-turquoise"},
      {"navy", "PCC Navy", "--pcc-navy"},
      {"white", "White", "--pcc-white"},
      {"purple", "Purple", "--pcc-purple"},
      {"apple-green", "Apple Green", "--pcc-apple-green"},
      {"seafoam-green", "Seafoam Green", "--pcc-seafoam-green"},
      {"dark-tan", "Dark Tan", "--pcc-tan"},
      {"light-tan", "Light Tan", "--pcc-light-tan"},
      {"salmon-pink", "Salmon Pink", "--pcc-salmon-pink"},
      {"golden-yellow", "Golden Yellow", "--pcc-golden-yellow"},
      {"bright-yellow", "Bright Yellow", "--pcc-bright-yellow"},
      {"black", "Black", "--pcc-black"},
  };
  return entries;
}

std::optional<PaletteEntry> find_color(std::string_view key) {
  for (const auto &e : palette())
    if (e.key == key)
      return e;
  return std::nullopt;
}

static const std::map<std::string, std::vector<std::string>, std::less<>> &
contrast_rules() {
  static const std::vector<std::string> on_dark = {
      "turquoise",     "white",       "salmon-pink", "golden-yellow",
      "bright-yellow", "seafoam-green", "apple-green", "dark-tan",
      "light-tan"};
  static const std::vector<std::string> on_light = {"navy", "purple", "black"};

  static const std::map<std::string, std::vector<std::string>, std::less<>>
      rules = {
          {"seafoam-green", on_light},
          {"turquoise", {"navy", "white", "bright-yellow", "purple", "black"}},
          {"navy", on_dark},
          {"white", {"turquoise", "navy", "purple", "dark-tan", "black"}},
          {"purple", on_dark},
          {"apple-green", on_light},
          {"dark-tan", {"navy", "white", "bright-yellow", "purple", "black"}},
          {"light-tan", on_light},
          {"salmon-pink", on_light},
          {"golden-yellow",
           {"turquoise", "navy", "purple", "dark-tan", "black"}},
          {"bright-yellow", on_light},
          {"black", on_dark},
      };
  return rules;
}

std::vector<std::string> allowed_text_colors(std::string_view bg) {
  const auto &rules = contrast_rules();
  auto it = rules.find(bg);
  if (it != rules.end())
    return it->second;
  std::vector<std::string> all;
  for (const auto &e : palette())
    all.emplace_back(e.key);
  return all;
}

static int clamp_int(double v, int lo, int hi) {
  if (!std::isfinite(v))
    return lo;
  double f = std::floor(v);
  return (int)std::min<double>(hi, std::max<double>(lo, f));
}

AppSettings normalize_settings(AppSettings s) {
  if (!find_color(s.bg))
    s.bg = AppSettings{}.bg;
  auto allowed = allowed_text_colors(s.bg);
  if (std::find(allowed.begin(), allowed.end(), s.text) == allowed.end())
    s.text = allowed.empty() ? AppSettings{}.text : allowed.front();
  s.timer_min = clamp_int(s.timer_min, 0, 9999);
  s.timer_sec = clamp_int(s.timer_sec, 0, 59);
  return s;
}

AppSettings swap_colors(const AppSettings &s) {
  AppSettings out = s;
  out.bg = find_color(s.text) ? s.text : AppSettings{}.bg;
  auto allowed = allowed_text_colors(out.bg);
  if (std::find(allowed.begin(), allowed.end(), s.bg) != allowed.end())
    out.text = s.bg;
  else
    out.text = allowed.empty() ? s.text : allowed.front();
  return out;
}

std::int64_t countdown_duration_ms(const AppSettings &s) {
  std::int64_t sec = std::min(59, std::max(0, s.timer_sec));
  std::int64_t total = ((std::int64_t)s.timer_min * 60 + sec) * 1000;
  return std::max<std::int64_t>(0, total);
}

json::Object settings_to_json(const AppSettings &s) {
  json::Object o;
  o["bg"] = s.bg;
  o["text"] = s.text;
  o["timerMode"] = std::string(timer_mode_name(s.timer_mode));
  o["timerMin"] = (double)s.timer_min;
  o["timerSec"] = (double)s.timer_sec;
  return o;
}

AppSettings settings_from_json(const json::Object &o, const AppSettings &base) {
  AppSettings s = base;
  if (auto v = json::get_str(o, "bg"))
    s.bg = *v;
  if (auto v = json::get_str(o, "text"))
    s.text = *v;
  if (auto v = json::get_str(o, "timerMode"))
    s.timer_mode = (*v == "countdown") ? TimerMode::COUNTDOWN : TimerMode::OFF;
  if (auto v = json::get_num(o, "timerMin"))
    s.timer_min = clamp_int(*v, 0, 9999);
  if (auto v = json::get_num(o, "timerSec"))
    s.timer_sec = clamp_int(*v, 0, 59);
  return s;
}

SettingsStore::SettingsStore(std::string path) : path_(std::move(path)) {}

AppSettings SettingsStore::load() const {
  std::ifstream f(path_, std::ios::binary);
  if (!f) {
    LOG_DEBUG("No settings file at " + path_ + ", using defaults");
    return AppSettings{};
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  try {
    auto v = json::parse(ss.str());
    if (!v.is_obj()) {
      LOG_WARN("Settings file " + path_ + " is not an object, using defaults");
      return AppSettings{};
    }
    return normalize_settings(settings_from_json(v.as_obj()));
  } catch (const json::ParseError &e) {
    LOG_WARN("Settings file " + path_ + " is malformed (" + e.what() +
             "), using defaults");
    return AppSettings{};
  }
}

bool SettingsStore::save(const AppSettings &s) const {
  std::error_code ec;
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      LOG_WARN("Cannot create " + parent.string() + ": " + ec.message());
      return false;
    }
  }
  std::ofstream f(path_, std::ios::binary | std::ios::trunc);
  if (!f) {
    LOG_WARN("Cannot write settings to " + path_);
    return false;
  }
  f << json::dumps(settings_to_json(s)) << "\n";
  return (bool)f;
}

SettingsService::SettingsService(SettingsStore store)
    : store_(std::move(store)) {}

void SettingsService::load() {
  current_ = store_.load();
  LOG_DEBUG("Settings loaded: " + json::dumps(settings_to_json(current_)));
}

AppSettings SettingsService::update(const AppHandle &app,
                                    const AppSettings &next) {
  AppSettings normalized = normalize_settings(next);
  json::Object payload = settings_to_json(normalized);
  std::string key = json::dumps(payload);
  if (key == last_sent_)
    return normalized;
  last_sent_ = key;
  current_ = normalized;

  if (!store_.save(current_))
    LOG_WARN("Settings changed but could not be persisted");
  if (!app.emit_to(MAIN_WINDOW_LABEL, std::string(SETTINGS_CHANGED_EVENT),
                   payload))
    LOG_DEBUG("Main window not available for settings:changed");
  return normalized;
}

void SettingsService::register_commands(CommandRegistry &reg) {
  auto add = [&reg](const std::string &name, CommandHandler h) {
    if (!reg.add(name, std::move(h)))
      throw SetupError("command " + name + " is already registered");
  };

  add("get_settings", [this](const AppHandle &, const json::Object &) {
    return json::Value(settings_to_json(current_));
  });

  add("update_settings", [this](const AppHandle &app, const json::Object &args) {
    const json::Object *s = json::get_obj(args, "settings");
    if (!s)
      throw ArgumentError("missing required key settings");
    return json::Value(settings_to_json(update(app, settings_from_json(*s, current_))));
  });

  add("swap_colors", [this](const AppHandle &app, const json::Object &) {
    return json::Value(settings_to_json(update(app, swap_colors(current_))));
  });

  auto forward = [](std::string_view event) {
    return [event](const AppHandle &app, const json::Object &) {
      return json::Value(
          app.emit_to(MAIN_WINDOW_LABEL, std::string(event), json::Null{}));
    };
  };
  add("timer_start", forward(TIMER_START_EVENT));
  add("timer_pause", forward(TIMER_PAUSE_EVENT));
  add("timer_reset", forward(TIMER_RESET_EVENT));
}

} // namespace deskshell
