#pragma once
#include "commands.hpp"
#include "tinyjson.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskshell {

enum class TimerMode : std::uint8_t { OFF, COUNTDOWN };

std::string_view timer_mode_name(TimerMode m);

struct AppSettings {
  std::string bg = "turquoise";
  std::string text = "navy";
  TimerMode timer_mode = TimerMode::OFF;
  int timer_min = 5;
  int timer_sec = 0;

  bool operator==(const AppSettings &o) const {
    return bg == o.bg && text == o.text && timer_mode == o.timer_mode &&
           timer_min == o.timer_min && timer_sec == o.timer_sec;
  }
  bool operator!=(const AppSettings &o) const { return !(*this == o); }
};

struct PaletteEntry {
  std::string_view key;
  std::string_view label;
  std::string_view css_var;
};

const std::vector<PaletteEntry> &palette();
std::optional<PaletteEntry> find_color(std::string_view key);

// Text colours readable on the given background; every palette key when the
// background has no contrast rule.
std::vector<std::string> allowed_text_colors(std::string_view bg);

// Unknown background -> default; text not allowed on bg -> first allowed;
// minutes clamped to [0, 9999], seconds to [0, 59].
AppSettings normalize_settings(AppSettings s);

// Background takes the old text colour; text takes the old background when
// that is allowed on the new one, else the first allowed colour.
AppSettings swap_colors(const AppSettings &s);

std::int64_t countdown_duration_ms(const AppSettings &s);

// camelCase keys: bg, text, timerMode, timerMin, timerSec.
json::Object settings_to_json(const AppSettings &s);
// Keys absent from `o`, or of the wrong type, keep their value from `base`.
AppSettings settings_from_json(const json::Object &o,
                               const AppSettings &base = AppSettings{});

// JSON file persistence.
class SettingsStore {
public:
  explicit SettingsStore(std::string path);

  const std::string &path() const { return path_; }

  // Defaults when the file is missing or unreadable.
  AppSettings load() const;
  bool save(const AppSettings &s) const;

private:
  std::string path_;
};

// Current settings plus the commands the settings window uses.
class SettingsService {
public:
  explicit SettingsService(SettingsStore store);

  void load();
  const AppSettings &current() const { return current_; }

  // Normalises, persists and emits settings:changed to the main window. A
  // value identical to the last one pushed is neither written nor emitted.
  AppSettings update(const AppHandle &app, const AppSettings &next);

  // get_settings, update_settings, swap_colors, timer_start, timer_pause,
  // timer_reset. Throws SetupError on a name clash.
  void register_commands(CommandRegistry &reg);

private:
  SettingsStore store_;
  AppSettings current_;
  std::string last_sent_;
};

} // namespace deskshell
