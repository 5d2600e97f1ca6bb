#pragma once
#include "settings.hpp"
#include <cstdint>
#include <string>

namespace deskshell {

inline constexpr std::int64_t URGENT_THRESHOLD_MS = 5 * 60 * 1000;

// "mm:ss" with seconds rounded up; minutes grow past two digits when needed.
std::string format_countdown(std::int64_t ms);

struct CountdownDisplay {
  std::string text = "00:00";
  bool visible = false;
  bool urgent = false;
};

// Countdown timer shown in the main window. Time only moves through
// advance(), so the owner decides where ticks come from.
class Countdown {
public:
  // Applies a mode and duration. Switching to off clears everything; a
  // change of mode or duration while counting down resets the timer.
  void configure(TimerMode mode, std::int64_t duration_ms);

  // No-op unless in countdown mode. Reloads the duration when nothing is
  // left.
  void start();
  void pause();
  void reset();
  void advance(std::int64_t elapsed_ms);

  TimerMode mode() const { return mode_; }
  bool running() const { return running_; }
  std::int64_t remaining_ms() const { return remaining_ms_; }
  std::int64_t duration_ms() const { return duration_ms_; }
  const CountdownDisplay &display() const { return display_; }

private:
  void apply_mode();
  void show(const std::string &text, bool visible);
  void sync_urgent();

  TimerMode mode_ = TimerMode::OFF;
  std::int64_t duration_ms_ = 0;
  std::int64_t remaining_ms_ = 0;
  bool running_ = false;
  CountdownDisplay display_;
};

} // namespace deskshell
