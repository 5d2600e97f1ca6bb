#include "deskshell/countdown.hpp"
#include <algorithm>

namespace deskshell {

static std::string pad2(std::int64_t n) {
  std::string s = std::to_string(std::max<std::int64_t>(0, n));
  if (s.size() < 2)
    s.insert(0, 2 - s.size(), '0');
  return s;
}

std::string format_countdown(std::int64_t ms) {
  if (ms <= 0)
    return "00:00";
  std::int64_t total_sec = (ms + 999) / 1000;
  return pad2(total_sec / 60) + ":" + pad2(total_sec % 60);
}

void Countdown::configure(TimerMode mode, std::int64_t duration_ms) {
  duration_ms = std::max<std::int64_t>(0, duration_ms);
  bool mode_changed = mode != mode_;
  bool duration_changed = duration_ms != duration_ms_;

  mode_ = mode;
  duration_ms_ = duration_ms;
  apply_mode();

  if (mode_ == TimerMode::COUNTDOWN && (mode_changed || duration_changed))
    reset();
}

void Countdown::apply_mode() {
  if (mode_ == TimerMode::OFF) {
    running_ = false;
    remaining_ms_ = 0;
    show("00:00", false);
    display_.urgent = false;
    return;
  }

  // Keep a running or paused countdown as it is.
  if (!running_) {
    if (remaining_ms_ <= 0)
      remaining_ms_ = duration_ms_;
    if (remaining_ms_ > 0)
      show(format_countdown(remaining_ms_), true);
    else
      show("00:00", false);
  }
}

void Countdown::start() {
  if (mode_ != TimerMode::COUNTDOWN)
    return;
  if (remaining_ms_ <= 0)
    remaining_ms_ = duration_ms_;
  if (remaining_ms_ <= 0)
    return;
  show(format_countdown(remaining_ms_), true);
  running_ = true;
  sync_urgent();
}

void Countdown::pause() {
  running_ = false;
  show(format_countdown(remaining_ms_), remaining_ms_ > 0);
  sync_urgent();
}

void Countdown::reset() {
  running_ = false;
  remaining_ms_ = duration_ms_;
  if (mode_ == TimerMode::COUNTDOWN && remaining_ms_ > 0)
    show(format_countdown(remaining_ms_), true);
  else
    show("00:00", false);
  sync_urgent();
}

void Countdown::advance(std::int64_t elapsed_ms) {
  if (!running_ || elapsed_ms <= 0)
    return;
  remaining_ms_ -= elapsed_ms;
  if (remaining_ms_ <= 0) {
    remaining_ms_ = 0;
    running_ = false;
    show("00:00", true);
    display_.urgent = false;
    return;
  }
  show(format_countdown(remaining_ms_), true);
  sync_urgent();
}

void Countdown::show(const std::string &text, bool visible) {
  display_.text = text;
  display_.visible = visible;
}

void Countdown::sync_urgent() {
  display_.urgent = mode_ == TimerMode::COUNTDOWN && remaining_ms_ > 0 &&
                    remaining_ms_ <= URGENT_THRESHOLD_MS;
}

} // namespace deskshell
