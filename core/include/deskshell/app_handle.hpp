#pragma once
#include "config.hpp"
#include "host.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace deskshell {

// Explicit view of the running application handed to command handlers, the
// menu dispatcher and front-end code. Does not own the host or the config.
class AppHandle {
public:
  AppHandle(IHost *host, const AppConfig *config);

  IHost &host() const { return *host_; }
  const AppConfig &config() const { return *config_; }

  std::optional<window_id> get_window(std::string_view label) const;

  // Emits to the window with the given label. False when no such window
  // exists or the host refused the event.
  bool emit_to(std::string_view label, const std::string &event,
               const json::Value &payload) const;

private:
  IHost *host_;
  const AppConfig *config_;
};

} // namespace deskshell
