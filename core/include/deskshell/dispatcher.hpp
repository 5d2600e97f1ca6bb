#pragma once
#include "app_handle.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace deskshell {

// Menu identifiers the application itself reacts to. Everything else is
// OTHER and left to the host.
enum class MenuAction : std::uint8_t { OPEN_SETTINGS, OTHER };

MenuAction parse_menu_action(std::string_view menu_id);

// Routes menu activations to UI events on the main window.
class MenuEventDispatcher {
public:
  explicit MenuEventDispatcher(AppHandle app);

  // Returns true when an event was emitted. A missing main window is not an
  // error: the notification is best-effort and silently dropped.
  bool dispatch(const std::string &menu_id);

private:
  AppHandle app_;
};

} // namespace deskshell
