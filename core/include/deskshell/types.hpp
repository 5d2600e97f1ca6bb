#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace deskshell {

using window_id = std::uint64_t;
using menu_handle = std::uint64_t;

inline constexpr std::string_view MAIN_WINDOW_LABEL = "main";
inline constexpr std::string_view SETTINGS_WINDOW_LABEL = "settings";

// The only custom menu identifier; everything else in the bar is predefined.
inline constexpr std::string_view OPEN_SETTINGS_MENU_ID = "open_settings";

inline constexpr std::string_view OPEN_SETTINGS_EVENT = "menu:open-settings";
inline constexpr std::string_view SETTINGS_CHANGED_EVENT = "settings:changed";
inline constexpr std::string_view TIMER_START_EVENT = "timer:start";
inline constexpr std::string_view TIMER_PAUSE_EVENT = "timer:pause";
inline constexpr std::string_view TIMER_RESET_EVENT = "timer:reset";

enum class HostPlatform : std::uint8_t { MACOS, WINDOWS, LINUX, MOBILE, OTHER };

enum class MenuBarConvention : std::uint8_t {
  NONE,     // no application menu bar (terminal, mobile)
  TOP_LEVEL // native menu bar attached to the app or its windows
};

struct HostInfo {
  HostPlatform platform = HostPlatform::OTHER;
  MenuBarConvention menu_bar = MenuBarConvention::NONE;
  std::string package_name;
  std::string backend; // "win32", "console", "fake"
};

std::string_view platform_name(HostPlatform p);
// Platform this binary was compiled for.
HostPlatform current_platform();

// Menu entries whose behaviour is supplied by the host.
enum class PredefinedItem : std::uint8_t {
  SERVICES,
  HIDE,
  HIDE_OTHERS,
  SHOW_ALL,
  QUIT,
  UNDO,
  REDO,
  CUT,
  COPY,
  PASTE,
  SELECT_ALL,
  MINIMIZE,
  CLOSE_WINDOW,
};

// Stable identifier of a predefined item ("hide-others", "close-window", ...).
std::string_view predefined_item_id(PredefinedItem item);
// Default display text ("Hide Others", "Close Window", ...).
std::string_view predefined_item_text(PredefinedItem item);

struct WindowOptions {
  std::string label;
  std::string title;
  int width = 800;
  int height = 600;
  bool resizable = true;
  bool visible = true;
};

} // namespace deskshell
