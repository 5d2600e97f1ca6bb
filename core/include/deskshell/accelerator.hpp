#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace deskshell {

// Keyboard shortcut attached to a menu item, e.g. "CmdOrCtrl+,".
struct Accelerator {
  bool primary = false; // Cmd on macOS, Ctrl elsewhere
  bool ctrl = false;
  bool alt = false;
  bool shift = false;
  bool super = false;
  std::string key; // single printable char ("," "A" "5") or a name ("F5", "Escape")

  // Modifiers resolved for the platform: primary folds into super on macOS
  // and into ctrl everywhere else.
  bool uses_ctrl(HostPlatform p) const;
  bool uses_super(HostPlatform p) const;

  // Display form, e.g. "Ctrl+," or "Cmd+Shift+Z".
  std::string to_string(HostPlatform p) const;
};

// Parses "Modifier+Modifier+Key". Modifiers are case-insensitive and may be
// CmdOrCtrl/CommandOrControl, Cmd/Command/Super/Meta, Ctrl/Control,
// Alt/Option, Shift. Exactly one key must follow. Returns nullopt on an
// unknown modifier, a missing key or more than one key.
std::optional<Accelerator> parse_accelerator(std::string_view s);

} // namespace deskshell
