#pragma once
#include "host.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskshell {

// Declarative description of the application menu bar.

struct CustomItemSpec {
  std::string id;
  std::string text;
  bool enabled = true;
  std::string accelerator; // empty: none
};

enum class MenuEntryKind : std::uint8_t { ITEM, PREDEFINED, SEPARATOR };

struct MenuEntry {
  MenuEntryKind kind = MenuEntryKind::SEPARATOR;
  std::string item_id; // ITEM: refers to a CustomItemSpec
  PredefinedItem predefined = PredefinedItem::QUIT;

  static MenuEntry item(std::string id);
  static MenuEntry system(PredefinedItem p);
  static MenuEntry separator();
};

struct SubmenuSpec {
  std::string title;
  std::vector<MenuEntry> entries;
};

struct MenuBarSpec {
  // Custom items are created once and may be referenced from several
  // submenus; every reference is the same item.
  std::vector<CustomItemSpec> items;
  std::vector<SubmenuSpec> submenus;
};

// App (titled app_name), Edit and Window submenus with "Settings…" in the
// App and Window submenus.
MenuBarSpec default_menu_bar(const std::string &app_name);

// Custom identifiers are unique, every ITEM entry names a declared item and
// every accelerator parses. Throws SetupError otherwise.
void validate_menu_spec(const MenuBarSpec &spec);

struct InstalledMenu {
  menu_handle bar = 0;
  std::map<std::string, menu_handle> items; // custom id -> handle
};

class IMenuStrategy {
public:
  virtual ~IMenuStrategy() = default;
  virtual std::string_view name() const = 0;
  // nullopt when the strategy leaves the host's default menu in place.
  // Throws SetupError on the first failing host call.
  virtual std::optional<InstalledMenu> install(IHost &host,
                                               const MenuBarSpec &spec) = 0;
};

class NativeTopLevelMenu final : public IMenuStrategy {
public:
  std::string_view name() const override { return "native-top-level"; }
  std::optional<InstalledMenu> install(IHost &host,
                                       const MenuBarSpec &spec) override;
};

class NoOpMenu final : public IMenuStrategy {
public:
  std::string_view name() const override { return "noop"; }
  std::optional<InstalledMenu> install(IHost &host,
                                       const MenuBarSpec &spec) override;
};

// Native only on a macOS host with a top-level menu bar; no-op everywhere
// else, including desktop hosts on other platforms.
std::unique_ptr<IMenuStrategy> select_menu_strategy(const HostInfo &info);

} // namespace deskshell
