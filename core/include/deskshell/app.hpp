#pragma once
#include "app_handle.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "host.hpp"
#include "menu.hpp"
#include "plugin.hpp"
#include "settings.hpp"
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace deskshell {

// Application bootstrap: plugins, command table, main window, menu bar, then
// the host's event loop.
class Application {
public:
  Application(IHost *host, AppConfig config);
  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  void add_plugin(std::unique_ptr<IPlugin> plugin);
  // Replaces default_menu_bar(); must be called before setup().
  void set_menu_spec(MenuBarSpec spec);

  // Throws SetupError on any failure. There is no partial state to recover:
  // the caller is expected to report the error and exit.
  void setup();

  // Runs the host loop. Throws SetupError if setup() has not succeeded.
  int run();

  bool is_set_up() const { return set_up_; }
  bool is_running() const { return running_; }

  AppHandle handle() const { return AppHandle(host_, &config_); }
  const AppConfig &config() const { return config_; }
  CommandRegistry &commands() { return commands_; }
  SettingsService &settings() { return settings_; }
  const std::optional<InstalledMenu> &installed_menu() const { return menu_; }
  std::string_view menu_strategy() const;

private:
  IHost *host_;
  AppConfig config_;
  CommandRegistry commands_;
  SettingsService settings_;
  MenuEventDispatcher dispatcher_;
  std::vector<std::unique_ptr<IPlugin>> plugins_;
  std::optional<MenuBarSpec> menu_spec_;
  std::unique_ptr<IMenuStrategy> strategy_;
  std::optional<InstalledMenu> menu_;
  bool set_up_ = false;
  bool running_ = false;
};

} // namespace deskshell
