#include "doctest/doctest.h"
#include "deskshell/app.hpp"
#include "deskshell/fake_host.hpp"
#include "test_util.hpp"
#include <algorithm>

using namespace deskshell;
using deskshell_test::bare_host;
using deskshell_test::desktop_host;

static AppConfig test_config(const std::string &name) {
  AppConfig cfg;
  cfg.settings_path = deskshell_test::temp_path(name + "/settings.json");
  return cfg;
}

static bool called(const FakeHost &host, const std::string &name) {
  auto calls = host.calls();
  return std::find(calls.begin(), calls.end(), name) != calls.end();
}

DOCTEST_TEST_CASE("desktop host gets the native menu and runs") {
  FakeHost host(desktop_host());
  Application app(&host, test_config("startup-desktop"));
  app.add_plugin(std::make_unique<OpenerPlugin>());
  app.setup();

  DOCTEST_REQUIRE(app.is_set_up());
  DOCTEST_REQUIRE_EQ(app.menu_strategy(), std::string_view("native-top-level"));
  DOCTEST_REQUIRE(app.installed_menu().has_value());
  DOCTEST_REQUIRE(host.window("main").has_value());
  DOCTEST_REQUIRE_EQ(host.window("main")->options.width, 800);
  DOCTEST_REQUIRE_EQ(host.menu_layout().size(), 3u);
  DOCTEST_REQUIRE_EQ(host.menu_layout()[0].rfind("deskshell-app:", 0), 0u);

  for (const char *cmd : {"greet", "get_logs", "get_settings", "update_settings",
                          "swap_colors", "timer_start", "timer_pause", "timer_reset",
                          "plugin:opener|open_url"})
    DOCTEST_REQUIRE(app.commands().contains(cmd));

  DOCTEST_REQUIRE_EQ(app.run(), 0);
  DOCTEST_REQUIRE_EQ(host.run_count(), 1);
  DOCTEST_REQUIRE_FALSE(app.is_running());
}

DOCTEST_TEST_CASE("hosts without the native menu still reach the running state") {
  for (auto info : {bare_host(HostPlatform::LINUX), bare_host(HostPlatform::OTHER),
                    desktop_host(HostPlatform::MOBILE), desktop_host(HostPlatform::WINDOWS),
                    desktop_host(HostPlatform::LINUX)}) {
    std::string platform(platform_name(info.platform));
    DOCTEST_CAPTURE(platform);
    FakeHost host(info);
    Application app(&host, test_config("startup-bare"));
    app.setup();
    DOCTEST_REQUIRE_EQ(app.menu_strategy(), std::string_view("noop"));
    DOCTEST_REQUIRE_FALSE(app.installed_menu().has_value());
    DOCTEST_REQUIRE_FALSE(called(host, "create_menu_bar"));
    DOCTEST_REQUIRE_EQ(app.run(), 0);
    DOCTEST_REQUIRE_EQ(host.run_count(), 1);
  }
}

DOCTEST_TEST_CASE("menu title falls back to the app name") {
  HostInfo info = desktop_host();
  info.package_name.clear();
  FakeHost host(info);
  AppConfig cfg = test_config("startup-title");
  cfg.app_name = "Focus Timer";
  Application app(&host, cfg);
  app.setup();
  DOCTEST_REQUIRE_EQ(host.menu_layout()[0].rfind("Focus Timer:", 0), 0u);
}

DOCTEST_TEST_CASE("menu failure prevents the running state") {
  FakeHost host(desktop_host());
  host.fail_on("create_predefined_item:hide-others");
  Application app(&host, test_config("startup-menu-fail"));
  DOCTEST_REQUIRE_THROWS_AS(app.setup(), SetupError);
  DOCTEST_REQUIRE_FALSE(app.is_set_up());
  DOCTEST_REQUIRE_THROWS_AS(app.run(), SetupError);
  DOCTEST_REQUIRE_EQ(host.run_count(), 0);
  DOCTEST_REQUIRE_FALSE(called(host, "run"));
}

DOCTEST_TEST_CASE("main window failure is a setup error") {
  FakeHost host(desktop_host());
  host.fail_on("create_window:main");
  Application app(&host, test_config("startup-window-fail"));
  DOCTEST_REQUIRE_THROWS_AS(app.setup(), SetupError);
  DOCTEST_REQUIRE_FALSE(called(host, "create_menu_bar"));
  DOCTEST_REQUIRE_THROWS_AS(app.run(), SetupError);
}

DOCTEST_TEST_CASE("duplicate plugins and repeated setup are rejected") {
  FakeHost host(desktop_host());
  Application app(&host, test_config("startup-dup"));
  app.add_plugin(std::make_unique<OpenerPlugin>());
  app.add_plugin(std::make_unique<OpenerPlugin>());
  DOCTEST_REQUIRE_THROWS_AS(app.setup(), SetupError);

  FakeHost host2(desktop_host());
  Application app2(&host2, test_config("startup-twice"));
  app2.setup();
  DOCTEST_REQUIRE_THROWS_AS(app2.setup(), SetupError);
}

DOCTEST_TEST_CASE("host invocations and menu clicks are wired during setup") {
  FakeHost host(desktop_host());
  Application app(&host, test_config("startup-wiring"));
  app.setup();

  InvokeRequest req;
  req.id = "42";
  req.cmd = "greet";
  req.args["name"] = std::string("World");
  auto resp = host.invoke(req);
  DOCTEST_REQUIRE(resp.has_value());
  DOCTEST_REQUIRE(resp->ok);
  DOCTEST_REQUIRE_EQ(resp->id, std::string("42"));
  DOCTEST_REQUIRE_EQ(resp->result.as_str(),
                     std::string("Hello, World! You've been greeted from Rust!"));

  DOCTEST_REQUIRE(host.activate_menu("open_settings"));
  auto events = host.emitted();
  DOCTEST_REQUIRE_EQ(events.size(), 1u);
  DOCTEST_REQUIRE_EQ(events[0].event, std::string("menu:open-settings"));

  DOCTEST_REQUIRE(host.activate_menu("quit"));
  DOCTEST_REQUIRE(host.quit_requested());
  DOCTEST_REQUIRE_EQ(host.emitted().size(), 1u);
}

DOCTEST_TEST_CASE("custom menu spec replaces the default bar") {
  FakeHost host(desktop_host());
  Application app(&host, test_config("startup-custom-menu"));
  MenuBarSpec spec;
  spec.items.push_back({"open_settings", "Preferences", true, "CmdOrCtrl+P"});
  spec.submenus.push_back(
      {"File", {MenuEntry::item("open_settings"), MenuEntry::separator(),
                MenuEntry::system(PredefinedItem::QUIT)}});
  app.set_menu_spec(spec);
  app.setup();

  auto layout = host.menu_layout();
  DOCTEST_REQUIRE_EQ(layout.size(), 1u);
  DOCTEST_REQUIRE_EQ(layout[0], std::string("File: open_settings | - | quit"));
}
