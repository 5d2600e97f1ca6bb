#include "doctest/doctest.h"
#include "deskshell/dispatcher.hpp"
#include "deskshell/fake_host.hpp"
#include "test_util.hpp"

using namespace deskshell;

namespace {

struct Fixture {
  FakeHost host{deskshell_test::desktop_host()};
  AppConfig cfg;
  MenuEventDispatcher dispatcher{AppHandle(&host, &cfg)};

  void open_main() {
    WindowOptions o;
    o.label = "main";
    o.title = "Deskshell";
    DOCTEST_REQUIRE(host.create_window(o).has_value());
  }
};

const std::vector<std::string> PREDEFINED_IDS = {
    "services", "hide",  "hide-others", "show-all",  "quit",
    "undo",     "redo",  "cut",         "copy",      "paste",
    "select-all", "minimize", "close-window"};

} // namespace

DOCTEST_TEST_CASE("menu identifiers map to actions") {
  DOCTEST_REQUIRE(parse_menu_action("open_settings") == MenuAction::OPEN_SETTINGS);
  DOCTEST_REQUIRE(parse_menu_action("Open_Settings") == MenuAction::OTHER);
  DOCTEST_REQUIRE(parse_menu_action("") == MenuAction::OTHER);
  for (const auto &id : PREDEFINED_IDS)
    DOCTEST_REQUIRE(parse_menu_action(id) == MenuAction::OTHER);
}

DOCTEST_TEST_CASE("open_settings emits exactly one event to the main window") {
  Fixture f;
  f.open_main();
  DOCTEST_REQUIRE(f.dispatcher.dispatch("open_settings"));

  auto events = f.host.emitted();
  DOCTEST_REQUIRE_EQ(events.size(), 1u);
  DOCTEST_REQUIRE_EQ(events[0].window, std::string("main"));
  DOCTEST_REQUIRE_EQ(events[0].event, std::string("menu:open-settings"));
  DOCTEST_REQUIRE(events[0].payload.is_null());
}

DOCTEST_TEST_CASE("every other identifier is ignored") {
  Fixture f;
  f.open_main();
  for (const auto &id : PREDEFINED_IDS) {
    DOCTEST_CAPTURE(id);
    DOCTEST_REQUIRE_FALSE(f.dispatcher.dispatch(id));
  }
  DOCTEST_REQUIRE_FALSE(f.dispatcher.dispatch("something_else"));
  DOCTEST_REQUIRE(f.host.emitted().empty());
}

DOCTEST_TEST_CASE("missing main window is a silent no-op") {
  Fixture f;
  DOCTEST_REQUIRE_NOTHROW(f.dispatcher.dispatch("open_settings"));
  DOCTEST_REQUIRE_FALSE(f.dispatcher.dispatch("open_settings"));
  DOCTEST_REQUIRE(f.host.emitted().empty());

  f.open_main();
  DOCTEST_REQUIRE(f.host.close_window("main"));
  DOCTEST_REQUIRE_FALSE(f.dispatcher.dispatch("open_settings"));
  DOCTEST_REQUIRE(f.host.emitted().empty());
}

DOCTEST_TEST_CASE("events reach only the main window's listeners") {
  Fixture f;
  f.open_main();
  WindowOptions other;
  other.label = "settings";
  DOCTEST_REQUIRE(f.host.create_window(other).has_value());

  int main_hits = 0, other_hits = 0;
  f.host.listen("main", "menu:open-settings",
                [&main_hits](const json::Value &) { main_hits++; });
  f.host.listen("settings", "menu:open-settings",
                [&other_hits](const json::Value &) { other_hits++; });

  DOCTEST_REQUIRE(f.dispatcher.dispatch("open_settings"));
  DOCTEST_REQUIRE(f.dispatcher.dispatch("open_settings"));
  DOCTEST_REQUIRE_EQ(main_hits, 2);
  DOCTEST_REQUIRE_EQ(other_hits, 0);
}
