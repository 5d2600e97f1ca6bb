#include "doctest/doctest.h"
#include "deskshell/app.hpp"
#include "deskshell/console_host.hpp"
#include "test_util.hpp"
#include <sstream>

using namespace deskshell;

static std::vector<json::Object> output_lines(const std::ostringstream &out) {
  std::vector<json::Object> lines;
  std::istringstream in(out.str());
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty())
      lines.push_back(json::parse(line).as_obj());
  }
  return lines;
}

static const json::Object *response(const std::vector<json::Object> &lines,
                                    const std::string &id) {
  for (const auto &l : lines) {
    if (json::get_bool(l, "ok") && json::get_str(l, "id") == id)
      return &l;
  }
  return nullptr;
}

static std::string error_code(const json::Object &resp) {
  return json::get_str(*json::get_obj(resp, "error"), "code").value_or("");
}

DOCTEST_TEST_CASE("console host has no menu bar") {
  std::istringstream in;
  std::ostringstream out;
  ConsoleHost host("deskshell-app", in, out);
  HostInfo info = host.info();
  DOCTEST_REQUIRE(info.menu_bar == MenuBarConvention::NONE);
  DOCTEST_REQUIRE_EQ(info.backend, std::string("console"));
  DOCTEST_REQUIRE_EQ(info.package_name, std::string("deskshell-app"));
  DOCTEST_REQUIRE_FALSE(host.create_menu_bar().has_value());
  DOCTEST_REQUIRE_FALSE(host.create_predefined_item(PredefinedItem::QUIT).has_value());
  DOCTEST_REQUIRE_FALSE(host.set_menu(1));
}

DOCTEST_TEST_CASE("console session serves invocations and menu events") {
  std::istringstream in(
      R"({"id":"1","method":"invoke","params":{"cmd":"greet","args":{"name":"World"}}})"
      "\n"
      R"({"id":"2","method":"menu.activate","params":{"id":"open_settings"}})"
      "\n"
      R"({"id":"3","method":"window.dance","params":{}})"
      "\n"
      "this is not json\n"
      "\n"
      R"({"id":"5","method":"invoke","params":{"cmd":"greet","args":{}}})"
      "\n"
      R"({"id":"6","method":"invoke","params":{"cmd":"launch_rockets"}})"
      "\n"
      R"({"id":"7","method":"quit"})"
      "\n"
      R"({"id":"8","method":"invoke","params":{"cmd":"greet","args":{"name":"late"}}})"
      "\n");
  std::ostringstream out;
  int code = -1;
  {
    ConsoleHost host("deskshell-app", in, out);
    AppConfig cfg;
    cfg.settings_path = deskshell_test::temp_path("console/settings.json");
    Application app(&host, cfg);
    app.setup();
    DOCTEST_REQUIRE_EQ(app.menu_strategy(), std::string_view("noop"));
    code = app.run();
  }
  DOCTEST_REQUIRE_EQ(code, 0);

  auto lines = output_lines(out);
  DOCTEST_REQUIRE_EQ(json::get_str(lines.at(0), "notice").value_or(""),
                     std::string("window.created"));
  DOCTEST_REQUIRE_EQ(json::get_str(lines.at(0), "window").value_or(""),
                     std::string("main"));

  const json::Object *greet = response(lines, "1");
  DOCTEST_REQUIRE(greet != nullptr);
  DOCTEST_REQUIRE(*json::get_bool(*greet, "ok"));
  DOCTEST_REQUIRE_EQ(json::get_str(*greet, "result").value_or(""),
                     std::string("Hello, World! You've been greeted from Rust!"));

  bool saw_event = false;
  for (const auto &l : lines) {
    if (json::get_str(l, "event") == std::string("menu:open-settings")) {
      saw_event = true;
      DOCTEST_REQUIRE_EQ(json::get_str(l, "window").value_or(""), std::string("main"));
      DOCTEST_REQUIRE(l.at("payload").is_null());
    }
  }
  DOCTEST_REQUIRE(saw_event);
  DOCTEST_REQUIRE(response(lines, "2") != nullptr);

  DOCTEST_REQUIRE_EQ(error_code(*response(lines, "3")), std::string("E_BAD_METHOD"));
  DOCTEST_REQUIRE_EQ(error_code(*response(lines, "")), std::string("E_BAD_REQUEST"));
  DOCTEST_REQUIRE_EQ(error_code(*response(lines, "5")), std::string("E_BAD_ARGS"));
  DOCTEST_REQUIRE_EQ(error_code(*response(lines, "6")), std::string("E_BAD_METHOD"));
  DOCTEST_REQUIRE(response(lines, "7") != nullptr);
  // Nothing is handled after quit.
  DOCTEST_REQUIRE(response(lines, "8") == nullptr);
}

DOCTEST_TEST_CASE("closing the last window ends the session") {
  std::istringstream in(
      R"({"id":"1","method":"window.close","params":{"label":"settings"}})"
      "\n"
      R"({"id":"2","method":"window.close","params":{"label":"settings"}})"
      "\n"
      R"({"id":"3","method":"window.close","params":{"label":"main"}})"
      "\n"
      R"({"id":"4","method":"quit"})"
      "\n");
  std::ostringstream out;
  {
    ConsoleHost host("deskshell-app", in, out);
    WindowOptions main_opts;
    main_opts.label = "main";
    WindowOptions settings_opts;
    settings_opts.label = "settings";
    DOCTEST_REQUIRE(host.create_window(main_opts).has_value());
    DOCTEST_REQUIRE(host.create_window(settings_opts).has_value());
    DOCTEST_REQUIRE_FALSE(host.create_window(settings_opts).has_value());
    DOCTEST_REQUIRE_EQ(host.run(), 0);
    DOCTEST_REQUIRE_FALSE(host.find_window("main").has_value());
  }

  auto lines = output_lines(out);
  DOCTEST_REQUIRE(response(lines, "1")->at("result").as_bool());
  DOCTEST_REQUIRE_FALSE(response(lines, "2")->at("result").as_bool());
  DOCTEST_REQUIRE(response(lines, "3")->at("result").as_bool());
  DOCTEST_REQUIRE(response(lines, "4") == nullptr);
}

DOCTEST_TEST_CASE("end of input ends the session") {
  std::istringstream in;
  std::ostringstream out;
  ConsoleHost host("deskshell-app", in, out);
  DOCTEST_REQUIRE_EQ(host.run(), 0);
}

DOCTEST_TEST_CASE("emitted events are written and delivered to listeners") {
  std::istringstream in;
  std::ostringstream out;
  ConsoleHost host("deskshell-app", in, out);
  WindowOptions o;
  o.label = "main";
  auto w = host.create_window(o);
  DOCTEST_REQUIRE(w.has_value());

  std::string got;
  host.listen("main", "timer:start", [&got](const json::Value &p) {
    got = p.is_str() ? p.as_str() : "?";
  });
  DOCTEST_REQUIRE(host.emit(*w, "timer:start", std::string("go")));
  DOCTEST_REQUIRE_EQ(got, std::string("go"));
  DOCTEST_REQUIRE_FALSE(host.emit(*w + 100, "timer:start", json::Null{}));

  DOCTEST_REQUIRE(host.set_window_title(*w, "Deskshell - 04:59"));
  DOCTEST_REQUIRE(host.open_external("https://tauri.app"));

  auto lines = output_lines(out);
  DOCTEST_REQUIRE_EQ(lines.size(), 4u);
  DOCTEST_REQUIRE_EQ(json::dumps(lines[1]),
                     std::string(R"({"event":"timer:start","payload":"go","window":"main"})"));
  DOCTEST_REQUIRE_EQ(json::get_str(lines[2], "title").value_or(""),
                     std::string("Deskshell - 04:59"));
  DOCTEST_REQUIRE_EQ(json::get_str(lines[3], "url").value_or(""),
                     std::string("https://tauri.app"));
}

DOCTEST_TEST_CASE("deeply nested requests are refused and the session continues") {
  std::string nested = R"({"id":"1","method":"invoke","params":{"cmd":"greet","args":{"name":)" +
                       std::string(200000, '[') + "}}}\n";
  std::istringstream in(
      nested +
      R"({"id":"2","method":"invoke","params":{"cmd":"greet","args":"World"}})"
      "\n"
      R"({"id":"3","method":"invoke","params":{"cmd":"greet","args":{"name":"World"}}})"
      "\n"
      R"({"id":"4","method":"quit"})"
      "\n");
  std::ostringstream out;
  int code = -1;
  {
    ConsoleHost host("deskshell-app", in, out);
    AppConfig cfg;
    cfg.settings_path = deskshell_test::temp_path("console-nested/settings.json");
    Application app(&host, cfg);
    app.setup();
    code = app.run();
  }
  DOCTEST_REQUIRE_EQ(code, 0);

  auto lines = output_lines(out);
  const json::Object *refused = response(lines, "");
  DOCTEST_REQUIRE(refused != nullptr);
  DOCTEST_REQUIRE_EQ(error_code(*refused), std::string("E_BAD_REQUEST"));
  std::string message =
      json::get_str(*json::get_obj(*refused, "error"), "message").value_or("");
  DOCTEST_CAPTURE(message);
  DOCTEST_REQUIRE(message.find("nesting too deep") != std::string::npos);

  DOCTEST_REQUIRE_EQ(error_code(*response(lines, "2")), std::string("E_BAD_REQUEST"));
  DOCTEST_REQUIRE_EQ(json::get_str(*response(lines, "3"), "result").value_or(""),
                     std::string("Hello, World! You've been greeted from Rust!"));
  DOCTEST_REQUIRE(response(lines, "4") != nullptr);
}
