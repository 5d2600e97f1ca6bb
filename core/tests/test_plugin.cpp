#include "doctest/doctest.h"
#include "deskshell/fake_host.hpp"
#include "deskshell/plugin.hpp"
#include "test_util.hpp"

using namespace deskshell;

DOCTEST_TEST_CASE("plugin commands are namespaced") {
  DOCTEST_REQUIRE_EQ(plugin_command_name("opener", "open_url"),
                     std::string("plugin:opener|open_url"));
}

DOCTEST_TEST_CASE("only web and mail links may be opened") {
  for (const char *ok : {"https://example.com", "http://localhost:1420/x?y=1",
                         "HTTPS://EXAMPLE.COM", "mailto:someone@example.com"}) {
    DOCTEST_CAPTURE(ok);
    DOCTEST_REQUIRE(is_openable_url(ok));
  }
  for (const char *bad : {"", "example.com", "file:///etc/passwd",
                          "javascript:alert(1)", "https:", "https:/x",
                          "https://exa mple.com", "mailto:", ":x"}) {
    DOCTEST_CAPTURE(bad);
    DOCTEST_REQUIRE_FALSE(is_openable_url(bad));
  }
}

namespace {

struct OpenerFixture {
  FakeHost host{deskshell_test::desktop_host()};
  AppConfig cfg;
  AppHandle app{&host, &cfg};
  CommandRegistry reg;

  OpenerFixture() {
    OpenerPlugin plugin;
    plugin.init(reg);
  }

  InvokeResponse open(const json::Value &url) {
    InvokeRequest req;
    req.id = "u";
    req.cmd = "plugin:opener|open_url";
    if (!url.is_null())
      req.args["url"] = url;
    return reg.invoke(app, req);
  }
};

} // namespace

DOCTEST_TEST_CASE("open_url hands valid links to the host") {
  OpenerFixture f;
  auto r = f.open(std::string("https://tauri.app"));
  DOCTEST_REQUIRE(r.ok);
  DOCTEST_REQUIRE(r.result.as_bool());
  DOCTEST_REQUIRE_EQ(f.host.opened_urls().size(), 1u);
  DOCTEST_REQUIRE_EQ(f.host.opened_urls()[0], std::string("https://tauri.app"));

  f.host.refuse_urls(true);
  auto refused = f.open(std::string("https://tauri.app"));
  DOCTEST_REQUIRE(refused.ok);
  DOCTEST_REQUIRE_FALSE(refused.result.as_bool());
}

DOCTEST_TEST_CASE("open_url rejects bad arguments without touching the host") {
  OpenerFixture f;
  auto missing = f.open(json::Null{});
  DOCTEST_REQUIRE_FALSE(missing.ok);
  DOCTEST_REQUIRE_EQ(missing.error_code, std::string(E_BAD_ARGS));

  auto scheme = f.open(std::string("file:///etc/passwd"));
  DOCTEST_REQUIRE_FALSE(scheme.ok);
  DOCTEST_REQUIRE_EQ(scheme.error_code, std::string(E_BAD_ARGS));

  auto number = f.open(3.0);
  DOCTEST_REQUIRE_FALSE(number.ok);
  DOCTEST_REQUIRE_EQ(number.error_code, std::string(E_BAD_ARGS));

  DOCTEST_REQUIRE(f.host.opened_urls().empty());
}

DOCTEST_TEST_CASE("opener cannot be initialised twice on one table") {
  CommandRegistry reg;
  OpenerPlugin plugin;
  plugin.init(reg);
  DOCTEST_REQUIRE_THROWS_AS(plugin.init(reg), SetupError);
}
