#include "doctest/doctest.h"
#include "deskshell/commands.hpp"
#include "deskshell/fake_host.hpp"
#include "test_util.hpp"

using namespace deskshell;

DOCTEST_TEST_CASE("greet substitutes the name verbatim") {
  DOCTEST_REQUIRE_EQ(greet("World"),
                     std::string("Hello, World! You've been greeted from Rust!"));
  DOCTEST_REQUIRE_EQ(greet(""),
                     std::string("Hello, ! You've been greeted from Rust!"));
  DOCTEST_REQUIRE_EQ(greet("  Ada "),
                     std::string("Hello,   Ada ! You've been greeted from Rust!"));
  DOCTEST_REQUIRE_EQ(greet("J\xC3\xBCrgen"),
                     std::string("Hello, J\xC3\xBCrgen! You've been greeted from Rust!"));
}

DOCTEST_TEST_CASE("greet is invocable through the command table") {
  FakeHost host(deskshell_test::desktop_host());
  AppConfig cfg;
  AppHandle app(&host, &cfg);
  CommandRegistry reg;
  register_builtin_commands(reg);
  DOCTEST_REQUIRE(reg.contains("greet"));

  InvokeRequest req;
  req.id = "1";
  req.cmd = "greet";
  req.args["name"] = std::string("World");
  auto resp = reg.invoke(app, req);
  DOCTEST_REQUIRE(resp.ok);
  DOCTEST_REQUIRE_EQ(resp.id, std::string("1"));
  DOCTEST_REQUIRE(resp.result.is_str());
  DOCTEST_REQUIRE_EQ(resp.result.as_str(),
                     std::string("Hello, World! You've been greeted from Rust!"));
}

DOCTEST_TEST_CASE("greet argument errors are reported, not thrown") {
  FakeHost host(deskshell_test::desktop_host());
  AppConfig cfg;
  AppHandle app(&host, &cfg);
  CommandRegistry reg;
  register_builtin_commands(reg);

  InvokeRequest missing;
  missing.id = "2";
  missing.cmd = "greet";
  auto r1 = reg.invoke(app, missing);
  DOCTEST_REQUIRE_FALSE(r1.ok);
  DOCTEST_REQUIRE_EQ(r1.error_code, std::string(E_BAD_ARGS));

  InvokeRequest wrong_type = missing;
  wrong_type.args["name"] = 42.0;
  auto r2 = reg.invoke(app, wrong_type);
  DOCTEST_REQUIRE_FALSE(r2.ok);
  DOCTEST_REQUIRE_EQ(r2.error_code, std::string(E_BAD_ARGS));
}

DOCTEST_TEST_CASE("command table reports unknown commands and handler failures") {
  FakeHost host(deskshell_test::desktop_host());
  AppConfig cfg;
  AppHandle app(&host, &cfg);
  CommandRegistry reg;
  DOCTEST_REQUIRE(reg.add("boom", [](const AppHandle &, const json::Object &) -> json::Value {
    throw std::runtime_error("kaput");
  }));
  DOCTEST_REQUIRE_FALSE(reg.add("boom", [](const AppHandle &, const json::Object &) {
    return json::Value(true);
  }));

  InvokeRequest req;
  req.id = "3";
  req.cmd = "nope";
  auto r1 = reg.invoke(app, req);
  DOCTEST_REQUIRE_FALSE(r1.ok);
  DOCTEST_REQUIRE_EQ(r1.error_code, std::string(E_BAD_METHOD));

  req.cmd = "boom";
  auto r2 = reg.invoke(app, req);
  DOCTEST_REQUIRE_FALSE(r2.ok);
  DOCTEST_REQUIRE_EQ(r2.error_code, std::string(E_COMMAND_FAILED));
  DOCTEST_REQUIRE_EQ(r2.error_message, std::string("kaput"));
}

DOCTEST_TEST_CASE("registering the builtin commands twice is a setup error") {
  CommandRegistry reg;
  register_builtin_commands(reg);
  DOCTEST_REQUIRE_THROWS_AS(register_builtin_commands(reg), SetupError);
}

DOCTEST_TEST_CASE("invoke requests parse and responses serialize") {
  auto params = json::parse(R"({"cmd":"greet","args":{"name":"x"}})").as_obj();
  auto req = parse_invoke_params("7", params);
  DOCTEST_REQUIRE_EQ(req.id, std::string("7"));
  DOCTEST_REQUIRE_EQ(req.cmd, std::string("greet"));
  DOCTEST_REQUIRE_EQ(req.args.at("name").as_str(), std::string("x"));

  auto no_args = parse_invoke_params("8", json::parse(R"({"cmd":"get_settings"})").as_obj());
  DOCTEST_REQUIRE(no_args.args.empty());

  DOCTEST_REQUIRE_THROWS(parse_invoke_params("9", json::Object{}));
  DOCTEST_REQUIRE_THROWS(
      parse_invoke_params("9", json::parse(R"({"cmd":3})").as_obj()));
  DOCTEST_REQUIRE_THROWS(
      parse_invoke_params("9", json::parse(R"({"cmd":"x","args":3})").as_obj()));

  InvokeResponse ok;
  ok.id = "1";
  ok.result = std::string("hi");
  DOCTEST_REQUIRE_EQ(serialize_response_json(ok),
                     std::string(R"({"id":"1","ok":true,"result":"hi"})"));

  InvokeResponse err;
  err.id = "2";
  err.ok = false;
  err.error_code = std::string(E_BAD_ARGS);
  err.error_message = "m";
  DOCTEST_REQUIRE_EQ(
      serialize_response_json(err),
      std::string(R"({"error":{"code":"E_BAD_ARGS","message":"m"},"id":"2","ok":false})"));
}

DOCTEST_TEST_CASE("tinyjson decodes surrogate pairs and prints integers plainly") {
  auto v = json::parse("\"\\ud83d\\ude00\"");
  DOCTEST_REQUIRE_EQ(v.as_str(), std::string("\xF0\x9F\x98\x80"));
  DOCTEST_REQUIRE_THROWS_AS(json::parse("\"\\ud83d\""), json::ParseError);
  DOCTEST_REQUIRE_THROWS_AS(json::parse("{\"a\":1"), json::ParseError);

  DOCTEST_REQUIRE_EQ(json::dumps(json::Value(5.0)), std::string("5"));
  DOCTEST_REQUIRE_EQ(json::dumps(json::Value(0.5)), std::string("0.5"));
  DOCTEST_REQUIRE_EQ(json::dumps(json::Value(std::string("a\"b\n"))),
                     std::string("\"a\\\"b\\n\""));
}

DOCTEST_TEST_CASE("tinyjson limits nesting depth") {
  std::string deepest = std::string(json::MAX_PARSE_DEPTH, '[') +
                        std::string(json::MAX_PARSE_DEPTH, ']');
  DOCTEST_REQUIRE(json::parse(deepest).is_arr());

  std::string too_deep = "[" + deepest + "]";
  DOCTEST_REQUIRE_THROWS_AS(json::parse(too_deep), json::ParseError);
  std::string objects;
  for (size_t i = 0; i <= json::MAX_PARSE_DEPTH; i++)
    objects += "{\"a\":";
  DOCTEST_REQUIRE_THROWS_AS(json::parse(objects), json::ParseError);
}
