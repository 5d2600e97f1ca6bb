#pragma once
#include "app_handle.hpp"
#include "invoke.hpp"
#include "tinyjson.hpp"
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace deskshell {

// Thrown by handlers for malformed arguments; reported as E_BAD_ARGS.
class ArgumentError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using CommandHandler =
    std::function<json::Value(const AppHandle &app, const json::Object &args)>;

// The invocable command surface exposed to the front-end.
class CommandRegistry {
public:
  // False when a command with that name is already registered.
  bool add(const std::string &name, CommandHandler handler);
  bool contains(const std::string &name) const;
  std::vector<std::string> names() const;

  // Never throws: unknown commands, argument errors and handler failures
  // are reported through the response.
  InvokeResponse invoke(const AppHandle &app, const InvokeRequest &req) const;

private:
  std::map<std::string, CommandHandler> handlers_;
};

std::string greet(std::string_view name);

// Required string argument; throws ArgumentError when missing or not a string.
std::string require_str_arg(const json::Object &args, const std::string &key);

// Most recent log lines, oldest first: {"timestamp","level","message"}.
json::Array recent_logs_json(size_t count);

// Registers greet and get_logs. Throws SetupError when either is already
// present.
void register_builtin_commands(CommandRegistry &reg);

} // namespace deskshell
