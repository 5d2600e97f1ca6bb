#include "deskshell/commands.hpp"
#include "deskshell/logger.hpp"
#include <algorithm>

namespace deskshell {

bool CommandRegistry::add(const std::string &name, CommandHandler handler) {
  if (name.empty() || !handler)
    return false;
  return handlers_.emplace(name, std::move(handler)).second;
}

bool CommandRegistry::contains(const std::string &name) const {
  return handlers_.count(name) != 0;
}

std::vector<std::string> CommandRegistry::names() const {
  std::vector<std::string> out;
  for (const auto &[name, _] : handlers_)
    out.push_back(name);
  return out;
}

InvokeResponse CommandRegistry::invoke(const AppHandle &app,
                                       const InvokeRequest &req) const {
  InvokeResponse resp;
  resp.id = req.id;

  auto it = handlers_.find(req.cmd);
  if (it == handlers_.end()) {
    resp.ok = false;
    resp.error_code = std::string(E_BAD_METHOD);
    resp.error_message = "command " + req.cmd + " not found";
    LOG_WARN("Unknown command invoked: " + req.cmd);
    return resp;
  }

  try {
    resp.result = it->second(app, req.args);
    LOG_TRACE("Invoked " + req.cmd);
  } catch (const ArgumentError &e) {
    resp.ok = false;
    resp.error_code = std::string(E_BAD_ARGS);
    resp.error_message = e.what();
    LOG_WARN("Bad arguments for " + req.cmd + ": " + e.what());
  } catch (const std::exception &e) {
    resp.ok = false;
    resp.error_code = std::string(E_COMMAND_FAILED);
    resp.error_message = e.what();
    LOG_ERROR("Command " + req.cmd + " failed: " + e.what());
  }
  return resp;
}

std::string greet(std::string_view name) {
  std::string out = "Hello, ";
  out += name;
  out += "! You've been greeted from Rust!";
  return out;
}

std::string require_str_arg(const json::Object &args, const std::string &key) {
  auto it = args.find(key);
  if (it == args.end())
    throw ArgumentError("missing required key " + key);
  if (!it->second.is_str())
    throw ArgumentError("invalid type for key " + key + ": expected a string");
  return it->second.as_str();
}

json::Array recent_logs_json(size_t count) {
  json::Array arr;
  for (const auto &l : Logger::get().get_recent_logs(count)) {
    json::Object lo;
    lo["timestamp"] = l.timestamp;
    lo["level"] = std::string(log_level_name(l.level));
    lo["message"] = l.message;
    arr.push_back(lo);
  }
  return arr;
}

void register_builtin_commands(CommandRegistry &reg) {
  auto add = [&reg](const std::string &name, CommandHandler h) {
    if (!reg.add(name, std::move(h)))
      throw SetupError("command " + name + " is already registered");
  };

  add("greet", [](const AppHandle &, const json::Object &args) {
    return json::Value(greet(require_str_arg(args, "name")));
  });

  add("get_logs", [](const AppHandle &, const json::Object &args) {
    size_t count = 100;
    auto it = args.find("count");
    if (it != args.end()) {
      if (!it->second.is_num() || it->second.as_num() < 1)
        throw ArgumentError("count must be a positive number");
      count = (size_t)std::min(it->second.as_num(), 100.0);
    }
    return json::Value(recent_logs_json(count));
  });
}

} // namespace deskshell
