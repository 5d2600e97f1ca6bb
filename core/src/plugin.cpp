#include "deskshell/plugin.hpp"
#include "deskshell/logger.hpp"
#include <algorithm>
#include <cctype>

namespace deskshell {

std::string plugin_command_name(std::string_view plugin, std::string_view cmd) {
  std::string out = "plugin:";
  out += plugin;
  out += "|";
  out += cmd;
  return out;
}

bool is_openable_url(std::string_view url) {
  auto colon = url.find(':');
  if (colon == std::string_view::npos || colon == 0)
    return false;
  std::string scheme(url.substr(0, colon));
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  std::string_view rest = url.substr(colon + 1);
  if (scheme == "mailto")
    return !rest.empty();
  if (scheme != "http" && scheme != "https")
    return false;
  // scheme://host...
  if (rest.size() < 3 || rest.substr(0, 2) != "//")
    return false;
  return std::none_of(url.begin(), url.end(), [](unsigned char c) {
    return std::iscntrl(c) || c == ' ';
  });
}

void OpenerPlugin::init(CommandRegistry &reg) {
  auto cmd = plugin_command_name(name(), "open_url");
  bool ok = reg.add(cmd, [](const AppHandle &app, const json::Object &args) {
    std::string url = require_str_arg(args, "url");
    if (!is_openable_url(url))
      throw ArgumentError("refusing to open '" + url + "'");
    bool opened = app.host().open_external(url);
    if (!opened)
      LOG_WARN("Host could not open " + url);
    return json::Value(opened);
  });
  if (!ok)
    throw SetupError("command " + cmd + " is already registered");
}

} // namespace deskshell
